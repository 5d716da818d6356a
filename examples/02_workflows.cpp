// 02_workflows.cpp
//
// Demonstrates the workflow engine and retry handling on the message bus.
//
// Two workflows run over the same five agents:
//   - sequential: design -> implement -> test, each step sees the previous
//     step's result.
//   - escalation: the lowest-authority agent reports "failed", so the
//     workflow climbs the role hierarchy until someone resolves it.
// Finally a message to a flaky agent is retried with exponential backoff
// and ends up in the dead letter queue.

#include <agenthub/agenthub.hpp>

#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

using namespace agenthub;
using namespace std::chrono_literals;

static void wait_until_finished(MessageBus& bus, const WorkflowId& id) {
    for (int i = 0; i < 200; ++i) {
        auto wf = bus.get_workflow(id);
        if (!wf.has_value() || !wf->is_active()) {
            return;
        }
        std::this_thread::sleep_for(10ms);
    }
}

static void print_workflow(MessageBus& bus, const WorkflowId& id) {
    auto wf = bus.get_workflow(id);
    if (!wf.has_value()) {
        std::cout << "  " << id << ": unknown\n";
        return;
    }
    std::cout << "  " << id << " [" << to_string(wf->pattern) << "] -> "
              << to_string(wf->status) << " after " << wf->current_step << "/"
              << wf->total_steps << " steps\n";
    for (const auto& [agent, result] : wf->results) {
        std::cout << "    " << agent << ": " << to_json_string(result) << "\n";
    }
    for (const auto& error : wf->errors) {
        std::cout << "    error: " << error << "\n";
    }
}

int main() {
    std::cout << "=== AgentHub: Workflows Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Short backoff so the retry demo finishes quickly.
    // ----------------------------------------------------------------
    Config config;
    config.bus.retry_backoff_base = 50ms;
    Hub hub(config);

    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(metrics);
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    hub.set_monitor(composite);

    auto& bus = hub.bus();

    // ----------------------------------------------------------------
    // 2. Agent handlers. code_engineer cannot decide escalations.
    // ----------------------------------------------------------------
    auto worker = [](const AgentId& id) {
        return make_handler([id](const Message& m) -> std::optional<Message> {
            Value payload(Json::objectValue);
            payload["by"] = id;
            payload["step"] = m.payload["step"];
            if (m.payload["pattern"].asString() == "escalation" && id == "code_engineer") {
                payload["status"] = "failed";
                payload["reason"] = "needs sign-off";
            }
            return m.reply(payload);
        });
    };

    std::vector<AgentId> team = {"product_architect", "code_engineer", "test_agent",
                                 "audit_agent", "intent_router"};
    for (const auto& id : team) {
        bus.register_handler(id, worker(id));
    }

    std::atomic<int> flaky_calls{0};
    bus.register_handler("flaky_agent", make_handler([&flaky_calls](const Message&) -> std::optional<Message> {
        ++flaky_calls;
        throw std::runtime_error("upstream API unavailable");
    }));

    hub.start();

    // ----------------------------------------------------------------
    // 3. Sequential workflow.
    // ----------------------------------------------------------------
    Value context(Json::objectValue);
    context["feature"] = "limit orders";
    bus.start_workflow("feature-42", WorkflowPattern::Sequential,
                       {"product_architect", "code_engineer", "test_agent"}, context);
    wait_until_finished(bus, "feature-42");

    // ----------------------------------------------------------------
    // 4. Escalation workflow: participants are reordered lowest
    //    authority first.
    // ----------------------------------------------------------------
    bus.start_workflow("incident-7", WorkflowPattern::Escalation,
                       {"audit_agent", "code_engineer"});
    wait_until_finished(bus, "incident-7");

    std::cout << "\n=== Workflows ===\n";
    print_workflow(bus, "feature-42");
    print_workflow(bus, "incident-7");

    // ----------------------------------------------------------------
    // 5. Retries and dead letters.
    // ----------------------------------------------------------------
    auto msg = Message::create("intent_router", "flaky_agent", MessageType::Request, "fetch_prices");
    msg.max_retries = 2;
    auto pending = bus.request(msg);

    try {
        pending.get();
    } catch (const DeadLetteredException& e) {
        std::cout << "\n" << e.what() << "\n";
    }

    std::cout << "flaky_agent was called " << flaky_calls.load() << " times\n";
    for (const auto& letter : bus.dead_letters()) {
        std::cout << "  dead letter " << letter.message.id << " (" << letter.message.action
                  << "): " << letter.reason << "\n";
    }

    // ----------------------------------------------------------------
    // 6. Metrics and shutdown.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\n=== Metrics ===\n"
              << "  sent:          " << m.messages_sent << "\n"
              << "  delivered:     " << m.messages_delivered << "\n"
              << "  retried:       " << m.messages_retried << "\n"
              << "  dead-lettered: " << m.messages_dead_lettered << "\n"
              << "  escalations:   " << m.escalations << "\n";

    hub.stop();

    std::cout << "\n=== Done ===\n";
    return 0;
}
