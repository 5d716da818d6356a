// 01_basic_routing.cpp
//
// Minimal AgentHub example: three agents, keyword routing, coordination.
//
// Scenario:
//   - A trading agent, a security agent and a productivity agent register
//     with the router, each with a handler that answers "process_request".
//   - A request that only mentions trading goes to the trading agent.
//   - A request that mentions trading and risk is coordinated across both
//     matching agents; the router reports consensus and confidence.
//   - A request nobody can serve raises RoutingException.

#include <agenthub/agenthub.hpp>

#include <iostream>
#include <string>

using namespace agenthub;
using namespace std::chrono_literals;

// Builds a handler that answers with a canned recommendation.
static std::shared_ptr<MessageHandler> answering(const std::string& agent,
                                                 const std::string& answer) {
    return make_handler([agent, answer](const Message& m) -> std::optional<Message> {
        Value payload(Json::objectValue);
        payload["status"] = "success";
        payload["agent"] = agent;
        payload["answer"] = answer;
        payload["request"] = m.payload["content"];
        return m.reply(payload);
    });
}

static void print_response(const Response& r) {
    std::cout << "  agent:  " << r.agent_id << "\n"
              << "  status: " << r.status << "\n"
              << "  result: " << to_json_string(r.result) << "\n";
    if (r.agent_id == Router::COORDINATED) {
        std::cout << "  consensus: " << (r.metadata["consensus_reached"].asBool() ? "yes" : "no")
                  << "  confidence: " << r.metadata["confidence_score"].asDouble() << "\n";
    }
    std::cout << "  took " << r.execution_time_ms << " ms\n\n";
}

int main() {
    std::cout << "=== AgentHub: Basic Routing Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the hub with default configuration.
    // ----------------------------------------------------------------
    Config config;
    config.router.coordination_timeout = 5s;
    Hub hub(config);

    // Attach a console monitor so we can see what happens internally.
    hub.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    // ----------------------------------------------------------------
    // 2. Register three agents. Roles come from the stock hierarchy
    //    when the agent id is one of the well-known names.
    // ----------------------------------------------------------------
    AgentDescriptor trader;
    trader.id = "code_engineer";
    trader.type = "defi";
    trader.capabilities = {"financial", "wallet"};
    hub.router().register_agent(trader, answering(trader.id, "route the swap through pool A"));

    AgentDescriptor guard;
    guard.id = "security_validator";
    guard.type = "risk";
    guard.capabilities = {"security"};
    hub.router().register_agent(guard, answering(guard.id, "pool A passed the audit"));

    AgentDescriptor planner;
    planner.id = "research_agent";
    planner.type = "assistant";
    planner.capabilities = {"productivity"};
    hub.router().register_agent(planner, answering(planner.id, "added to your calendar"));

    std::cout << "Registered " << hub.router().agent_count() << " agents.\n\n";

    // ----------------------------------------------------------------
    // 3. Start the hub (delivery, maintenance and snapshot loops).
    // ----------------------------------------------------------------
    hub.start();

    // ----------------------------------------------------------------
    // 4. Route requests.
    // ----------------------------------------------------------------
    std::cout << "--- Single agent: \"swap 5 ETH for USDC\" ---\n";
    print_response(hub.router().route(Request::create("alice", "swap 5 ETH for USDC")));

    std::cout << "--- Coordinated: \"is this swap safe?\" ---\n";
    print_response(hub.router().route(
        Request::create("alice", "is this swap safe?", MessagePriority::High)));

    std::cout << "--- Explicit capability tag ---\n";
    Value context(Json::objectValue);
    context["capabilities"].append("productivity");
    print_response(hub.router().route(
        Request::create("alice", "remind me tomorrow", MessagePriority::Low, context)));

    // ----------------------------------------------------------------
    // 5. A request while every matching agent is unavailable.
    // ----------------------------------------------------------------
    hub.router().heartbeat("code_engineer", 0.95);
    std::cout << "--- code_engineer reports load 0.95 ---\n";
    try {
        hub.router().route(Request::create("alice", "swap again"));
    } catch (const RoutingException& e) {
        std::cout << "  RoutingException: " << e.what() << "\n\n";
    }

    // ----------------------------------------------------------------
    // 6. Per-agent metrics.
    // ----------------------------------------------------------------
    std::cout << "=== Agent Metrics ===\n";
    for (const auto& m : hub.router().metrics()) {
        std::cout << "  " << m.agent_id << " [" << to_string(m.role) << "] "
                  << m.requests_processed << " requests, success rate "
                  << m.success_rate << ", avg " << m.average_response_time_ms << " ms\n";
    }

    // ----------------------------------------------------------------
    // 7. Stop the hub.
    // ----------------------------------------------------------------
    hub.stop();

    std::cout << "\n=== Done ===\n";
    return 0;
}
