#include <gtest/gtest.h>
#include <agenthub/agenthub.hpp>

#include <functional>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace agenthub;
using namespace std::chrono_literals;

// ===========================================================================
// Test Monitor that records all events for verification
// ===========================================================================

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }

    void on_snapshot(const SystemSnapshot&) override {}

    std::size_t count_of(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) {
                ++n;
            }
        }
        return n;
    }

private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events;
};

// ===========================================================================
// Fixture
// ===========================================================================

class WorkflowTest : public ::testing::Test {
protected:
    using Behavior = std::function<Value(const Message&)>;

    void SetUp() override {
        priorities.load_default_roles();
        bus = std::make_unique<MessageBus>(store, priorities);
        monitor = std::make_shared<TestMonitor>();
        bus->set_monitor(monitor);
    }

    void TearDown() override {
        bus->stop();
    }

    void add_agent(const AgentId& id, Behavior behavior = nullptr) {
        bus->register_handler(id, make_handler([this, id, behavior](const Message& m) -> std::optional<Message> {
            {
                std::lock_guard<std::mutex> lock(mutex);
                calls.push_back(id);
                received.push_back(m);
            }
            Value payload(Json::objectValue);
            if (behavior) {
                payload = behavior(m);
            } else {
                payload["by"] = id;
            }
            return m.reply(payload);
        }));
    }

    static Value throws(const Message&) {
        throw std::runtime_error("agent crashed");
    }

    static Value reports_failed(const Message&) {
        Value payload(Json::objectValue);
        payload["status"] = "failed";
        return payload;
    }

    // Delivers until the queue is empty, jumping far enough ahead for retries
    void drain() {
        auto t = Clock::now();
        for (int i = 0; i < 20 && bus->queue_size() > 0; ++i) {
            bus->process_ready(t);
            t += 1h;
        }
    }

    WorkflowStatus status_of(const WorkflowId& id) {
        auto wf = bus->get_workflow(id);
        EXPECT_TRUE(wf.has_value());
        return wf ? wf->status : WorkflowStatus::Active;
    }

    MemoryStore store;
    PriorityModel priorities;
    std::unique_ptr<MessageBus> bus;
    std::shared_ptr<TestMonitor> monitor;

    std::mutex mutex;
    std::vector<AgentId> calls;
    std::vector<Message> received;
};

// ===========================================================================
// Start validation
// ===========================================================================

TEST_F(WorkflowTest, StartValidatesInput) {
    add_agent("a");
    EXPECT_FALSE(bus->start_workflow("", WorkflowPattern::Sequential, {"a"}));
    EXPECT_FALSE(bus->start_workflow("wf", WorkflowPattern::Sequential, {}));
    EXPECT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a"}));
    EXPECT_FALSE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a"}));
    EXPECT_EQ(bus->active_workflow_count(), 1u);
}

TEST_F(WorkflowTest, StepMessageCarriesWorkflowContext) {
    add_agent("a");
    Value context(Json::objectValue);
    context["ticket"] = "T-1";
    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a"}, context));
    drain();

    ASSERT_EQ(received.size(), 1u);
    const auto& step = received[0];
    EXPECT_EQ(step.from, "workflow_engine");
    EXPECT_EQ(step.type, MessageType::Coordination);
    EXPECT_EQ(step.action, "workflow_step");
    EXPECT_EQ(step.priority, MessagePriority::High);
    EXPECT_EQ(step.correlation_id.value(), "wf");
    EXPECT_EQ(step.payload["workflow_id"].asString(), "wf");
    EXPECT_EQ(step.payload["step"].asUInt64(), 0u);
    EXPECT_EQ(step.payload["total_steps"].asUInt64(), 1u);
    EXPECT_EQ(step.payload["context"]["ticket"].asString(), "T-1");
}

// ===========================================================================
// Sequential
// ===========================================================================

TEST_F(WorkflowTest, SequentialRunsParticipantsInOrder) {
    add_agent("a");
    add_agent("b");
    add_agent("c");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a", "b", "c"}));
    EXPECT_EQ(bus->queue_size(), 1u);
    drain();

    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0], "a");
    EXPECT_EQ(calls[1], "b");
    EXPECT_EQ(calls[2], "c");
    EXPECT_EQ(received[1].payload["previous_result"]["by"].asString(), "a");

    auto wf = bus->get_workflow("wf");
    ASSERT_TRUE(wf.has_value());
    EXPECT_EQ(wf->status, WorkflowStatus::Completed);
    EXPECT_EQ(wf->current_step, 3u);
    EXPECT_EQ(wf->results.size(), 3u);
    EXPECT_EQ(bus->active_workflow_count(), 0u);
    EXPECT_EQ(monitor->count_of(EventType::WorkflowCompleted), 1u);
    EXPECT_EQ(monitor->count_of(EventType::WorkflowAdvanced), 2u);
}

TEST_F(WorkflowTest, SequentialStopsOnFailure) {
    add_agent("a");
    add_agent("b", throws);
    add_agent("c");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a", "b", "c"}));
    drain();

    EXPECT_EQ(status_of("wf"), WorkflowStatus::Failed);
    for (const auto& agent : calls) {
        EXPECT_NE(agent, "c");
    }
    auto wf = bus->get_workflow("wf");
    ASSERT_FALSE(wf->errors.empty());
    EXPECT_EQ(bus->dead_letter_count(), 1u);
    EXPECT_EQ(monitor->count_of(EventType::WorkflowFailed), 1u);
}

// ===========================================================================
// Parallel
// ===========================================================================

TEST_F(WorkflowTest, ParallelDispatchesAllAtOnce) {
    add_agent("a");
    add_agent("b");
    add_agent("c");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Parallel, {"a", "b", "c"}));
    EXPECT_EQ(bus->queue_size(), 3u);

    drain();
    auto wf = bus->get_workflow("wf");
    EXPECT_EQ(wf->status, WorkflowStatus::Completed);
    EXPECT_EQ(wf->results.size(), 3u);
    EXPECT_FALSE(received[1].payload.isMember("previous_result"));
}

TEST_F(WorkflowTest, ParallelWaitsForAllThenFails) {
    add_agent("a");
    add_agent("b", throws);
    add_agent("c");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Parallel, {"a", "b", "c"}));
    drain();

    auto wf = bus->get_workflow("wf");
    EXPECT_EQ(wf->status, WorkflowStatus::Failed);
    EXPECT_EQ(wf->results.size(), 2u);
    EXPECT_EQ(wf->errors.size(), 1u);
}

TEST_F(WorkflowTest, ParallelStepForUnknownAgentCountsAsFailure) {
    add_agent("a");
    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Parallel, {"a", "ghost"}));
    drain();
    EXPECT_EQ(status_of("wf"), WorkflowStatus::Failed);
}

// ===========================================================================
// Iterative
// ===========================================================================

TEST_F(WorkflowTest, IterativeRunsUntilBudgetExhausted) {
    add_agent("drafter");
    add_agent("reviewer");

    Value context(Json::objectValue);
    context["max_iterations"] = 2;
    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Iterative, {"drafter", "reviewer"}, context));
    drain();

    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[2], "drafter");
    EXPECT_EQ(received[2].payload["iteration"].asUInt64(), 1u);
    EXPECT_EQ(received[2].payload["previous_result"]["by"].asString(), "reviewer");

    auto wf = bus->get_workflow("wf");
    EXPECT_EQ(wf->status, WorkflowStatus::Completed);
    EXPECT_EQ(wf->total_steps, 4u);
    EXPECT_TRUE(wf->context["budget_exhausted"].asBool());
}

TEST_F(WorkflowTest, IterativeStopsWhenParticipantReportsDone) {
    add_agent("drafter");
    add_agent("reviewer", [](const Message&) {
        Value payload(Json::objectValue);
        payload["done"] = true;
        return payload;
    });

    Value context(Json::objectValue);
    context["max_iterations"] = 5;
    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Iterative, {"drafter", "reviewer"}, context));
    drain();

    EXPECT_EQ(calls.size(), 2u);
    auto wf = bus->get_workflow("wf");
    EXPECT_EQ(wf->status, WorkflowStatus::Completed);
    EXPECT_FALSE(wf->context.isMember("budget_exhausted"));
}

TEST_F(WorkflowTest, IterativeUsesDefaultBudget) {
    add_agent("solo");
    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Iterative, {"solo"}));
    drain();
    EXPECT_EQ(calls.size(), 3u);
}

// ===========================================================================
// Escalation
// ===========================================================================

TEST_F(WorkflowTest, EscalationClimbsTowardsHigherAuthority) {
    add_agent("code_engineer", reports_failed);
    add_agent("audit_agent");
    add_agent("security_validator");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Escalation,
                                    {"security_validator", "code_engineer", "audit_agent"}));
    drain();

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "code_engineer");
    EXPECT_EQ(calls[1], "audit_agent");

    auto wf = bus->get_workflow("wf");
    EXPECT_EQ(wf->status, WorkflowStatus::Completed);
    EXPECT_EQ(wf->participants.front(), "code_engineer");
    EXPECT_EQ(wf->participants.back(), "security_validator");
}

TEST_F(WorkflowTest, EscalationSkipsThrowingAndUnknownAgents) {
    add_agent("code_engineer", throws);
    add_agent("security_validator");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Escalation,
                                    {"security_validator", "code_engineer", "audit_agent"}));
    drain();

    EXPECT_EQ(status_of("wf"), WorkflowStatus::Completed);
    EXPECT_EQ(calls.back(), "security_validator");
    EXPECT_EQ(bus->get_workflow("wf")->errors.size(), 2u);
}

TEST_F(WorkflowTest, ExhaustedEscalationGoesToHumanOversight) {
    add_agent("code_engineer", reports_failed);
    add_agent("audit_agent", reports_failed);
    add_agent(HUMAN_OVERSIGHT);

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Escalation, {"audit_agent", "code_engineer"}));
    drain();

    EXPECT_EQ(status_of("wf"), WorkflowStatus::Escalated);
    EXPECT_EQ(monitor->count_of(EventType::WorkflowEscalated), 1u);
    EXPECT_EQ(monitor->count_of(EventType::EscalatedToHuman), 1u);

    ASSERT_EQ(calls.back(), HUMAN_OVERSIGHT);
    const auto& escalation = received.back();
    EXPECT_EQ(escalation.type, MessageType::Escalation);
    EXPECT_EQ(escalation.action, "workflow_escalation");
    EXPECT_EQ(escalation.payload["workflow_id"].asString(), "wf");
    EXPECT_EQ(escalation.payload["status"].asString(), "escalated");
}

// ===========================================================================
// Cancellation, health and expiry
// ===========================================================================

TEST_F(WorkflowTest, CancelIgnoresLateResults) {
    add_agent("a");
    add_agent("b");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a", "b"}));
    EXPECT_TRUE(bus->cancel_workflow("wf"));
    EXPECT_FALSE(bus->cancel_workflow("wf"));
    drain();

    EXPECT_EQ(status_of("wf"), WorkflowStatus::Cancelled);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], "a");
    EXPECT_EQ(monitor->count_of(EventType::WorkflowCancelled), 1u);
    EXPECT_FALSE(bus->cancel_workflow("unknown"));
}

TEST_F(WorkflowTest, StuckWorkflowTriggersRecoveryOnce) {
    add_agent("a");
    add_agent("intent_router");

    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a"}));
    auto now = Clock::now();

    EXPECT_EQ(bus->check_workflow_health(now + 10min), 0u);
    EXPECT_EQ(bus->check_workflow_health(now + 31min), 1u);
    EXPECT_EQ(bus->check_workflow_health(now + 62min), 0u);
    EXPECT_EQ(monitor->count_of(EventType::WorkflowStuck), 1u);

    drain();
    bool recovered = false;
    for (const auto& m : received) {
        if (m.action == "workflow_recovery") {
            recovered = true;
            EXPECT_EQ(m.to, "intent_router");
            EXPECT_EQ(m.type, MessageType::Event);
            EXPECT_EQ(m.payload["workflow_id"].asString(), "wf");
            EXPECT_EQ(m.payload["participating_agents"][0].asString(), "a");
        }
    }
    EXPECT_TRUE(recovered);
}

TEST_F(WorkflowTest, FinishedWorkflowIsNeverStuck) {
    add_agent("a");
    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a"}));
    drain();
    EXPECT_EQ(bus->check_workflow_health(Clock::now() + 2h), 0u);
}

TEST_F(WorkflowTest, WorkflowsExpireAfterTtl) {
    add_agent("a");
    ASSERT_TRUE(bus->start_workflow("wf", WorkflowPattern::Sequential, {"a"}));

    EXPECT_EQ(bus->expire_workflows(Clock::now() + 1h), 0u);
    EXPECT_EQ(bus->expire_workflows(Clock::now() + 25h), 1u);
    EXPECT_FALSE(bus->get_workflow("wf").has_value());
    EXPECT_EQ(monitor->count_of(EventType::WorkflowExpired), 1u);
}
