// 03_shared_state.cpp
//
// Demonstrates the distributed state store.
//
// Several agents share one deployment configuration:
//   - writes are versioned; AgentPriority keeps a lower-ranked agent from
//     overwriting the security agent's decision.
//   - Merge combines partial updates from two agents.
//   - a checkpoint is taken, a bad rollout is applied in a transaction,
//     and the checkpoint restores the earlier state.
//   - two threads race on an exclusive lease; only one holds it at a time.

#include <agenthub/agenthub.hpp>

#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

using namespace agenthub;
using namespace std::chrono_literals;

static void show(StateManager& state, const std::string& key, StateScope scope) {
    auto entry = state.get_entry(key, scope, ConsistencyLevel::Strong);
    if (!entry.has_value()) {
        std::cout << "  " << to_string(scope) << ":" << key << " = <absent>\n";
        return;
    }
    std::cout << "  " << to_string(scope) << ":" << key << " = " << to_json_string(entry->value)
              << " (v" << entry->version << ", owner " << entry->owner << ")\n";
}

int main() {
    std::cout << "=== AgentHub: Shared State Example ===\n\n";

    Hub hub;
    auto metrics = std::make_shared<MetricsMonitor>();
    hub.set_monitor(metrics);
    auto& state = hub.state();

    // ----------------------------------------------------------------
    // 1. Priority-guarded writes.
    // ----------------------------------------------------------------
    SetOptions guarded;
    guarded.strategy = ConflictStrategy::AgentPriority;

    Value policy(Json::objectValue);
    policy["max_slippage"] = 0.5;
    state.set("risk_policy", policy, StateScope::Global, "security_validator", guarded);

    Value loose(Json::objectValue);
    loose["max_slippage"] = 3.0;
    auto status = state.set("risk_policy", loose, StateScope::Global, "code_engineer", guarded);

    std::cout << "--- code_engineer tries to loosen the risk policy ---\n";
    std::cout << "  write " << to_string(status) << "\n";
    show(state, "risk_policy", StateScope::Global);

    // ----------------------------------------------------------------
    // 2. Merged partial updates.
    // ----------------------------------------------------------------
    SetOptions merged;
    merged.strategy = ConflictStrategy::Merge;

    Value sizing(Json::objectValue);
    sizing["replicas"] = 3;
    state.set("deployment", sizing, StateScope::Workflow, "product_architect", merged);

    Value region(Json::objectValue);
    region["region"] = "eu-west";
    state.set("deployment", region, StateScope::Workflow, "code_engineer", merged);

    std::cout << "\n--- Two agents merge into one entry ---\n";
    show(state, "deployment", StateScope::Workflow);

    // ----------------------------------------------------------------
    // 3. Checkpoint, bad rollout in a transaction, restore.
    // ----------------------------------------------------------------
    std::size_t captured = state.create_checkpoint("pre_rollout", StateScope::Workflow);
    std::cout << "\n--- Checkpoint pre_rollout captured " << captured << " entries ---\n";

    auto& tx = hub.transactions();
    auto rollout = tx.begin("intent_router", {});
    Value broken(Json::objectValue);
    broken["replicas"] = 0;
    tx.add_operation(rollout, OperationType::Set, "deployment", StateScope::Workflow,
                     broken, "code_engineer");
    tx.add_operation(rollout, OperationType::Set, "rollout_started", StateScope::Workflow,
                     Value(true), "code_engineer");
    std::cout << "  rollout transaction " << to_string(tx.commit(rollout)) << "\n";
    show(state, "deployment", StateScope::Workflow);

    try {
        state.restore_checkpoint("pre_rollout", StateScope::Workflow);
        std::cout << "  restored pre_rollout\n";
    } catch (const TransactionAbortedException& e) {
        std::cout << "  restore aborted: " << e.what() << "\n";
    }
    show(state, "deployment", StateScope::Workflow);
    show(state, "rollout_started", StateScope::Workflow);

    // ----------------------------------------------------------------
    // 4. Two agents racing for an exclusive lease.
    // ----------------------------------------------------------------
    std::cout << "\n--- Lease contention ---\n";
    auto& locks = hub.locks();
    const std::string resource = LockManager::resource_key(StateScope::Global, "treasury");

    std::atomic<int> granted{0};
    std::atomic<int> denied{0};
    std::vector<std::thread> threads;
    for (const AgentId owner : {"audit_agent", "code_engineer"}) {
        threads.emplace_back([&, owner]() {
            for (int i = 0; i < 50; ++i) {
                if (locks.acquire(resource, LockType::Exclusive, owner, 2s) == LockStatus::Granted) {
                    ++granted;
                    std::this_thread::sleep_for(100us);
                    locks.release(resource, owner);
                } else {
                    ++denied;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    std::cout << "  granted " << granted.load() << ", denied " << denied.load() << "\n";

    // ----------------------------------------------------------------
    // 5. Metrics.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\n=== Metrics ===\n"
              << "  locks granted:          " << m.locks_granted << "\n"
              << "  locks denied:           " << m.locks_denied << "\n"
              << "  transactions committed: " << m.transactions_committed << "\n"
              << "  transactions aborted:   " << m.transactions_aborted << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
