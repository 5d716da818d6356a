#include <gtest/gtest.h>
#include <agenthub/agenthub.hpp>

#include <mutex>
#include <thread>
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

namespace agenthub {

// Reaches into the local cache to simulate in-memory corruption
class StateManagerInspector {
public:
    static void tamper(StateManager& manager, const std::string& store_key) {
        std::lock_guard<std::mutex> lock(manager.cache_mutex_);
        auto it = manager.cache_.find(store_key);
        if (it != manager.cache_.end()) {
            it->second.value = Value("tampered");
        }
    }

    static bool cached(StateManager& manager, const std::string& store_key) {
        std::lock_guard<std::mutex> lock(manager.cache_mutex_);
        return manager.cache_.count(store_key) > 0;
    }
};

} // namespace agenthub

// ===========================================================================
// Fixture
// ===========================================================================

class StateManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        priorities.load_default_roles();
        locks = std::make_unique<LockManager>(store);
        transactions = std::make_unique<TransactionCoordinator>(store, *locks);
        state = std::make_unique<StateManager>(store, *locks, *transactions, priorities);
        monitor = std::make_shared<TestMonitor>();
        state->set_monitor(monitor);
    }

    void TearDown() override {
        state.reset();
        transactions.reset();
        locks.reset();
    }

    SetOptions with_strategy(ConflictStrategy strategy) {
        SetOptions options;
        options.strategy = strategy;
        return options;
    }

    MemoryStore store;
    PriorityModel priorities;
    std::unique_ptr<LockManager> locks;
    std::unique_ptr<TransactionCoordinator> transactions;
    std::unique_ptr<StateManager> state;
    std::shared_ptr<TestMonitor> monitor;
};

// ===========================================================================
// Basic reads and writes
// ===========================================================================

TEST_F(StateManagerTest, SetThenGet) {
    ASSERT_EQ(state->set("mode", Value("fast"), StateScope::Global, "code_engineer"),
              WriteStatus::Applied);

    auto value = state->get("mode", StateScope::Global);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->asString(), "fast");
    EXPECT_TRUE(store.get("state:global:mode").has_value());
}

TEST_F(StateManagerTest, EveryWriteBumpsVersionByOne) {
    for (int i = 1; i <= 3; ++i) {
        ASSERT_EQ(state->set("counter", Value(i), StateScope::Global, "a"), WriteStatus::Applied);
        auto entry = state->get_entry("counter", StateScope::Global, ConsistencyLevel::Strong);
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->version, static_cast<std::uint64_t>(i));
        EXPECT_TRUE(entry->checksum_valid());
    }
    EXPECT_EQ(monitor->count_of(EventType::StateUpdated), 3u);
}

TEST_F(StateManagerTest, ScopesAreIsolated) {
    state->set("k", Value("global"), StateScope::Global, "a");
    state->set("k", Value("workflow"), StateScope::Workflow, "a");

    EXPECT_EQ(state->get("k", StateScope::Global)->asString(), "global");
    EXPECT_EQ(state->get("k", StateScope::Workflow)->asString(), "workflow");
    EXPECT_FALSE(state->get("k", StateScope::Agent).has_value());
}

TEST_F(StateManagerTest, EntryExpiresAfterTtl) {
    SetOptions options;
    options.ttl = 20ms;
    state->set("temp", Value(1), StateScope::Global, "a", options);
    EXPECT_TRUE(state->get("temp", StateScope::Global).has_value());

    std::this_thread::sleep_for(40ms);
    EXPECT_FALSE(state->get("temp", StateScope::Global).has_value());
}

TEST_F(StateManagerTest, ListKeysStripsPrefix) {
    state->set("b", Value(2), StateScope::Global, "a");
    state->set("a", Value(1), StateScope::Global, "a");
    state->set("x", Value(1), StateScope::Agent, "a");

    auto keys = state->list_keys(StateScope::Global);
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "a");
    EXPECT_EQ(keys[1], "b");
}

TEST_F(StateManagerTest, EmptyKeyOrOwnerThrows) {
    EXPECT_THROW(state->set("", Value(1), StateScope::Global, "a"), ValidationException);
    EXPECT_THROW(state->set("k", Value(1), StateScope::Global, ""), ValidationException);
    EXPECT_THROW(state->erase("", StateScope::Global, "a"), ValidationException);
}

// ===========================================================================
// Strong consistency
// ===========================================================================

TEST_F(StateManagerTest, StrongWriteIsContendedWhileLocked) {
    ASSERT_EQ(locks->acquire("global:k", LockType::Exclusive, "other"), LockStatus::Granted);

    SetOptions options;
    options.consistency = ConsistencyLevel::Strong;
    EXPECT_EQ(state->set("k", Value(1), StateScope::Global, "a", options), WriteStatus::Contended);
    EXPECT_FALSE(store.get("state:global:k").has_value());
    EXPECT_EQ(monitor->count_of(EventType::StateWriteRejected), 1u);
}

TEST_F(StateManagerTest, StrongWriteReleasesItsLease) {
    SetOptions options;
    options.consistency = ConsistencyLevel::Strong;
    ASSERT_EQ(state->set("k", Value(1), StateScope::Global, "a", options), WriteStatus::Applied);
    EXPECT_FALSE(locks->is_locked("global:k"));
    EXPECT_FALSE(StateManagerInspector::cached(*state, "state:global:k"));
}

TEST_F(StateManagerTest, StrongReadThrowsWhileWriterHoldsLock) {
    state->set("k", Value(1), StateScope::Global, "a");
    ASSERT_EQ(locks->acquire("global:k", LockType::Exclusive, "writer"), LockStatus::Granted);

    EXPECT_THROW(state->get("k", StateScope::Global, ConsistencyLevel::Strong),
                 LockContentionException);
    // Eventual reads are served regardless
    EXPECT_EQ(state->get("k", StateScope::Global)->asInt(), 1);
}

TEST_F(StateManagerTest, StrongWriteKeepsWritersOwnExclusiveLease) {
    ASSERT_EQ(locks->acquire("global:k", LockType::Exclusive, "agent_a", 60s), LockStatus::Granted);

    SetOptions options;
    options.consistency = ConsistencyLevel::Strong;
    EXPECT_EQ(state->set("k", Value(1), StateScope::Global, "agent_a", options), WriteStatus::Applied);
    EXPECT_EQ(state->get("k", StateScope::Global)->asInt(), 1);

    EXPECT_TRUE(locks->is_held_by("global:k", "agent_a"));
    EXPECT_EQ(locks->acquire("global:k", LockType::Exclusive, "agent_b"), LockStatus::Denied);
}

TEST_F(StateManagerTest, EraseKeepsOwnersExclusiveLease) {
    state->set("k", Value(1), StateScope::Global, "agent_a");
    ASSERT_EQ(locks->acquire("global:k", LockType::Exclusive, "agent_a", 60s), LockStatus::Granted);

    EXPECT_EQ(state->erase("k", StateScope::Global, "agent_a"), DeleteStatus::Deleted);
    EXPECT_TRUE(locks->is_held_by("global:k", "agent_a"));
    EXPECT_EQ(locks->acquire("global:k", LockType::Shared, "agent_b"), LockStatus::Denied);
}

TEST_F(StateManagerTest, StrongWriteUpgradesThenRestoresSharedLease) {
    ASSERT_EQ(locks->acquire("global:k", LockType::Shared, "agent_a", 60s), LockStatus::Granted);

    SetOptions options;
    options.consistency = ConsistencyLevel::Strong;
    EXPECT_EQ(state->set("k", Value(1), StateScope::Global, "agent_a", options), WriteStatus::Applied);

    auto held = locks->holders("global:k");
    ASSERT_EQ(held.size(), 1u);
    EXPECT_EQ(held[0].owner, "agent_a");
    EXPECT_EQ(held[0].type, LockType::Shared);
    EXPECT_EQ(locks->acquire("global:k", LockType::Shared, "agent_b"), LockStatus::Granted);
}

TEST_F(StateManagerTest, StrongWriteIsContendedWhenSharedWithOthers) {
    ASSERT_EQ(locks->acquire("global:k", LockType::Shared, "agent_a", 60s), LockStatus::Granted);
    ASSERT_EQ(locks->acquire("global:k", LockType::Shared, "agent_b", 60s), LockStatus::Granted);

    SetOptions options;
    options.consistency = ConsistencyLevel::Strong;
    EXPECT_EQ(state->set("k", Value(1), StateScope::Global, "agent_a", options), WriteStatus::Contended);
    EXPECT_TRUE(locks->is_held_by("global:k", "agent_a"));
    EXPECT_TRUE(locks->is_held_by("global:k", "agent_b"));
}

// ===========================================================================
// Conflict strategies
// ===========================================================================

TEST_F(StateManagerTest, AgentPriorityKeepsHigherRankedValue) {
    auto options = with_strategy(ConflictStrategy::AgentPriority);
    ASSERT_EQ(state->set("policy", Value("strict"), StateScope::Global, "security_validator", options),
              WriteStatus::Applied);
    EXPECT_EQ(state->set("policy", Value("lax"), StateScope::Global, "code_engineer", options),
              WriteStatus::Rejected);

    auto entry = state->get_entry("policy", StateScope::Global, ConsistencyLevel::Strong);
    EXPECT_EQ(entry->value.asString(), "strict");
    EXPECT_EQ(entry->owner, "security_validator");
    EXPECT_EQ(entry->version, 1u);
}

TEST_F(StateManagerTest, AgentPriorityAcceptsHigherRankedOverwrite) {
    auto options = with_strategy(ConflictStrategy::AgentPriority);
    state->set("policy", Value("lax"), StateScope::Global, "code_engineer", options);
    ASSERT_EQ(state->set("policy", Value("strict"), StateScope::Global, "security_validator", options),
              WriteStatus::Applied);

    auto entry = state->get_entry("policy", StateScope::Global, ConsistencyLevel::Strong);
    EXPECT_EQ(entry->value.asString(), "strict");
    EXPECT_EQ(entry->owner, "security_validator");
    EXPECT_EQ(entry->version, 2u);
}

TEST_F(StateManagerTest, HumanInterventionRejectsAndEscalates) {
    auto options = with_strategy(ConflictStrategy::HumanIntervention);
    state->set("k", Value(1), StateScope::Global, "a", options);
    EXPECT_EQ(state->set("k", Value(2), StateScope::Global, "b", options), WriteStatus::Rejected);
    EXPECT_EQ(monitor->count_of(EventType::EscalatedToHuman), 1u);
}

TEST_F(StateManagerTest, MergeCombinesObjects) {
    auto options = with_strategy(ConflictStrategy::Merge);
    Value first(Json::objectValue);
    first["theme"] = "dark";
    Value second(Json::objectValue);
    second["lang"] = "en";

    state->set("prefs", first, StateScope::User, "a", options);
    state->set("prefs", second, StateScope::User, "b", options);

    auto value = state->get("prefs", StateScope::User, ConsistencyLevel::Strong);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["theme"].asString(), "dark");
    EXPECT_EQ((*value)["lang"].asString(), "en");
}

// ===========================================================================
// Deletes
// ===========================================================================

TEST_F(StateManagerTest, EraseRemovesEntry) {
    state->set("k", Value(1), StateScope::Global, "a");
    EXPECT_EQ(state->erase("k", StateScope::Global, "a"), DeleteStatus::Deleted);
    EXPECT_FALSE(state->get("k", StateScope::Global).has_value());
    EXPECT_EQ(state->erase("k", StateScope::Global, "a"), DeleteStatus::NotFound);
    EXPECT_EQ(monitor->count_of(EventType::StateDeleted), 1u);
}

TEST_F(StateManagerTest, EraseIsContendedWhileLocked) {
    state->set("k", Value(1), StateScope::Global, "a");
    ASSERT_EQ(locks->acquire("global:k", LockType::Exclusive, "other"), LockStatus::Granted);
    EXPECT_EQ(state->erase("k", StateScope::Global, "a"), DeleteStatus::Contended);
    EXPECT_TRUE(store.get("state:global:k").has_value());
}

// ===========================================================================
// Cache coherence
// ===========================================================================

TEST_F(StateManagerTest, PeerWriteInvalidatesCacheAfterSync) {
    LockManager peer_locks(store);
    TransactionCoordinator peer_transactions(store, peer_locks);
    StateManager peer(store, peer_locks, peer_transactions, priorities);

    state->set("k", Value("v1"), StateScope::Global, "a");
    state->sync_pending_changes();
    ASSERT_TRUE(StateManagerInspector::cached(*state, "state:global:k"));

    peer.set("k", Value("v2"), StateScope::Global, "b");

    // Eventual read may be stale until notifications are applied
    EXPECT_EQ(state->get("k", StateScope::Global)->asString(), "v1");

    state->sync_pending_changes();
    EXPECT_EQ(state->get("k", StateScope::Global)->asString(), "v2");
    EXPECT_GE(monitor->count_of(EventType::CacheInvalidated), 1u);
}

TEST_F(StateManagerTest, CorruptCacheEntryIsRepairedOnRead) {
    state->set("k", Value("good"), StateScope::Global, "a");
    StateManagerInspector::tamper(*state, "state:global:k");

    EXPECT_EQ(state->get("k", StateScope::Global)->asString(), "good");
    EXPECT_EQ(monitor->count_of(EventType::ConsistencyViolation), 1u);
    EXPECT_EQ(monitor->count_of(EventType::ConsistencyRepaired), 1u);
}

TEST_F(StateManagerTest, VerifyConsistencyRepairsCache) {
    state->set("k1", Value(1), StateScope::Global, "a");
    state->set("k2", Value(2), StateScope::Global, "a");
    StateManagerInspector::tamper(*state, "state:global:k1");

    EXPECT_EQ(state->verify_consistency(), 1u);
    EXPECT_EQ(state->verify_consistency(), 0u);
    EXPECT_EQ(state->get("k1", StateScope::Global)->asInt(), 1);
}

TEST_F(StateManagerTest, ChangeListenersFilterByPrefixAndScope) {
    std::vector<StateChange> seen;
    auto id = state->subscribe_to_changes("user.", StateScope::Global,
        [&](const StateChange& change) { seen.push_back(change); });

    state->set("user.name", Value("ada"), StateScope::Global, "a");
    state->set("system.mode", Value("x"), StateScope::Global, "a");
    state->set("user.name", Value("ada"), StateScope::Workflow, "a");
    state->erase("user.name", StateScope::Global, "a");

    EXPECT_EQ(state->sync_pending_changes(), 4u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].operation, "updated");
    EXPECT_EQ(seen[0].version, 1u);
    EXPECT_EQ(seen[1].operation, "deleted");

    EXPECT_TRUE(state->unsubscribe_from_changes(id));
    state->set("user.age", Value(3), StateScope::Global, "a");
    state->sync_pending_changes();
    EXPECT_EQ(seen.size(), 2u);
}

// ===========================================================================
// Checkpoints
// ===========================================================================

TEST_F(StateManagerTest, CheckpointRestoresScope) {
    state->set("a", Value(1), StateScope::Global, "x");
    state->set("b", Value(2), StateScope::Global, "x");
    state->set("other", Value(9), StateScope::Agent, "x");

    EXPECT_EQ(state->create_checkpoint("before", StateScope::Global), 2u);
    EXPECT_TRUE(store.get("checkpoint:global:before").has_value());

    state->set("a", Value(100), StateScope::Global, "x");
    state->set("c", Value(3), StateScope::Global, "x");
    state->erase("b", StateScope::Global, "x");

    ASSERT_TRUE(state->restore_checkpoint("before", StateScope::Global));
    EXPECT_EQ(state->get("a", StateScope::Global)->asInt(), 1);
    EXPECT_EQ(state->get("b", StateScope::Global)->asInt(), 2);
    EXPECT_FALSE(state->get("c", StateScope::Global).has_value());
    EXPECT_EQ(state->get("other", StateScope::Agent)->asInt(), 9);
    EXPECT_EQ(monitor->count_of(EventType::CheckpointRestored), 1u);
}

TEST_F(StateManagerTest, UnknownCheckpointIsNotRestored) {
    EXPECT_FALSE(state->restore_checkpoint("missing", StateScope::Global));
}

TEST_F(StateManagerTest, AbortedRestoreLeavesStateUntouched) {
    state->set("a", Value(1), StateScope::Global, "x");
    state->create_checkpoint("cp", StateScope::Global);
    state->set("a", Value(2), StateScope::Global, "x");

    ASSERT_EQ(locks->acquire("global:a", LockType::Exclusive, "intruder"), LockStatus::Granted);
    EXPECT_THROW(state->restore_checkpoint("cp", StateScope::Global), TransactionAbortedException);

    locks->release("global:a", "intruder");
    EXPECT_EQ(state->get("a", StateScope::Global, ConsistencyLevel::Strong)->asInt(), 2);
}

TEST_F(StateManagerTest, ListCheckpoints) {
    state->create_checkpoint("one", StateScope::Global);
    state->create_checkpoint("two", StateScope::Global);
    state->create_checkpoint("three", StateScope::Workflow);

    auto names = state->list_checkpoints(StateScope::Global);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "one");
    EXPECT_EQ(names[1], "two");
    EXPECT_THROW(state->create_checkpoint("", StateScope::Global), ValidationException);
}

// ===========================================================================
// Transactions
// ===========================================================================

TEST_F(StateManagerTest, TransactionWritesAllOrNothing) {
    auto tx = transactions->begin("intent_router", {"code_engineer"});
    transactions->add_operation(tx, OperationType::Set, "x", StateScope::Global, Value(1), "code_engineer");
    transactions->add_operation(tx, OperationType::Set, "y", StateScope::Global, Value(2), "code_engineer");

    ASSERT_EQ(transactions->commit(tx), TransactionStatus::Committed);
    EXPECT_EQ(state->get("x", StateScope::Global)->asInt(), 1);
    EXPECT_EQ(state->get("y", StateScope::Global)->asInt(), 2);
    EXPECT_FALSE(locks->is_locked("global:x"));
}

TEST_F(StateManagerTest, TransactionDeleteRemovesEntry) {
    state->set("x", Value(1), StateScope::Global, "a");
    auto tx = transactions->begin("intent_router", {});
    transactions->add_operation(tx, OperationType::Delete, "x", StateScope::Global, Value(), "a");

    ASSERT_EQ(transactions->commit(tx), TransactionStatus::Committed);
    EXPECT_FALSE(state->get("x", StateScope::Global).has_value());
}
