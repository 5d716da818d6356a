#include <gtest/gtest.h>
#include <agenthub/agenthub.hpp>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

using namespace agenthub;
using namespace std::chrono_literals;

// ===========================================================================
// Concurrent stress test: 8 agents contending for one exclusive lease
// ===========================================================================

TEST(ConcurrentStateTest, ExclusiveLeaseNeverOverlaps_8Agents) {
    constexpr int NUM_AGENTS = 8;
    constexpr int OPS_PER_AGENT = 25;

    MemoryStore store;
    LockManager locks(store);
    const std::string key = LockManager::resource_key(StateScope::Global, "ledger");

    std::atomic<int> inside{0};
    std::atomic<int> overlaps{0};
    std::atomic<int> grants{0};
    std::atomic<int> denials{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_AGENTS; ++i) {
        threads.emplace_back([&, i]() {
            AgentId owner = "agent-" + std::to_string(i);
            std::mt19937 rng(static_cast<unsigned>(i * 31 + 5));
            std::uniform_int_distribution<int> pause(0, 2);

            for (int op = 0; op < OPS_PER_AGENT; ++op) {
                if (locks.acquire(key, LockType::Exclusive, owner, 5s) != LockStatus::Granted) {
                    denials.fetch_add(1);
                    std::this_thread::sleep_for(std::chrono::milliseconds(pause(rng)));
                    continue;
                }
                grants.fetch_add(1);
                if (inside.fetch_add(1) != 0) {
                    overlaps.fetch_add(1);
                }
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                inside.fetch_sub(1);
                EXPECT_TRUE(locks.release(key, owner));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(overlaps.load(), 0);
    EXPECT_GT(grants.load(), 0);
    EXPECT_EQ(grants.load() + denials.load(), NUM_AGENTS * OPS_PER_AGENT);
    EXPECT_FALSE(locks.is_locked(key));
}

// ===========================================================================
// Racing writers: every applied write bumps the version exactly once
// ===========================================================================

TEST(ConcurrentStateTest, VersionCountsAppliedWrites) {
    constexpr int NUM_WRITERS = 4;
    constexpr int WRITES_EACH = 25;

    MemoryStore store;
    PriorityModel priorities;
    priorities.load_default_roles();
    LockManager locks(store);
    TransactionCoordinator transactions(store, locks);
    StateManager state(store, locks, transactions, priorities);

    std::atomic<int> applied{0};
    std::atomic<int> contended{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_WRITERS; ++i) {
        threads.emplace_back([&, i]() {
            AgentId owner = "writer-" + std::to_string(i);
            for (int n = 0; n < WRITES_EACH; ++n) {
                Value value(Json::objectValue);
                value["writer"] = owner;
                value["n"] = n;
                auto status = state.set("counter", value, StateScope::Global, owner);
                if (status == WriteStatus::Applied) {
                    applied.fetch_add(1);
                } else if (status == WriteStatus::Contended) {
                    contended.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(applied.load() + contended.load(), NUM_WRITERS * WRITES_EACH);

    auto entry = state.get_entry("counter", StateScope::Global, ConsistencyLevel::Strong);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->version, static_cast<std::uint64_t>(applied.load()));
    EXPECT_TRUE(entry->checksum_valid());
}

// ===========================================================================
// Two lock managers sharing a store act as two processes
// ===========================================================================

TEST(ConcurrentStateTest, StrongWriteContendsAcrossManagers) {
    MemoryStore store;
    PriorityModel priorities;
    priorities.load_default_roles();

    LockManager locks_a(store);
    TransactionCoordinator tx_a(store, locks_a);
    StateManager state_a(store, locks_a, tx_a, priorities);

    LockManager locks_b(store);
    TransactionCoordinator tx_b(store, locks_b);
    StateManager state_b(store, locks_b, tx_b, priorities);

    auto resource = LockManager::resource_key(StateScope::Global, "config");
    ASSERT_EQ(locks_a.acquire(resource, LockType::Exclusive, "holder", 10s), LockStatus::Granted);

    SetOptions strong;
    strong.consistency = ConsistencyLevel::Strong;
    EXPECT_EQ(state_b.set("config", Value(1), StateScope::Global, "intruder", strong),
              WriteStatus::Contended);

    ASSERT_TRUE(locks_a.release(resource, "holder"));
    EXPECT_EQ(state_b.set("config", Value(1), StateScope::Global, "intruder", strong),
              WriteStatus::Applied);
    EXPECT_EQ(state_a.get("config", StateScope::Global, ConsistencyLevel::Strong)->asInt(), 1);
}
