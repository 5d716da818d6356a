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

// ===========================================================================
// Fixture
// ===========================================================================

class LockManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        locks = std::make_unique<LockManager>(store);
        monitor = std::make_shared<TestMonitor>();
        locks->set_monitor(monitor);
    }

    MemoryStore store;
    std::unique_ptr<LockManager> locks;
    std::shared_ptr<TestMonitor> monitor;
};

// ===========================================================================
// Exclusive locks
// ===========================================================================

TEST_F(LockManagerTest, ExclusiveLockIsGrantedOnce) {
    EXPECT_EQ(locks->acquire("global:k", LockType::Exclusive, "a"), LockStatus::Granted);
    EXPECT_EQ(locks->acquire("global:k", LockType::Exclusive, "b"), LockStatus::Denied);
    EXPECT_TRUE(locks->is_locked("global:k"));
    EXPECT_TRUE(locks->is_held_by("global:k", "a"));
    EXPECT_FALSE(locks->is_held_by("global:k", "b"));

    EXPECT_EQ(monitor->count_of(EventType::LockAcquired), 1u);
    EXPECT_EQ(monitor->count_of(EventType::LockDenied), 1u);
}

TEST_F(LockManagerTest, LockRecordLivesUnderLockNamespace) {
    auto key = LockManager::resource_key(StateScope::Global, "config");
    EXPECT_EQ(key, "global:config");
    EXPECT_EQ(LockManager::store_key(key), "lock:global:config");

    ASSERT_EQ(locks->acquire(key, LockType::Exclusive, "a", 30s), LockStatus::Granted);
    EXPECT_TRUE(store.get("lock:global:config").has_value());

    auto ttl = store.ttl("lock:global:config");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_LE(*ttl, 30s);
}

TEST_F(LockManagerTest, ExclusiveExcludesShared) {
    ASSERT_EQ(locks->acquire("k", LockType::Exclusive, "a"), LockStatus::Granted);
    EXPECT_EQ(locks->acquire("k", LockType::Shared, "b"), LockStatus::Denied);
}

TEST_F(LockManagerTest, EmptyKeyOrOwnerThrows) {
    EXPECT_THROW(locks->acquire("", LockType::Exclusive, "a"), ValidationException);
    EXPECT_THROW(locks->acquire("k", LockType::Exclusive, ""), ValidationException);
}

// ===========================================================================
// Shared and intent locks
// ===========================================================================

TEST_F(LockManagerTest, SharedHoldersCoexist) {
    EXPECT_EQ(locks->acquire("k", LockType::Shared, "a"), LockStatus::Granted);
    EXPECT_EQ(locks->acquire("k", LockType::Shared, "b"), LockStatus::Granted);
    EXPECT_EQ(locks->holders("k").size(), 2u);
    EXPECT_EQ(locks->acquire("k", LockType::Exclusive, "c"), LockStatus::Denied);
}

TEST_F(LockManagerTest, IntentCoexistsWithSharedButBlocksNewShared) {
    ASSERT_EQ(locks->acquire("k", LockType::Shared, "reader"), LockStatus::Granted);
    EXPECT_EQ(locks->acquire("k", LockType::Intent, "writer"), LockStatus::Granted);

    EXPECT_EQ(locks->acquire("k", LockType::Shared, "late_reader"), LockStatus::Denied);
    EXPECT_EQ(locks->acquire("k", LockType::Intent, "other_writer"), LockStatus::Denied);
}

TEST_F(LockManagerTest, IntentOwnerUpgradesOnceReadersLeave) {
    ASSERT_EQ(locks->acquire("k", LockType::Shared, "reader"), LockStatus::Granted);
    ASSERT_EQ(locks->acquire("k", LockType::Intent, "writer"), LockStatus::Granted);

    EXPECT_EQ(locks->acquire("k", LockType::Exclusive, "writer"), LockStatus::Denied);

    ASSERT_TRUE(locks->release("k", "reader"));
    EXPECT_EQ(locks->acquire("k", LockType::Exclusive, "writer"), LockStatus::Granted);

    auto info = locks->inspect("k");
    ASSERT_TRUE(info.has_value());
    ASSERT_EQ(info->holders.size(), 1u);
    EXPECT_EQ(info->holders[0].type, LockType::Exclusive);
    EXPECT_TRUE(info->has_exclusive());
}

// ===========================================================================
// Release and renew
// ===========================================================================

TEST_F(LockManagerTest, OnlyOwnerCanRelease) {
    ASSERT_EQ(locks->acquire("k", LockType::Exclusive, "a"), LockStatus::Granted);
    EXPECT_FALSE(locks->release("k", "b"));
    EXPECT_TRUE(locks->release("k", "a"));
    EXPECT_FALSE(locks->is_locked("k"));
    EXPECT_FALSE(store.get("lock:k").has_value());
    EXPECT_EQ(monitor->count_of(EventType::LockReleased), 1u);
}

TEST_F(LockManagerTest, ReleaseOfUnknownLockReturnsFalse) {
    EXPECT_FALSE(locks->release("nothing", "a"));
}

TEST_F(LockManagerTest, RenewExtendsLease) {
    ASSERT_EQ(locks->acquire("k", LockType::Exclusive, "a", 50ms), LockStatus::Granted);
    EXPECT_TRUE(locks->renew("k", "a", 10s));

    std::this_thread::sleep_for(80ms);
    EXPECT_TRUE(locks->is_held_by("k", "a"));
    EXPECT_FALSE(locks->renew("k", "b"));
}

TEST_F(LockManagerTest, NonRenewableLeaseCannotBeRenewed) {
    ASSERT_EQ(locks->acquire("k", LockType::Exclusive, "a", 10s, false), LockStatus::Granted);
    EXPECT_FALSE(locks->renew("k", "a", 20s));
}

// ===========================================================================
// Expiry
// ===========================================================================

TEST_F(LockManagerTest, ExpiredLeaseIsReclaimable) {
    ASSERT_EQ(locks->acquire("k", LockType::Exclusive, "a", 20ms), LockStatus::Granted);
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(locks->acquire("k", LockType::Exclusive, "b"), LockStatus::Granted);
    EXPECT_TRUE(locks->is_held_by("k", "b"));
    EXPECT_FALSE(locks->release("k", "a"));
}

TEST_F(LockManagerTest, SweepRemovesExpiredHolders) {
    ASSERT_EQ(locks->acquire("k1", LockType::Shared, "a", 1s), LockStatus::Granted);
    ASSERT_EQ(locks->acquire("k1", LockType::Shared, "b", 1h), LockStatus::Granted);
    ASSERT_EQ(locks->acquire("k2", LockType::Exclusive, "c", 1s), LockStatus::Granted);

    EXPECT_EQ(locks->sweep_expired(Clock::now() + 2s), 2u);

    auto holders = locks->holders("k1");
    ASSERT_EQ(holders.size(), 1u);
    EXPECT_EQ(holders[0].owner, "b");
    EXPECT_FALSE(store.get("lock:k2").has_value());
}

TEST_F(LockManagerTest, UnreadableRecordIsDroppedBySweep) {
    store.set("lock:broken", "not json");
    locks->sweep_expired();
    EXPECT_FALSE(store.get("lock:broken").has_value());
}

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_F(LockManagerTest, StartStop) {
    locks->start();
    EXPECT_TRUE(locks->is_running());
    locks->stop();
    EXPECT_FALSE(locks->is_running());
}

TEST_F(LockManagerTest, TwoManagersOnOneStoreStayExclusive) {
    LockManager other(store);
    ASSERT_EQ(locks->acquire("shared_key", LockType::Exclusive, "a"), LockStatus::Granted);
    EXPECT_EQ(other.acquire("shared_key", LockType::Exclusive, "b"), LockStatus::Denied);
}
