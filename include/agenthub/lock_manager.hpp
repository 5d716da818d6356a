#pragma once

#include "agenthub/types.hpp"
#include "agenthub/config.hpp"
#include "agenthub/kv_store.hpp"
#include "agenthub/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agenthub {

struct LockHolder {
    AgentId owner;
    LockType type{LockType::Exclusive};
    Timestamp expires_at{};
};

struct LockInfo {
    std::string key;
    std::vector<LockHolder> holders;
    Timestamp acquired_at{};
    bool renewable{true};

    bool has_exclusive() const;
};

// Lease-based advisory locks stored in the KeyValueStore under lock:{key}.
// Every state change goes through the store's set-if-absent and
// compare-and-set, so several LockManagers sharing one store stay exclusive.
//
// Compatibility:
//   exclusive - no other live holder
//   shared    - every other live holder is shared
//   intent    - no other exclusive or intent holder; blocks new shared
//               holders so its owner can upgrade once the readers leave
// Re-acquiring as an existing holder replaces that holder's entry (upgrade,
// downgrade or refresh).
class LockManager {
public:
    explicit LockManager(KeyValueStore& store, LockConfig config = LockConfig{});
    ~LockManager();

    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // duration defaults to LockConfig::default_lease
    LockStatus acquire(const std::string& key, LockType type, const AgentId& owner,
                       std::optional<Duration> duration = std::nullopt,
                       bool renewable = true);

    // Only a live holder can release.
    bool release(const std::string& key, const AgentId& owner);

    // Extends a live, renewable lease.
    bool renew(const std::string& key, const AgentId& owner,
               std::optional<Duration> duration = std::nullopt);

    std::optional<LockInfo> inspect(const std::string& key);
    std::vector<LockHolder> holders(const std::string& key);
    bool is_locked(const std::string& key);
    bool is_held_by(const std::string& key, const AgentId& owner);

    // Drops leases that expired at or before now. Returns the number of
    // holders removed.
    std::size_t sweep_expired(Timestamp now = Clock::now());

    // "{scope}:{key}" - the lock resource guarding a state entry
    static std::string resource_key(StateScope scope, const std::string& key);
    // "lock:{key}" - where the lock record lives in the store
    static std::string store_key(const std::string& key);

    void set_monitor(std::shared_ptr<Monitor> monitor);

    void start();
    void stop();
    bool is_running() const noexcept;

private:
    KeyValueStore& store_;
    LockConfig config_;
    std::shared_ptr<Monitor> monitor_;

    std::thread sweeper_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    void sweep_loop();

    static bool compatible(LockType requested, const std::vector<LockHolder>& others);
    static std::optional<LockInfo> decode(const std::string& key, const std::string& raw);
    static std::string encode(const LockInfo& info);
    static void prune(LockInfo& info, Timestamp now);
    static Duration remaining_lease(const LockInfo& info, Timestamp now);

    void emit_event(EventType type, const std::string& message,
                    const std::string& key,
                    std::optional<AgentId> agent_id = std::nullopt);
};

} // namespace agenthub
