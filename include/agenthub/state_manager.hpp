#pragma once

#include "agenthub/types.hpp"
#include "agenthub/config.hpp"
#include "agenthub/conflict.hpp"
#include "agenthub/kv_store.hpp"
#include "agenthub/lock_manager.hpp"
#include "agenthub/monitor.hpp"
#include "agenthub/state_entry.hpp"
#include "agenthub/transaction.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agenthub {

struct SetOptions {
    std::optional<ConsistencyLevel> consistency;   // StateConfig default when unset
    std::optional<Duration> ttl;
    std::optional<ConflictStrategy> strategy;      // StateConfig default when unset
    StateType state_type{StateType::Configuration};
    std::vector<std::string> dependencies;
};

// Payload of the state_changes:{scope} channel
struct StateChange {
    std::string operation;  // "updated" or "deleted"
    std::string key;
    StateScope scope{StateScope::Global};
    StateType state_type{StateType::Configuration};
    AgentId owner;
    std::uint64_t version{0};
    Timestamp timestamp{};

    Value to_json() const;
    static std::optional<StateChange> from_json(const Value& json);
    static std::string channel(StateScope scope);
};

// Versioned, scoped state on top of the KeyValueStore.
//
// Every accepted write bumps the entry version by exactly one; the store's
// compare-and-set decides between racing writers. Strong writes additionally
// hold an exclusive lease on {scope}:{key} for the duration of the write.
// Eventual and weak reads are served from a local cache that is invalidated
// by change notifications; strong reads always go to the store.
class StateManager : public OperationApplier {
public:
    using ChangeCallback = std::function<void(const StateChange&)>;
    using ListenerId = std::uint64_t;

    StateManager(KeyValueStore& store, LockManager& locks,
                 TransactionCoordinator& transactions, const PriorityModel& priorities,
                 StateConfig config = StateConfig{});
    ~StateManager() override;

    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    // ==================== Entries ====================

    WriteStatus set(const std::string& key, Value value, StateScope scope,
                    const AgentId& owner, const SetOptions& options = SetOptions{});

    std::optional<Value> get(const std::string& key, StateScope scope,
                             std::optional<ConsistencyLevel> consistency = std::nullopt);
    std::optional<StateEntry> get_entry(const std::string& key, StateScope scope,
                                        std::optional<ConsistencyLevel> consistency = std::nullopt);

    DeleteStatus erase(const std::string& key, StateScope scope, const AgentId& owner);

    std::vector<std::string> list_keys(StateScope scope);

    // ==================== Checkpoints ====================

    // Snapshot of every entry in scope under checkpoint:{scope}:{name}.
    // Returns the number of entries captured.
    std::size_t create_checkpoint(const std::string& name, StateScope scope);

    // Replaces the scope with the snapshot in a single transaction. Returns
    // false if no such checkpoint exists; throws TransactionAbortedException
    // if the restore aborted (the prior state is left untouched).
    bool restore_checkpoint(const std::string& name, StateScope scope);

    std::vector<std::string> list_checkpoints(StateScope scope);

    static std::string checkpoint_key(StateScope scope, const std::string& name);

    // ==================== Change notifications ====================

    // Invoked from the sync loop for changes whose key starts with key_prefix.
    ListenerId subscribe_to_changes(const std::string& key_prefix, StateScope scope,
                                    ChangeCallback callback);
    bool unsubscribe_from_changes(ListenerId id);

    // Applies queued change notifications to the cache and listeners.
    // Returns the number processed.
    std::size_t sync_pending_changes();

    // Recomputes cached checksums, repairing or evicting corrupt entries.
    // Returns the number of violations found.
    std::size_t verify_consistency();

    std::size_t cache_size() const;
    void clear_cache();

    // ==================== OperationApplier ====================

    std::string lock_key_for(const TransactionOperation& op) const override;
    void prepare(const TransactionOperation& op) override;
    std::optional<StateEntry> capture(const TransactionOperation& op) override;
    void apply(const TransactionOperation& op, const TransactionId& tx) override;
    void restore(const TransactionOperation& op, const std::optional<StateEntry>& before) override;

    // ==================== Lifecycle ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);

    void start();
    void stop();
    bool is_running() const noexcept;

private:
    friend class StateManagerInspector;

    struct Listener {
        std::string key_prefix;
        StateScope scope;
        ChangeCallback callback;
    };

    KeyValueStore& store_;
    LockManager& locks_;
    TransactionCoordinator& transactions_;
    const PriorityModel& priorities_;
    StateConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, StateEntry> cache_;

    std::mutex changes_mutex_;
    std::deque<StateChange> pending_changes_;
    KeyValueStore::SubscriptionId change_subscription_{0};

    std::mutex listeners_mutex_;
    std::unordered_map<ListenerId, Listener> listeners_;
    ListenerId next_listener_id_{1};

    std::thread sync_thread_;
    std::thread consistency_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    WriteStatus write_entry(const std::string& key, const Value& value, StateScope scope,
                            const AgentId& owner, const SetOptions& options,
                            ConsistencyLevel consistency, ConflictStrategy strategy);

    std::optional<StateEntry> load(const std::string& store_key);
    std::optional<StateEntry> load_verified(const std::string& store_key);
    void put_entry(const StateEntry& entry);
    void remove_entry(const std::string& key, StateScope scope, const StateEntry& removed);

    void cache_put(const std::string& store_key, const StateEntry& entry);
    void cache_evict(const std::string& store_key);

    void publish_change(const std::string& operation, const StateEntry& entry);
    void on_change_notification(const std::string& payload);

    void sync_loop();
    void consistency_loop();

    void emit_event(EventType type, const std::string& message,
                    const std::string& key,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<double> value = std::nullopt);
};

} // namespace agenthub
