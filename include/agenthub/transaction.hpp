#pragma once

#include "agenthub/types.hpp"
#include "agenthub/config.hpp"
#include "agenthub/kv_store.hpp"
#include "agenthub/lock_manager.hpp"
#include "agenthub/monitor.hpp"
#include "agenthub/state_entry.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agenthub {

struct TransactionOperation {
    OperationType type{OperationType::Set};
    std::string key;
    StateScope scope{StateScope::Global};
    // Set: the new value. Put: a full StateEntry in JSON form. Delete: unused.
    Value value;
    AgentId agent;

    Value to_json() const;
};

struct Transaction {
    TransactionId id;
    AgentId coordinator;
    std::vector<AgentId> participants;
    std::vector<TransactionOperation> operations;
    TransactionStatus status{TransactionStatus::Pending};
    std::map<AgentId, bool> votes;
    Timestamp created_at{};
    Timestamp timeout_at{};
    std::optional<Timestamp> finished_at;
    std::string abort_reason;

    bool is_terminal() const noexcept { return status != TransactionStatus::Pending; }
    Value to_json() const;
};

// A cooperating party that votes during prepare. Participants without a
// registered object vote commit implicitly.
class TransactionParticipant {
public:
    virtual ~TransactionParticipant() = default;

    // Return false (or throw) to vote abort.
    virtual bool prepare(const Transaction& tx) = 0;

    virtual void on_commit(const Transaction& /*tx*/) {}
    virtual void on_abort(const Transaction& /*tx*/) {}
};

// Executes operations against the state store on behalf of the coordinator.
class OperationApplier {
public:
    virtual ~OperationApplier() = default;

    // Lock resource guarding the operation's key
    virtual std::string lock_key_for(const TransactionOperation& op) const = 0;

    // Validation during prepare. Throws to abort.
    virtual void prepare(const TransactionOperation& op) = 0;

    // Pre-image used to undo the operation
    virtual std::optional<StateEntry> capture(const TransactionOperation& op) = 0;

    // Throws on failure
    virtual void apply(const TransactionOperation& op, const TransactionId& tx) = 0;

    // Puts the pre-image back (erases the key when there was none)
    virtual void restore(const TransactionOperation& op,
                         const std::optional<StateEntry>& before) = 0;
};

// Two-phase commit over the keys an operation log touches.
//
// prepare: exclusive lock on every key (owner "tx:{id}"), participant votes,
//          applier validation
// commit:  apply in order; a failing operation undoes the ones already
//          applied in reverse order
// Any failure aborts. Committed and Aborted are terminal: repeating commit or
// rollback returns the recorded status and applies nothing.
class TransactionCoordinator {
public:
    TransactionCoordinator(KeyValueStore& store, LockManager& locks,
                           TransactionConfig config = TransactionConfig{});
    ~TransactionCoordinator();

    TransactionCoordinator(const TransactionCoordinator&) = delete;
    TransactionCoordinator& operator=(const TransactionCoordinator&) = delete;

    void set_applier(OperationApplier* applier);

    void register_participant(const AgentId& agent, std::shared_ptr<TransactionParticipant> participant);
    void unregister_participant(const AgentId& agent);

    // timeout defaults to TransactionConfig::default_timeout
    TransactionId begin(const AgentId& coordinator, std::vector<AgentId> participants,
                        std::optional<Duration> timeout = std::nullopt);

    // False when the transaction is unknown or no longer pending.
    bool add_operation(const TransactionId& id, OperationType type, const std::string& key,
                       StateScope scope, Value value, const AgentId& agent);
    bool add_operation(const TransactionId& id, TransactionOperation op);

    // Throws TransactionNotFoundException for unknown ids.
    TransactionStatus commit(const TransactionId& id);
    TransactionStatus rollback(const TransactionId& id, const std::string& reason = "rolled back");

    std::optional<Transaction> get(const TransactionId& id) const;
    std::size_t pending_count() const;

    // Aborts pending transactions whose timeout passed. Returns the count.
    std::size_t expire_timed_out(Timestamp now = Clock::now());

    // Forgets terminal transactions older than finished_retention.
    std::size_t purge_finished(Timestamp now = Clock::now());

    static std::string store_key(const TransactionId& id);

    void set_monitor(std::shared_ptr<Monitor> monitor);

    void start();
    void stop();
    bool is_running() const noexcept;

private:
    struct Entry {
        std::mutex mutex;
        Transaction tx;
    };

    using ParticipantMap = std::unordered_map<AgentId, std::shared_ptr<TransactionParticipant>>;

    KeyValueStore& store_;
    LockManager& locks_;
    TransactionConfig config_;
    OperationApplier* applier_{nullptr};
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex table_mutex_;
    std::unordered_map<TransactionId, std::shared_ptr<Entry>> transactions_;
    ParticipantMap participants_;

    std::thread sweeper_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::shared_ptr<Entry> find(const TransactionId& id) const;
    std::shared_ptr<TransactionParticipant> participant(const AgentId& agent) const;

    // Caller holds entry.mutex and must not hold table_mutex_
    bool acquire_locks(const Transaction& tx, OperationApplier* applier,
                       std::vector<std::string>& locked);
    void release_locks(const Transaction& tx, const std::vector<std::string>& locked);
    bool collect_votes(Transaction& tx, const ParticipantMap& voters);
    void mark_aborted(Transaction& tx, const std::string& reason);
    void persist(const Transaction& tx);

    void notify_participants(const Transaction& tx);
    void sweep_loop();

    void emit_event(EventType type, const std::string& message,
                    const TransactionId& tx_id,
                    std::optional<AgentId> agent_id = std::nullopt);
};

} // namespace agenthub
