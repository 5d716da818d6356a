#include "agenthub/transaction.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/util.hpp"

#include <algorithm>
#include <set>

namespace agenthub {

Value TransactionOperation::to_json() const {
    Value json(Json::objectValue);
    json["type"] = to_string(type);
    json["key"] = key;
    json["scope"] = to_string(scope);
    json["value"] = value;
    json["agent_id"] = agent;
    return json;
}

Value Transaction::to_json() const {
    Value json(Json::objectValue);
    json["transaction_id"] = id;
    json["coordinator_agent"] = coordinator;

    Value parts(Json::arrayValue);
    for (const auto& p : participants) {
        parts.append(p);
    }
    json["participants"] = parts;

    Value ops(Json::arrayValue);
    for (const auto& op : operations) {
        ops.append(op.to_json());
    }
    json["operations"] = ops;

    Value vote_map(Json::objectValue);
    for (const auto& [agent, vote] : votes) {
        vote_map[agent] = vote;
    }
    json["votes"] = vote_map;

    json["status"] = to_string(status);
    json["created_at"] = format_timestamp(created_at);
    json["timeout_at"] = format_timestamp(timeout_at);
    if (finished_at.has_value()) {
        json["finished_at"] = format_timestamp(finished_at.value());
    }
    if (!abort_reason.empty()) {
        json["abort_reason"] = abort_reason;
    }
    return json;
}

TransactionCoordinator::TransactionCoordinator(KeyValueStore& store, LockManager& locks,
                                               TransactionConfig config)
    : store_(store)
    , locks_(locks)
    , config_(std::move(config)) {}

TransactionCoordinator::~TransactionCoordinator() {
    if (running_.load()) {
        stop();
    }
}

void TransactionCoordinator::set_applier(OperationApplier* applier) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    applier_ = applier;
}

void TransactionCoordinator::register_participant(const AgentId& agent,
                                                  std::shared_ptr<TransactionParticipant> participant) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    participants_[agent] = std::move(participant);
}

void TransactionCoordinator::unregister_participant(const AgentId& agent) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    participants_.erase(agent);
}

// ==================== Begin / Operations ====================

TransactionId TransactionCoordinator::begin(const AgentId& coordinator,
                                            std::vector<AgentId> participants,
                                            std::optional<Duration> timeout) {
    if (coordinator.empty()) {
        throw ValidationException("Transaction coordinator must not be empty");
    }

    auto entry = std::make_shared<Entry>();
    auto now = Clock::now();
    entry->tx.id = generate_id();
    entry->tx.coordinator = coordinator;
    entry->tx.participants = std::move(participants);
    entry->tx.created_at = now;
    entry->tx.timeout_at = now + timeout.value_or(config_.default_timeout);

    TransactionId id = entry->tx.id;
    persist(entry->tx);
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        transactions_[id] = entry;
    }

    emit_event(EventType::TransactionBegun,
               "Transaction begun with " + std::to_string(entry->tx.participants.size()) +
                   " participant(s)",
               id, coordinator);
    return id;
}

bool TransactionCoordinator::add_operation(const TransactionId& id, OperationType type,
                                           const std::string& key, StateScope scope,
                                           Value value, const AgentId& agent) {
    TransactionOperation op;
    op.type = type;
    op.key = key;
    op.scope = scope;
    op.value = std::move(value);
    op.agent = agent;
    return add_operation(id, std::move(op));
}

bool TransactionCoordinator::add_operation(const TransactionId& id, TransactionOperation op) {
    if (op.key.empty()) {
        throw ValidationException("Transaction operation key must not be empty");
    }

    auto entry = find(id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->tx.is_terminal()) {
        return false;
    }
    entry->tx.operations.push_back(std::move(op));
    return true;
}

// ==================== Commit / Rollback ====================

TransactionStatus TransactionCoordinator::commit(const TransactionId& id) {
    auto entry = find(id);
    if (!entry) {
        throw TransactionNotFoundException(id);
    }

    // table_mutex_ is never taken while an entry mutex is held
    OperationApplier* applier = nullptr;
    ParticipantMap voters;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        applier = applier_;
        voters = participants_;
    }

    Transaction finished;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        Transaction& tx = entry->tx;
        if (tx.is_terminal()) {
            return tx.status;
        }

        if (Clock::now() >= tx.timeout_at) {
            mark_aborted(tx, "timed out before commit");
        } else if (!applier && !tx.operations.empty()) {
            mark_aborted(tx, "no operation applier attached");
        } else {
            // ---- Phase 1: prepare ----
            std::vector<std::string> locked;
            std::string failure;

            if (!acquire_locks(tx, applier, locked)) {
                failure = "lock contention during prepare";
            } else if (!collect_votes(tx, voters)) {
                failure = "participant voted to abort";
            } else {
                for (const auto& op : tx.operations) {
                    try {
                        applier->prepare(op);
                    } catch (const std::exception& e) {
                        failure = std::string("prepare failed for ") + op.key + ": " + e.what();
                        break;
                    }
                }
            }

            // ---- Phase 2: commit operations ----
            if (failure.empty()) {
                std::vector<std::pair<const TransactionOperation*, std::optional<StateEntry>>> undo;
                for (const auto& op : tx.operations) {
                    try {
                        // Recorded before apply so a half-applied operation is undone too
                        undo.emplace_back(&op, applier->capture(op));
                        applier->apply(op, tx.id);
                    } catch (const std::exception& e) {
                        failure = std::string("commit failed for ") + op.key + ": " + e.what();
                        break;
                    }
                }

                if (!failure.empty()) {
                    for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
                        try {
                            applier->restore(*it->first, it->second);
                        } catch (const std::exception& e) {
                            emit_event(EventType::BackgroundTaskFailed,
                                       "Undo of " + it->first->key + " failed: " + e.what(),
                                       tx.id);
                        }
                    }
                }
            }

            if (failure.empty()) {
                tx.status = TransactionStatus::Committed;
                tx.finished_at = Clock::now();
                persist(tx);
            } else {
                mark_aborted(tx, failure);
            }
            release_locks(tx, locked);
        }

        finished = tx;
    }

    if (finished.status == TransactionStatus::Committed) {
        emit_event(EventType::TransactionCommitted,
                   "Committed " + std::to_string(finished.operations.size()) + " operation(s)",
                   finished.id, finished.coordinator);
    } else {
        emit_event(EventType::TransactionAborted, finished.abort_reason,
                   finished.id, finished.coordinator);
    }
    notify_participants(finished);
    return finished.status;
}

TransactionStatus TransactionCoordinator::rollback(const TransactionId& id,
                                                   const std::string& reason) {
    auto entry = find(id);
    if (!entry) {
        throw TransactionNotFoundException(id);
    }

    Transaction finished;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->tx.is_terminal()) {
            return entry->tx.status;
        }
        mark_aborted(entry->tx, reason);
        finished = entry->tx;
    }

    emit_event(EventType::TransactionAborted, reason, finished.id, finished.coordinator);
    notify_participants(finished);
    return TransactionStatus::Aborted;
}

// ==================== Prepare helpers ====================

bool TransactionCoordinator::acquire_locks(const Transaction& tx, OperationApplier* applier,
                                           std::vector<std::string>& locked) {
    const AgentId owner = "tx:" + tx.id;
    auto lease = std::max<Duration>(tx.timeout_at - Clock::now(), std::chrono::milliseconds(1));

    // Sorted so two transactions over the same keys contend in the same order
    std::set<std::string> keys;
    for (const auto& op : tx.operations) {
        keys.insert(applier ? applier->lock_key_for(op)
                            : LockManager::resource_key(op.scope, op.key));
    }

    for (const auto& key : keys) {
        if (locks_.acquire(key, LockType::Exclusive, owner, lease, false) != LockStatus::Granted) {
            return false;
        }
        locked.push_back(key);
    }
    return true;
}

void TransactionCoordinator::release_locks(const Transaction& tx,
                                           const std::vector<std::string>& locked) {
    const AgentId owner = "tx:" + tx.id;
    for (const auto& key : locked) {
        locks_.release(key, owner);
    }
}

bool TransactionCoordinator::collect_votes(Transaction& tx, const ParticipantMap& voters) {
    bool all_commit = true;
    for (const auto& agent : tx.participants) {
        auto it = voters.find(agent);
        bool vote = true;
        if (it != voters.end() && it->second) {
            try {
                vote = it->second->prepare(tx);
            } catch (const std::exception&) {
                vote = false;
            }
        }
        tx.votes[agent] = vote;
        all_commit = all_commit && vote;
    }
    return all_commit;
}

void TransactionCoordinator::mark_aborted(Transaction& tx, const std::string& reason) {
    tx.status = TransactionStatus::Aborted;
    tx.abort_reason = reason;
    tx.finished_at = Clock::now();
    persist(tx);
}

void TransactionCoordinator::persist(const Transaction& tx) {
    store_.set(store_key(tx.id), to_json_string(tx.to_json()), config_.record_retention);
}

void TransactionCoordinator::notify_participants(const Transaction& tx) {
    for (const auto& agent : tx.participants) {
        auto p = participant(agent);
        if (!p) {
            continue;
        }
        try {
            if (tx.status == TransactionStatus::Committed) {
                p->on_commit(tx);
            } else {
                p->on_abort(tx);
            }
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Participant notification failed: ") + e.what(),
                       tx.id, agent);
        }
    }
}

// ==================== Queries / Sweeps ====================

std::optional<Transaction> TransactionCoordinator::get(const TransactionId& id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->tx;
}

std::size_t TransactionCoordinator::pending_count() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& [id, entry] : transactions_) {
            entries.push_back(entry);
        }
    }

    std::size_t count = 0;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->tx.is_terminal()) {
            ++count;
        }
    }
    return count;
}

std::size_t TransactionCoordinator::expire_timed_out(Timestamp now) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& [id, entry] : transactions_) {
            entries.push_back(entry);
        }
    }

    std::vector<Transaction> expired;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->tx.is_terminal() && now >= entry->tx.timeout_at) {
            mark_aborted(entry->tx, "timed out");
            expired.push_back(entry->tx);
        }
    }

    for (const auto& tx : expired) {
        emit_event(EventType::TransactionAborted, "Timed out while pending", tx.id, tx.coordinator);
        notify_participants(tx);
    }
    return expired.size();
}

std::size_t TransactionCoordinator::purge_finished(Timestamp now) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& [id, entry] : transactions_) {
            entries.push_back(entry);
        }
    }

    std::vector<TransactionId> finished;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        const auto& tx = entry->tx;
        if (tx.is_terminal() && tx.finished_at.has_value() &&
            now >= tx.finished_at.value() + config_.finished_retention) {
            finished.push_back(tx.id);
        }
    }

    std::lock_guard<std::mutex> lock(table_mutex_);
    std::size_t removed = 0;
    for (const auto& id : finished) {
        removed += transactions_.erase(id);
    }
    return removed;
}

std::string TransactionCoordinator::store_key(const TransactionId& id) {
    return "transaction:" + id;
}

std::shared_ptr<TransactionCoordinator::Entry> TransactionCoordinator::find(const TransactionId& id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = transactions_.find(id);
    return it != transactions_.end() ? it->second : nullptr;
}

std::shared_ptr<TransactionParticipant> TransactionCoordinator::participant(const AgentId& agent) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = participants_.find(agent);
    return it != participants_.end() ? it->second : nullptr;
}

// ==================== Lifecycle ====================

void TransactionCoordinator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

void TransactionCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }
    sweeper_thread_ = std::thread(&TransactionCoordinator::sweep_loop, this);
}

void TransactionCoordinator::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

bool TransactionCoordinator::is_running() const noexcept {
    return running_.load();
}

void TransactionCoordinator::sweep_loop() {
    while (running_.load()) {
        try {
            auto now = Clock::now();
            expire_timed_out(now);
            purge_finished(now);
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Transaction sweep failed: ") + e.what(), "");
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.sweep_interval, [this] {
            return !running_.load();
        });
    }
}

void TransactionCoordinator::emit_event(EventType type, const std::string& message,
                                        const TransactionId& tx_id,
                                        std::optional<AgentId> agent_id) {
    auto monitor = std::atomic_load(&monitor_);
    if (!monitor) {
        return;
    }

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent_id = std::move(agent_id);
    if (!tx_id.empty()) {
        event.transaction_id = tx_id;
    }
    monitor->on_event(event);
}

} // namespace agenthub
