#include "agenthub/state_manager.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/util.hpp"

#include <algorithm>
#include <set>

namespace agenthub {

namespace {

constexpr int MAX_WRITE_ATTEMPTS = 16;
const AgentId CHECKPOINT_COORDINATOR = "state_manager";

// Holds a lease for the duration of one state operation. A lease the owner
// already holds is reused; a weaker one is upgraded and handed back on exit.
class ScopedLease {
public:
    ScopedLease(LockManager& locks, std::string key, AgentId owner)
        : locks_(locks)
        , key_(std::move(key))
        , owner_(std::move(owner)) {}

    ~ScopedLease() {
        if (!taken_) {
            return;
        }
        if (previous_.has_value()) {
            auto remaining = previous_->expires_at - Clock::now();
            if (remaining > Duration::zero()) {
                locks_.acquire(key_, previous_->type, owner_, remaining);
                return;
            }
        }
        locks_.release(key_, owner_);
    }

    ScopedLease(const ScopedLease&) = delete;
    ScopedLease& operator=(const ScopedLease&) = delete;

    bool acquire(LockType type, Duration lease) {
        for (const auto& holder : locks_.holders(key_)) {
            if (holder.owner != owner_) {
                continue;
            }
            if (holder.type == LockType::Exclusive || type != LockType::Exclusive) {
                return true;
            }
            previous_ = holder;
            break;
        }
        taken_ = locks_.acquire(key_, type, owner_, lease, false) == LockStatus::Granted;
        return taken_;
    }

private:
    LockManager& locks_;
    std::string key_;
    AgentId owner_;
    std::optional<LockHolder> previous_;
    bool taken_{false};
};

std::optional<Duration> remaining_ttl(const StateEntry& entry, Timestamp now) {
    if (!entry.expires_at.has_value()) {
        return std::nullopt;
    }
    return entry.expires_at.value() - now;
}

} // anonymous namespace

// ==================== StateChange ====================

Value StateChange::to_json() const {
    Value json(Json::objectValue);
    json["operation"] = operation;
    json["key"] = key;
    json["scope"] = to_string(scope);
    json["stateType"] = to_string(state_type);
    json["ownerAgent"] = owner;
    json["version"] = Json::UInt64(version);
    json["timestamp"] = format_timestamp(timestamp);
    return json;
}

std::optional<StateChange> StateChange::from_json(const Value& json) {
    if (!json.isObject()) {
        return std::nullopt;
    }
    auto scope = parse_state_scope(json["scope"].asString());
    auto state_type = parse_state_type(json["stateType"].asString());
    auto ts = parse_timestamp(json["timestamp"].asString());
    if (!scope || !state_type || !ts || !json["key"].isString()) {
        return std::nullopt;
    }

    StateChange change;
    change.operation = json["operation"].asString();
    change.key = json["key"].asString();
    change.scope = scope.value();
    change.state_type = state_type.value();
    change.owner = json["ownerAgent"].asString();
    change.version = json["version"].asUInt64();
    change.timestamp = ts.value();
    return change;
}

std::string StateChange::channel(StateScope scope) {
    return std::string("state_changes:") + to_string(scope);
}

// ==================== Construction ====================

StateManager::StateManager(KeyValueStore& store, LockManager& locks,
                           TransactionCoordinator& transactions,
                           const PriorityModel& priorities, StateConfig config)
    : store_(store)
    , locks_(locks)
    , transactions_(transactions)
    , priorities_(priorities)
    , config_(std::move(config))
{
    change_subscription_ = store_.subscribe("state_changes:",
        [this](const std::string& /*channel*/, const std::string& payload) {
            on_change_notification(payload);
        });
    transactions_.set_applier(this);
}

StateManager::~StateManager() {
    if (running_.load()) {
        stop();
    }
    transactions_.set_applier(nullptr);
    store_.unsubscribe(change_subscription_);
}

// ==================== Writes ====================

WriteStatus StateManager::set(const std::string& key, Value value, StateScope scope,
                              const AgentId& owner, const SetOptions& options) {
    if (key.empty() || owner.empty()) {
        throw ValidationException("State key and owner must not be empty");
    }

    ConsistencyLevel consistency = options.consistency.value_or(config_.default_consistency);
    ConflictStrategy strategy = options.strategy.value_or(config_.default_strategy);

    if (consistency == ConsistencyLevel::Strong) {
        std::string resource = LockManager::resource_key(scope, key);
        ScopedLease lease(locks_, resource, owner);
        if (!lease.acquire(LockType::Exclusive, config_.write_lock_lease)) {
            emit_event(EventType::StateWriteRejected, "Write lock is held by another owner",
                       resource, owner);
            return WriteStatus::Contended;
        }
        return write_entry(key, value, scope, owner, options, consistency, strategy);
    }
    return write_entry(key, value, scope, owner, options, consistency, strategy);
}

WriteStatus StateManager::write_entry(const std::string& key, const Value& value,
                                      StateScope scope, const AgentId& owner,
                                      const SetOptions& options,
                                      ConsistencyLevel consistency,
                                      ConflictStrategy strategy) {
    const std::string skey = StateEntry::store_key(scope, key);
    const std::string resource = LockManager::resource_key(scope, key);

    for (int attempt = 0; attempt < MAX_WRITE_ATTEMPTS; ++attempt) {
        auto now = Clock::now();
        auto raw = store_.get(skey);

        std::optional<StateEntry> existing;
        if (raw.has_value()) {
            try {
                existing = StateEntry::from_json(parse_json(raw.value()));
            } catch (const ValidationException&) {
                emit_event(EventType::ConsistencyViolation,
                           "Unreadable record is overwritten", resource, owner);
            }
            if (existing.has_value() && existing->is_expired(now)) {
                existing.reset();
            }
        }

        StateEntry entry;
        if (existing.has_value()) {
            auto resolver = make_resolver(strategy, priorities_);
            auto resolved = resolver->resolve(existing.value(), value, owner);
            if (!resolved.has_value()) {
                emit_event(EventType::StateWriteRejected,
                           resolver->name() + " kept the value of " + existing->owner,
                           resource, owner, static_cast<double>(existing->version));
                if (strategy == ConflictStrategy::HumanIntervention) {
                    emit_event(EventType::EscalatedToHuman,
                               "Conflicting write held for manual review", resource, owner);
                }
                return WriteStatus::Rejected;
            }
            entry = existing.value();
            entry.value = std::move(resolved.value());
            entry.version = existing->version + 1;
        } else {
            entry.key = key;
            entry.scope = scope;
            entry.value = value;
            entry.version = 1;
            entry.created_at = now;
        }

        entry.owner = owner;
        entry.updated_at = now;
        entry.state_type = options.state_type;
        entry.consistency = consistency;
        entry.dependencies = options.dependencies;
        entry.expires_at = options.ttl.has_value()
            ? std::optional<Timestamp>(now + options.ttl.value()) : std::nullopt;
        entry.refresh_checksum();

        std::string encoded = to_json_string(entry.to_json());
        bool stored = raw.has_value()
            ? store_.compare_and_set(skey, raw.value(), encoded, options.ttl)
            : store_.set_if_absent(skey, encoded, options.ttl);
        if (!stored) {
            continue;
        }

        if (consistency == ConsistencyLevel::Strong) {
            cache_evict(skey);
        } else {
            cache_put(skey, entry);
        }
        publish_change("updated", entry);
        emit_event(EventType::StateUpdated, "Version " + std::to_string(entry.version),
                   resource, owner, static_cast<double>(entry.version));
        return WriteStatus::Applied;
    }

    emit_event(EventType::StateWriteRejected, "Entry kept changing under concurrent writers",
               resource, owner);
    return WriteStatus::Contended;
}

DeleteStatus StateManager::erase(const std::string& key, StateScope scope, const AgentId& owner) {
    if (key.empty() || owner.empty()) {
        throw ValidationException("State key and owner must not be empty");
    }

    const std::string skey = StateEntry::store_key(scope, key);
    const std::string resource = LockManager::resource_key(scope, key);

    ScopedLease lease(locks_, resource, owner);
    if (!lease.acquire(LockType::Exclusive, config_.write_lock_lease)) {
        emit_event(EventType::StateWriteRejected, "Delete lock is held by another owner",
                   resource, owner);
        return DeleteStatus::Contended;
    }

    for (int attempt = 0; attempt < MAX_WRITE_ATTEMPTS; ++attempt) {
        auto raw = store_.get(skey);
        if (!raw.has_value()) {
            cache_evict(skey);
            return DeleteStatus::NotFound;
        }

        StateEntry removed;
        removed.key = key;
        removed.scope = scope;
        try {
            removed = StateEntry::from_json(parse_json(raw.value()));
        } catch (const ValidationException&) {
            // Unreadable records are removed all the same
        }

        if (store_.compare_and_erase(skey, raw.value())) {
            removed.owner = owner;
            remove_entry(key, scope, removed);
            return DeleteStatus::Deleted;
        }
    }
    return DeleteStatus::Contended;
}

// ==================== Reads ====================

std::optional<Value> StateManager::get(const std::string& key, StateScope scope,
                                       std::optional<ConsistencyLevel> consistency) {
    auto entry = get_entry(key, scope, consistency);
    if (!entry.has_value()) {
        return std::nullopt;
    }
    return entry->value;
}

std::optional<StateEntry> StateManager::get_entry(const std::string& key, StateScope scope,
                                                  std::optional<ConsistencyLevel> consistency) {
    ConsistencyLevel level = consistency.value_or(config_.default_consistency);
    const std::string skey = StateEntry::store_key(scope, key);

    if (level == ConsistencyLevel::Strong) {
        // Shared lease: concurrent strong readers coexist, writers are excluded
        std::string resource = LockManager::resource_key(scope, key);
        ScopedLease lease(locks_, resource, "reader:" + generate_id());
        if (!lease.acquire(LockType::Shared, config_.write_lock_lease)) {
            throw LockContentionException(resource);
        }
        return load_verified(skey);
    }

    bool corrupt = false;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(skey);
        if (it != cache_.end()) {
            if (it->second.is_expired(Clock::now())) {
                cache_.erase(it);
            } else if (it->second.checksum_valid()) {
                return it->second;
            } else {
                corrupt = true;
                cache_.erase(it);
            }
        }
    }

    if (corrupt) {
        emit_event(EventType::ConsistencyViolation, "Cached checksum mismatch, reloading",
                   LockManager::resource_key(scope, key));
    }

    auto entry = load_verified(skey);
    if (entry.has_value()) {
        if (corrupt) {
            emit_event(EventType::ConsistencyRepaired, "Repaired from store",
                       LockManager::resource_key(scope, key));
        }
        if (entry->consistency != ConsistencyLevel::Strong) {
            cache_put(skey, entry.value());
        }
    }
    return entry;
}

std::vector<std::string> StateManager::list_keys(StateScope scope) {
    const std::string prefix = StateEntry::store_prefix(scope);
    std::vector<std::string> result;
    for (const auto& skey : store_.keys(prefix)) {
        result.push_back(skey.substr(prefix.size()));
    }
    return result;
}

std::optional<StateEntry> StateManager::load(const std::string& skey) {
    auto raw = store_.get(skey);
    if (!raw.has_value()) {
        return std::nullopt;
    }
    try {
        return StateEntry::from_json(parse_json(raw.value()));
    } catch (const ValidationException& e) {
        emit_event(EventType::ConsistencyViolation,
                   std::string("Unreadable state record: ") + e.what(), skey);
        return std::nullopt;
    }
}

std::optional<StateEntry> StateManager::load_verified(const std::string& skey) {
    auto entry = load(skey);
    if (!entry.has_value()) {
        return std::nullopt;
    }
    if (entry->is_expired(Clock::now())) {
        return std::nullopt;
    }
    if (!entry->checksum_valid()) {
        emit_event(EventType::ConsistencyViolation, "Stored checksum mismatch",
                   LockManager::resource_key(entry->scope, entry->key));
        return std::nullopt;
    }
    return entry;
}

// ==================== Checkpoints ====================

std::size_t StateManager::create_checkpoint(const std::string& name, StateScope scope) {
    if (name.empty()) {
        throw ValidationException("Checkpoint name must not be empty");
    }

    Value entries(Json::arrayValue);
    for (const auto& key : list_keys(scope)) {
        auto entry = load_verified(StateEntry::store_key(scope, key));
        if (entry.has_value()) {
            entries.append(entry->to_json());
        }
    }

    Value checkpoint(Json::objectValue);
    checkpoint["name"] = name;
    checkpoint["scope"] = to_string(scope);
    checkpoint["created_at"] = format_timestamp(Clock::now());
    checkpoint["entries"] = entries;
    store_.set(checkpoint_key(scope, name), to_json_string(checkpoint));

    emit_event(EventType::CheckpointCreated,
               "Checkpoint " + name + " holds " + std::to_string(entries.size()) + " entries",
               checkpoint_key(scope, name));
    return entries.size();
}

bool StateManager::restore_checkpoint(const std::string& name, StateScope scope) {
    auto raw = store_.get(checkpoint_key(scope, name));
    if (!raw.has_value()) {
        return false;
    }
    Value checkpoint = parse_json(raw.value());

    TransactionId tx = transactions_.begin(CHECKPOINT_COORDINATOR, {}, config_.restore_timeout);

    std::set<std::string> snapshot_keys;
    for (const auto& entry : checkpoint["entries"]) {
        snapshot_keys.insert(entry["key"].asString());
    }

    for (const auto& key : list_keys(scope)) {
        if (snapshot_keys.count(key) == 0) {
            transactions_.add_operation(tx, OperationType::Delete, key, scope,
                                        Value(), CHECKPOINT_COORDINATOR);
        }
    }
    for (const auto& entry : checkpoint["entries"]) {
        transactions_.add_operation(tx, OperationType::Put, entry["key"].asString(), scope,
                                    entry, CHECKPOINT_COORDINATOR);
    }

    if (transactions_.commit(tx) != TransactionStatus::Committed) {
        auto record = transactions_.get(tx);
        throw TransactionAbortedException(tx, record ? record->abort_reason : "restore aborted");
    }

    emit_event(EventType::CheckpointRestored,
               "Restored " + std::to_string(snapshot_keys.size()) + " entries from " + name,
               checkpoint_key(scope, name));
    return true;
}

std::vector<std::string> StateManager::list_checkpoints(StateScope scope) {
    const std::string prefix = checkpoint_key(scope, "");
    std::vector<std::string> names;
    for (const auto& key : store_.keys(prefix)) {
        names.push_back(key.substr(prefix.size()));
    }
    return names;
}

std::string StateManager::checkpoint_key(StateScope scope, const std::string& name) {
    return std::string("checkpoint:") + to_string(scope) + ":" + name;
}

// ==================== OperationApplier ====================

std::string StateManager::lock_key_for(const TransactionOperation& op) const {
    return LockManager::resource_key(op.scope, op.key);
}

void StateManager::prepare(const TransactionOperation& op) {
    if (op.type != OperationType::Put) {
        return;
    }
    StateEntry entry = StateEntry::from_json(op.value);
    if (entry.key != op.key || entry.scope != op.scope) {
        throw ValidationException("Entry does not belong to " + lock_key_for(op));
    }
    if (!entry.checksum_valid()) {
        throw ConsistencyViolationException(lock_key_for(op));
    }
}

std::optional<StateEntry> StateManager::capture(const TransactionOperation& op) {
    return load(StateEntry::store_key(op.scope, op.key));
}

void StateManager::apply(const TransactionOperation& op, const TransactionId& tx) {
    const std::string skey = StateEntry::store_key(op.scope, op.key);

    switch (op.type) {
        case OperationType::Set: {
            // The transaction already holds the exclusive lease
            SetOptions options;
            WriteStatus status = write_entry(op.key, op.value, op.scope, op.agent, options,
                                             config_.default_consistency,
                                             config_.default_strategy);
            if (status == WriteStatus::Rejected) {
                throw AgentHubException(ErrorKind::Conflict,
                                        "Write rejected by conflict strategy in " + tx);
            }
            if (status == WriteStatus::Contended) {
                throw LockContentionException(lock_key_for(op));
            }
            break;
        }
        case OperationType::Delete: {
            auto existing = load(skey);
            store_.erase(skey);
            if (existing.has_value()) {
                existing->owner = op.agent;
                remove_entry(op.key, op.scope, existing.value());
            } else {
                cache_evict(skey);
            }
            break;
        }
        case OperationType::Put: {
            StateEntry entry = StateEntry::from_json(op.value);
            if (entry.is_expired(Clock::now())) {
                store_.erase(skey);
                cache_evict(skey);
            } else {
                put_entry(entry);
            }
            break;
        }
    }
}

void StateManager::restore(const TransactionOperation& op, const std::optional<StateEntry>& before) {
    const std::string skey = StateEntry::store_key(op.scope, op.key);

    if (before.has_value()) {
        put_entry(before.value());
        return;
    }

    auto existing = load(skey);
    store_.erase(skey);
    if (existing.has_value()) {
        remove_entry(op.key, op.scope, existing.value());
    } else {
        cache_evict(skey);
    }
}

void StateManager::put_entry(const StateEntry& entry) {
    const std::string skey = StateEntry::store_key(entry.scope, entry.key);
    auto now = Clock::now();
    auto ttl = remaining_ttl(entry, now);
    if (ttl.has_value() && ttl.value() <= Duration::zero()) {
        store_.erase(skey);
        cache_evict(skey);
        return;
    }

    store_.set(skey, to_json_string(entry.to_json()), ttl);
    cache_evict(skey);
    publish_change("updated", entry);
    emit_event(EventType::StateUpdated, "Version " + std::to_string(entry.version) + " put verbatim",
               LockManager::resource_key(entry.scope, entry.key), entry.owner,
               static_cast<double>(entry.version));
}

void StateManager::remove_entry(const std::string& key, StateScope scope, const StateEntry& removed) {
    cache_evict(StateEntry::store_key(scope, key));
    publish_change("deleted", removed);
    emit_event(EventType::StateDeleted, "Entry deleted",
               LockManager::resource_key(scope, key), removed.owner);
}

// ==================== Cache & notifications ====================

void StateManager::cache_put(const std::string& skey, const StateEntry& entry) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_[skey] = entry;
}

void StateManager::cache_evict(const std::string& skey) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.erase(skey);
}

std::size_t StateManager::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

void StateManager::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

void StateManager::publish_change(const std::string& operation, const StateEntry& entry) {
    StateChange change;
    change.operation = operation;
    change.key = entry.key;
    change.scope = entry.scope;
    change.state_type = entry.state_type;
    change.owner = entry.owner;
    change.version = entry.version;
    change.timestamp = Clock::now();
    store_.publish(StateChange::channel(entry.scope), to_json_string(change.to_json()));
}

void StateManager::on_change_notification(const std::string& payload) {
    std::optional<StateChange> change;
    try {
        change = StateChange::from_json(parse_json(payload));
    } catch (const ValidationException& e) {
        emit_event(EventType::BackgroundTaskFailed,
                   std::string("Malformed change notification: ") + e.what(), "");
        return;
    }
    if (!change.has_value()) {
        return;
    }

    std::lock_guard<std::mutex> lock(changes_mutex_);
    pending_changes_.push_back(std::move(change.value()));
}

StateManager::ListenerId StateManager::subscribe_to_changes(const std::string& key_prefix,
                                                            StateScope scope,
                                                            ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_[id] = Listener{key_prefix, scope, std::move(callback)};
    return id;
}

bool StateManager::unsubscribe_from_changes(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

std::size_t StateManager::sync_pending_changes() {
    std::deque<StateChange> changes;
    {
        std::lock_guard<std::mutex> lock(changes_mutex_);
        changes.swap(pending_changes_);
    }

    for (const auto& change : changes) {
        const std::string skey = StateEntry::store_key(change.scope, change.key);

        bool invalidated = false;
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            auto it = cache_.find(skey);
            if (it != cache_.end() &&
                (change.operation == "deleted" || it->second.version != change.version)) {
                cache_.erase(it);
                invalidated = true;
            }
        }
        if (invalidated) {
            emit_event(EventType::CacheInvalidated,
                       "Stale cache entry dropped after " + change.operation,
                       LockManager::resource_key(change.scope, change.key), change.owner);
        }

        std::vector<ChangeCallback> targets;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            for (const auto& [id, listener] : listeners_) {
                if (listener.scope == change.scope &&
                    change.key.compare(0, listener.key_prefix.size(), listener.key_prefix) == 0) {
                    targets.push_back(listener.callback);
                }
            }
        }
        for (auto& callback : targets) {
            try {
                callback(change);
            } catch (const std::exception& e) {
                emit_event(EventType::BackgroundTaskFailed,
                           std::string("Change listener failed: ") + e.what(),
                           LockManager::resource_key(change.scope, change.key));
            }
        }
    }
    return changes.size();
}

std::size_t StateManager::verify_consistency() {
    std::vector<std::string> corrupt;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (const auto& [skey, entry] : cache_) {
            if (!entry.checksum_valid()) {
                corrupt.push_back(skey);
            }
        }
    }

    for (const auto& skey : corrupt) {
        emit_event(EventType::ConsistencyViolation, "Cached checksum mismatch", skey);

        auto fresh = load_verified(skey);
        if (fresh.has_value()) {
            cache_put(skey, fresh.value());
            emit_event(EventType::ConsistencyRepaired, "Repaired from store", skey);
        } else {
            cache_evict(skey);
            emit_event(EventType::CacheInvalidated, "Evicted, store copy missing or corrupt", skey);
        }
    }
    return corrupt.size();
}

// ==================== Lifecycle ====================

void StateManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

void StateManager::start() {
    if (running_.exchange(true)) {
        return;
    }
    sync_thread_ = std::thread(&StateManager::sync_loop, this);
    consistency_thread_ = std::thread(&StateManager::consistency_loop, this);
}

void StateManager::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (sync_thread_.joinable()) {
        sync_thread_.join();
    }
    if (consistency_thread_.joinable()) {
        consistency_thread_.join();
    }
}

bool StateManager::is_running() const noexcept {
    return running_.load();
}

void StateManager::sync_loop() {
    while (running_.load()) {
        try {
            sync_pending_changes();
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("State sync failed: ") + e.what(), "");
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.sync_interval, [this] {
            return !running_.load();
        });
    }
}

void StateManager::consistency_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            cv_.wait_for(lock, config_.consistency_check_interval, [this] {
                return !running_.load();
            });
        }
        if (!running_.load()) {
            break;
        }

        try {
            verify_consistency();
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Consistency check failed: ") + e.what(), "");
        }
    }
}

void StateManager::emit_event(EventType type, const std::string& message,
                              const std::string& key, std::optional<AgentId> agent_id,
                              std::optional<double> value) {
    auto monitor = std::atomic_load(&monitor_);
    if (!monitor) {
        return;
    }

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent_id = std::move(agent_id);
    if (!key.empty()) {
        event.key = key;
    }
    event.value = value;
    monitor->on_event(event);
}

} // namespace agenthub
