#include "agenthub/lock_manager.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/util.hpp"

#include <algorithm>

namespace agenthub {

bool LockInfo::has_exclusive() const {
    return std::any_of(holders.begin(), holders.end(),
        [](const LockHolder& h) { return h.type == LockType::Exclusive; });
}

LockManager::LockManager(KeyValueStore& store, LockConfig config)
    : store_(store)
    , config_(std::move(config)) {}

LockManager::~LockManager() {
    if (running_.load()) {
        stop();
    }
}

// ==================== Record encoding ====================

std::string LockManager::encode(const LockInfo& info) {
    Value root(Json::objectValue);
    root["key"] = info.key;
    root["acquired_at"] = Json::Int64(to_epoch_ms(info.acquired_at));
    root["renewable"] = info.renewable;

    Value holders(Json::objectValue);
    for (const auto& h : info.holders) {
        Value entry(Json::objectValue);
        entry["type"] = to_string(h.type);
        entry["expires_at"] = Json::Int64(to_epoch_ms(h.expires_at));
        holders[h.owner] = entry;
    }
    root["holders"] = holders;
    return to_json_string(root);
}

std::optional<LockInfo> LockManager::decode(const std::string& key, const std::string& raw) {
    Value root;
    try {
        root = parse_json(raw);
    } catch (const ValidationException&) {
        return std::nullopt;
    }
    if (!root.isObject() || !root["holders"].isObject()) {
        return std::nullopt;
    }

    LockInfo info;
    info.key = key;
    info.acquired_at = from_epoch_ms(root["acquired_at"].asInt64());
    info.renewable = root.get("renewable", true).asBool();

    const Value& holders = root["holders"];
    for (const auto& owner : holders.getMemberNames()) {
        const Value& entry = holders[owner];
        auto type = parse_lock_type(entry["type"].asString());
        if (!type.has_value()) {
            return std::nullopt;
        }
        info.holders.push_back(LockHolder{owner, type.value(),
                                          from_epoch_ms(entry["expires_at"].asInt64())});
    }
    return info;
}

void LockManager::prune(LockInfo& info, Timestamp now) {
    info.holders.erase(
        std::remove_if(info.holders.begin(), info.holders.end(),
            [now](const LockHolder& h) { return h.expires_at <= now; }),
        info.holders.end());
}

Duration LockManager::remaining_lease(const LockInfo& info, Timestamp now) {
    Timestamp latest = now;
    for (const auto& h : info.holders) {
        latest = std::max(latest, h.expires_at);
    }
    return std::max<Duration>(latest - now, std::chrono::milliseconds(1));
}

bool LockManager::compatible(LockType requested, const std::vector<LockHolder>& others) {
    switch (requested) {
        case LockType::Exclusive:
            return others.empty();
        case LockType::Shared:
            return std::all_of(others.begin(), others.end(),
                [](const LockHolder& h) { return h.type == LockType::Shared; });
        case LockType::Intent:
            return std::none_of(others.begin(), others.end(),
                [](const LockHolder& h) {
                    return h.type == LockType::Exclusive || h.type == LockType::Intent;
                });
    }
    return false;
}

// ==================== Acquire / Release / Renew ====================

LockStatus LockManager::acquire(const std::string& key, LockType type, const AgentId& owner,
                                std::optional<Duration> duration, bool renewable) {
    if (key.empty() || owner.empty()) {
        throw ValidationException("Lock key and owner must not be empty");
    }

    Duration lease = duration.value_or(config_.default_lease);
    std::string skey = store_key(key);

    for (int attempt = 0; attempt < config_.max_cas_attempts; ++attempt) {
        auto now = Clock::now();
        auto current = store_.get(skey);

        if (!current.has_value()) {
            LockInfo info;
            info.key = key;
            info.acquired_at = now;
            info.renewable = renewable;
            info.holders.push_back(LockHolder{owner, type, now + lease});

            if (store_.set_if_absent(skey, encode(info), lease)) {
                emit_event(EventType::LockAcquired,
                           std::string(to_string(type)) + " lock granted", key, owner);
                return LockStatus::Granted;
            }
            continue;
        }

        LockInfo info = decode(key, current.value()).value_or(LockInfo{key, {}, now, renewable});
        prune(info, now);

        info.holders.erase(
            std::remove_if(info.holders.begin(), info.holders.end(),
                [&owner](const LockHolder& h) { return h.owner == owner; }),
            info.holders.end());

        if (!compatible(type, info.holders)) {
            emit_event(EventType::LockDenied,
                       std::string(to_string(type)) + " lock denied, held by " +
                           std::to_string(info.holders.size()) + " other owner(s)",
                       key, owner);
            return LockStatus::Denied;
        }

        if (info.holders.empty()) {
            info.acquired_at = now;
            info.renewable = renewable;
        }
        info.holders.push_back(LockHolder{owner, type, now + lease});

        if (store_.compare_and_set(skey, current.value(), encode(info),
                                   remaining_lease(info, now))) {
            emit_event(EventType::LockAcquired,
                       std::string(to_string(type)) + " lock granted", key, owner);
            return LockStatus::Granted;
        }
    }

    emit_event(EventType::LockDenied, "Lock record kept changing, giving up", key, owner);
    return LockStatus::Denied;
}

bool LockManager::release(const std::string& key, const AgentId& owner) {
    std::string skey = store_key(key);

    for (int attempt = 0; attempt < config_.max_cas_attempts; ++attempt) {
        auto now = Clock::now();
        auto current = store_.get(skey);
        if (!current.has_value()) {
            return false;
        }

        auto decoded = decode(key, current.value());
        if (!decoded.has_value()) {
            return false;
        }
        LockInfo info = std::move(decoded.value());
        prune(info, now);

        auto it = std::find_if(info.holders.begin(), info.holders.end(),
            [&owner](const LockHolder& h) { return h.owner == owner; });
        if (it == info.holders.end()) {
            return false;
        }
        info.holders.erase(it);

        bool done = info.holders.empty()
            ? store_.compare_and_erase(skey, current.value())
            : store_.compare_and_set(skey, current.value(), encode(info),
                                     remaining_lease(info, now));
        if (done) {
            emit_event(EventType::LockReleased, "Lock released", key, owner);
            return true;
        }
    }
    return false;
}

bool LockManager::renew(const std::string& key, const AgentId& owner,
                        std::optional<Duration> duration) {
    Duration lease = duration.value_or(config_.default_lease);
    std::string skey = store_key(key);

    for (int attempt = 0; attempt < config_.max_cas_attempts; ++attempt) {
        auto now = Clock::now();
        auto current = store_.get(skey);
        if (!current.has_value()) {
            return false;
        }

        auto decoded = decode(key, current.value());
        if (!decoded.has_value() || !decoded->renewable) {
            return false;
        }
        LockInfo info = std::move(decoded.value());
        prune(info, now);

        auto it = std::find_if(info.holders.begin(), info.holders.end(),
            [&owner](const LockHolder& h) { return h.owner == owner; });
        if (it == info.holders.end()) {
            return false;
        }
        it->expires_at = now + lease;

        if (store_.compare_and_set(skey, current.value(), encode(info),
                                   remaining_lease(info, now))) {
            emit_event(EventType::LockRenewed, "Lease renewed", key, owner);
            return true;
        }
    }
    return false;
}

// ==================== Queries ====================

std::optional<LockInfo> LockManager::inspect(const std::string& key) {
    auto current = store_.get(store_key(key));
    if (!current.has_value()) {
        return std::nullopt;
    }
    auto info = decode(key, current.value());
    if (!info.has_value()) {
        return std::nullopt;
    }
    prune(info.value(), Clock::now());
    if (info->holders.empty()) {
        return std::nullopt;
    }
    return info;
}

std::vector<LockHolder> LockManager::holders(const std::string& key) {
    auto info = inspect(key);
    if (!info.has_value()) {
        return {};
    }
    return info->holders;
}

bool LockManager::is_locked(const std::string& key) {
    return inspect(key).has_value();
}

bool LockManager::is_held_by(const std::string& key, const AgentId& owner) {
    auto hs = holders(key);
    return std::any_of(hs.begin(), hs.end(),
        [&owner](const LockHolder& h) { return h.owner == owner; });
}

// ==================== Expiry sweep ====================

std::size_t LockManager::sweep_expired(Timestamp now) {
    std::size_t removed = 0;

    for (const auto& skey : store_.keys(store_key(""))) {
        auto current = store_.get(skey);
        if (!current.has_value()) {
            continue;
        }

        std::string key = skey.substr(store_key("").size());
        auto decoded = decode(key, current.value());
        if (!decoded.has_value()) {
            // Unreadable record: nobody can prove ownership, reclaim it
            if (store_.compare_and_erase(skey, current.value())) {
                emit_event(EventType::LockExpired, "Dropped unreadable lock record", key);
            }
            continue;
        }

        LockInfo info = std::move(decoded.value());
        std::vector<AgentId> expired;
        for (const auto& h : info.holders) {
            if (h.expires_at <= now) {
                expired.push_back(h.owner);
            }
        }
        if (expired.empty()) {
            continue;
        }
        prune(info, now);

        // A concurrent acquire or release changed the record: the next sweep retries
        bool done = info.holders.empty()
            ? store_.compare_and_erase(skey, current.value())
            : store_.compare_and_set(skey, current.value(), encode(info),
                                     remaining_lease(info, now));
        if (!done) {
            continue;
        }

        removed += expired.size();
        for (const auto& owner : expired) {
            emit_event(EventType::LockExpired, "Lease expired and reclaimed", key, owner);
        }
    }
    return removed;
}

std::string LockManager::resource_key(StateScope scope, const std::string& key) {
    return std::string(to_string(scope)) + ":" + key;
}

std::string LockManager::store_key(const std::string& key) {
    return "lock:" + key;
}

// ==================== Lifecycle ====================

void LockManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

void LockManager::start() {
    if (running_.exchange(true)) {
        return;
    }
    sweeper_thread_ = std::thread(&LockManager::sweep_loop, this);
}

void LockManager::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

bool LockManager::is_running() const noexcept {
    return running_.load();
}

void LockManager::sweep_loop() {
    while (running_.load()) {
        try {
            sweep_expired(Clock::now());
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Lock sweep failed: ") + e.what(), "");
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.sweep_interval, [this] {
            return !running_.load();
        });
    }
}

void LockManager::emit_event(EventType type, const std::string& message,
                             const std::string& key, std::optional<AgentId> agent_id) {
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
    monitor->on_event(event);
}

} // namespace agenthub
