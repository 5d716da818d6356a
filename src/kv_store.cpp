#include "agenthub/kv_store.hpp"

namespace agenthub {

MemoryStore::Item* MemoryStore::find_live(const std::string& key, Timestamp now) {
    auto it = items_.find(key);
    if (it == items_.end()) {
        return nullptr;
    }
    if (it->second.expires_at.has_value() && now >= it->second.expires_at.value()) {
        items_.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<Timestamp> MemoryStore::deadline(std::optional<Duration> ttl, Timestamp now) {
    if (!ttl.has_value()) {
        return std::nullopt;
    }
    return now + ttl.value();
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Item* item = find_live(key, Clock::now());
    if (!item) {
        return std::nullopt;
    }
    return item->value;
}

void MemoryStore::set(const std::string& key, const std::string& value,
                      std::optional<Duration> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_[key] = Item{value, deadline(ttl, Clock::now())};
}

bool MemoryStore::set_if_absent(const std::string& key, const std::string& value,
                                std::optional<Duration> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (find_live(key, now)) {
        return false;
    }
    items_[key] = Item{value, deadline(ttl, now)};
    return true;
}

bool MemoryStore::compare_and_set(const std::string& key, const std::string& expected,
                                  const std::string& desired, std::optional<Duration> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    Item* item = find_live(key, now);
    if (!item || item->value != expected) {
        return false;
    }
    item->value = desired;
    item->expires_at = deadline(ttl, now);
    return true;
}

bool MemoryStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!find_live(key, Clock::now())) {
        return false;
    }
    items_.erase(key);
    return true;
}

bool MemoryStore::compare_and_erase(const std::string& key, const std::string& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    Item* item = find_live(key, Clock::now());
    if (!item || item->value != expected) {
        return false;
    }
    items_.erase(key);
    return true;
}

std::vector<std::string> MemoryStore::keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    std::vector<std::string> result;

    for (auto it = items_.lower_bound(prefix); it != items_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (it->second.expires_at.has_value() && now >= it->second.expires_at.value()) {
            continue;
        }
        result.push_back(it->first);
    }
    return result;
}

std::size_t MemoryStore::publish(const std::string& channel, const std::string& payload) {
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& [id, sub] : subscribers_) {
            if (channel.compare(0, sub.channel_prefix.size(), sub.channel_prefix) == 0) {
                targets.push_back(sub.subscriber);
            }
        }
    }

    // Outside the lock: subscribers may publish or subscribe themselves
    for (auto& subscriber : targets) {
        subscriber(channel, payload);
    }
    return targets.size();
}

KeyValueStore::SubscriptionId MemoryStore::subscribe(const std::string& channel_prefix,
                                                     Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    SubscriptionId id = next_subscription_id_++;
    subscribers_[id] = Subscription{channel_prefix, std::move(subscriber)};
    return id;
}

bool MemoryStore::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.erase(id) > 0;
}

std::optional<Duration> MemoryStore::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    Item* item = find_live(key, now);
    if (!item || !item->expires_at.has_value()) {
        return std::nullopt;
    }
    return item->expires_at.value() - now;
}

std::size_t MemoryStore::purge_expired(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    auto it = items_.begin();
    while (it != items_.end()) {
        if (it->second.expires_at.has_value() && now >= it->second.expires_at.value()) {
            it = items_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t MemoryStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace agenthub
