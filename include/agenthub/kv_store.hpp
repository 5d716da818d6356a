#pragma once

#include "agenthub/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agenthub {

// Contract of the durable key-value store everything else is built on.
// Values are opaque strings (the hub stores compact JSON). Expired keys
// must behave exactly like absent keys for every operation.
class KeyValueStore {
public:
    using Subscriber = std::function<void(const std::string& channel, const std::string& payload)>;
    using SubscriptionId = std::uint64_t;

    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<Duration> ttl = std::nullopt) = 0;

    // Atomic primitives. These are the only source of truth for lock exclusivity.
    virtual bool set_if_absent(const std::string& key, const std::string& value,
                               std::optional<Duration> ttl = std::nullopt) = 0;
    virtual bool compare_and_set(const std::string& key, const std::string& expected,
                                 const std::string& desired,
                                 std::optional<Duration> ttl = std::nullopt) = 0;

    virtual bool erase(const std::string& key) = 0;
    virtual bool compare_and_erase(const std::string& key, const std::string& expected) = 0;

    // Live keys starting with prefix, in lexicographic order.
    virtual std::vector<std::string> keys(const std::string& prefix) = 0;

    // Pub/sub. Subscriptions match by channel prefix. Returns the number of
    // subscribers the payload was handed to.
    virtual std::size_t publish(const std::string& channel, const std::string& payload) = 0;
    virtual SubscriptionId subscribe(const std::string& channel_prefix, Subscriber subscriber) = 0;
    virtual bool unsubscribe(SubscriptionId id) = 0;
};

// In-process store with lazy TTL expiry. Subscribers run synchronously on the
// publishing thread, outside the store lock.
class MemoryStore : public KeyValueStore {
public:
    MemoryStore() = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::optional<Duration> ttl = std::nullopt) override;
    bool set_if_absent(const std::string& key, const std::string& value,
                       std::optional<Duration> ttl = std::nullopt) override;
    bool compare_and_set(const std::string& key, const std::string& expected,
                         const std::string& desired,
                         std::optional<Duration> ttl = std::nullopt) override;
    bool erase(const std::string& key) override;
    bool compare_and_erase(const std::string& key, const std::string& expected) override;
    std::vector<std::string> keys(const std::string& prefix) override;

    std::size_t publish(const std::string& channel, const std::string& payload) override;
    SubscriptionId subscribe(const std::string& channel_prefix, Subscriber subscriber) override;
    bool unsubscribe(SubscriptionId id) override;

    // Remaining time to live, nullopt for missing keys or keys without expiry.
    std::optional<Duration> ttl(const std::string& key);

    // Drop every expired key. Returns how many were removed.
    std::size_t purge_expired(Timestamp now = Clock::now());

    std::size_t size();

private:
    struct Item {
        std::string value;
        std::optional<Timestamp> expires_at;
    };

    struct Subscription {
        std::string channel_prefix;
        Subscriber subscriber;
    };

    std::mutex mutex_;
    std::map<std::string, Item> items_;

    std::mutex subscribers_mutex_;
    std::unordered_map<SubscriptionId, Subscription> subscribers_;
    SubscriptionId next_subscription_id_{1};

    // Caller holds mutex_. Returns the live item or nullptr, erasing it if expired.
    Item* find_live(const std::string& key, Timestamp now);
    static std::optional<Timestamp> deadline(std::optional<Duration> ttl, Timestamp now);
};

} // namespace agenthub
