#pragma once

#include "agenthub/types.hpp"
#include "agenthub/message.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace agenthub {

struct QueuedMessage {
    Message message;
    Timestamp not_before{};      // earliest delivery time (retry backoff)
    std::uint64_t sequence{0};   // admission order
    bool is_retry{false};
};

// Delivery queue ordered by priority tier, then admission order. Messages
// scheduled for a later attempt stay in place but are skipped until due.
class MessageQueue {
public:
    explicit MessageQueue(std::size_t max_queue_size = 10000);

    // Throws QueueFullException for new messages beyond capacity. Retries are
    // always accepted so a scheduled attempt is never lost.
    void enqueue(Message message, Timestamp not_before = Clock::now(), bool is_retry = false);

    // Highest-priority message whose not_before has passed.
    std::optional<QueuedMessage> pop_ready(Timestamp now = Clock::now());

    // Earliest not_before among queued messages.
    std::optional<Timestamp> next_due() const;

    bool remove(const MessageId& id);
    bool contains(const MessageId& id) const;

    std::vector<QueuedMessage> get_all_pending() const;

    std::size_t size() const;
    bool empty() const;
    bool full() const;
    std::size_t max_size() const noexcept;

private:
    mutable std::mutex mutex_;
    std::size_t max_queue_size_;

    // Sorted vector (priority desc, then sequence asc)
    std::vector<QueuedMessage> messages_;

    std::uint64_t next_sequence_{1};

    static bool compare(const QueuedMessage& a, const QueuedMessage& b);
};

} // namespace agenthub
