#include "agenthub/message_queue.hpp"
#include "agenthub/exceptions.hpp"

#include <algorithm>

namespace agenthub {

MessageQueue::MessageQueue(std::size_t max_queue_size)
    : max_queue_size_(max_queue_size)
{}

void MessageQueue::enqueue(Message message, Timestamp not_before, bool is_retry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_retry && messages_.size() >= max_queue_size_) {
        throw QueueFullException();
    }

    QueuedMessage queued;
    queued.message = std::move(message);
    queued.not_before = not_before;
    queued.sequence = next_sequence_++;
    queued.is_retry = is_retry;

    auto pos = std::upper_bound(messages_.begin(), messages_.end(), queued, compare);
    messages_.insert(pos, std::move(queued));
}

std::optional<QueuedMessage> MessageQueue::pop_ready(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(messages_.begin(), messages_.end(),
        [now](const QueuedMessage& q) { return q.not_before <= now; });
    if (it == messages_.end()) {
        return std::nullopt;
    }
    auto queued = std::move(*it);
    messages_.erase(it);
    return queued;
}

std::optional<Timestamp> MessageQueue::next_due() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (messages_.empty()) {
        return std::nullopt;
    }
    auto it = std::min_element(messages_.begin(), messages_.end(),
        [](const QueuedMessage& a, const QueuedMessage& b) {
            return a.not_before < b.not_before;
        });
    return it->not_before;
}

bool MessageQueue::remove(const MessageId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(messages_.begin(), messages_.end(),
        [&id](const QueuedMessage& q) { return q.message.id == id; });
    if (it == messages_.end()) {
        return false;
    }
    messages_.erase(it);
    return true;
}

bool MessageQueue::contains(const MessageId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(messages_.begin(), messages_.end(),
        [&id](const QueuedMessage& q) { return q.message.id == id; });
}

std::vector<QueuedMessage> MessageQueue::get_all_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::size_t MessageQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

bool MessageQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.empty();
}

bool MessageQueue::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size() >= max_queue_size_;
}

std::size_t MessageQueue::max_size() const noexcept {
    return max_queue_size_;
}

bool MessageQueue::compare(const QueuedMessage& a, const QueuedMessage& b) {
    // Higher priority first
    if (a.message.priority != b.message.priority) {
        return a.message.priority > b.message.priority;
    }
    // FIFO within the same priority tier
    return a.sequence < b.sequence;
}

} // namespace agenthub
