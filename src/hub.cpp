#include "agenthub/hub.hpp"

namespace agenthub {

Hub::Hub(Config config, std::shared_ptr<KeyValueStore> store)
    : config_(std::move(config))
    , store_(store ? std::move(store) : std::make_shared<MemoryStore>())
    , locks_(*store_, config_.locks)
    , transactions_(*store_, locks_, config_.transactions)
    , state_(*store_, locks_, transactions_, priorities_, config_.state)
    , bus_(*store_, priorities_, config_.bus)
    , router_(bus_, *store_, priorities_, config_.router)
{
    priorities_.load_default_roles();
}

Hub::~Hub() {
    if (running_.load()) {
        stop();
    }
}

SystemSnapshot Hub::get_snapshot() const {
    SystemSnapshot snapshot;
    snapshot.timestamp = Clock::now();
    snapshot.agents = router_.load_snapshot();
    snapshot.queued_messages = bus_.queue_size();
    snapshot.dead_letters = bus_.dead_letter_count();
    snapshot.active_workflows = bus_.active_workflow_count();
    snapshot.pending_transactions = transactions_.pending_count();
    snapshot.active_sessions = router_.active_sessions();
    snapshot.cached_entries = state_.cache_size();
    return snapshot;
}

void Hub::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, monitor);
    locks_.set_monitor(monitor);
    transactions_.set_monitor(monitor);
    state_.set_monitor(monitor);
    bus_.set_monitor(monitor);
    router_.set_monitor(std::move(monitor));
}

// ==================== Lifecycle ====================

void Hub::start() {
    if (running_.exchange(true)) {
        return;
    }
    locks_.start();
    transactions_.start();
    state_.start();
    bus_.start();
    router_.start();
    snapshot_thread_ = std::thread(&Hub::snapshot_loop, this);
}

void Hub::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (snapshot_thread_.joinable()) {
        snapshot_thread_.join();
    }

    router_.stop();
    bus_.stop();
    state_.stop();
    transactions_.stop();
    locks_.stop();
}

bool Hub::is_running() const noexcept {
    return running_.load();
}

void Hub::snapshot_loop() {
    while (running_.load()) {
        if (auto monitor = std::atomic_load(&monitor_)) {
            try {
                monitor->on_snapshot(get_snapshot());
            } catch (const std::exception& e) {
                MonitorEvent event;
                event.type = EventType::BackgroundTaskFailed;
                event.timestamp = Clock::now();
                event.message = std::string("Snapshot failed: ") + e.what();
                monitor->on_event(event);
            }
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.snapshot_interval, [this] {
            return !running_.load();
        });
    }
}

} // namespace agenthub
