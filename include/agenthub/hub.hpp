#pragma once

#include "agenthub/types.hpp"
#include "agenthub/config.hpp"
#include "agenthub/conflict.hpp"
#include "agenthub/kv_store.hpp"
#include "agenthub/lock_manager.hpp"
#include "agenthub/message_bus.hpp"
#include "agenthub/monitor.hpp"
#include "agenthub/router.hpp"
#include "agenthub/state_manager.hpp"
#include "agenthub/transaction.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace agenthub {

// Owns one instance of every component, wired to a shared store and
// priority model. The stock agent roles are loaded at construction.
class Hub {
public:
    // A null store means an in-process MemoryStore
    explicit Hub(Config config = Config{}, std::shared_ptr<KeyValueStore> store = nullptr);
    ~Hub();

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    // ==================== Components ====================

    KeyValueStore& store() noexcept { return *store_; }
    PriorityModel& priorities() noexcept { return priorities_; }
    LockManager& locks() noexcept { return locks_; }
    TransactionCoordinator& transactions() noexcept { return transactions_; }
    StateManager& state() noexcept { return state_; }
    MessageBus& bus() noexcept { return bus_; }
    Router& router() noexcept { return router_; }

    const Config& config() const noexcept { return config_; }

    // ==================== Observability ====================

    SystemSnapshot get_snapshot() const;

    // Propagated to every component
    void set_monitor(std::shared_ptr<Monitor> monitor);

    // ==================== Lifecycle ====================

    // Starts every component's background loops plus the snapshot loop
    void start();
    void stop();
    bool is_running() const noexcept;

private:
    Config config_;
    std::shared_ptr<KeyValueStore> store_;
    PriorityModel priorities_;
    LockManager locks_;
    TransactionCoordinator transactions_;
    StateManager state_;
    MessageBus bus_;
    Router router_;
    std::shared_ptr<Monitor> monitor_;

    std::atomic<bool> running_{false};
    std::thread snapshot_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    void snapshot_loop();
};

} // namespace agenthub
