/**
 * @file thread_adapter.cpp
 * @brief thread_system backed implementation of thread_adapter
 *
 * @see include/pacs/forward/integration/thread_adapter.h
 */

#include "pacs/forward/integration/thread_adapter.h"

#include "pacs/forward/integration/logger_adapter.h"

#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/thread_pool.h>

#include <algorithm>
#include <format>
#include <mutex>
#include <vector>

namespace pacs::forward::integration {

namespace {

/**
 * @class thread_pool_adapter
 * @brief Owns one kcenon thread_pool with a fixed set of thread_workers
 */
class thread_pool_adapter : public thread_adapter {
public:
    ~thread_pool_adapter() override { shutdown(true); }

    [[nodiscard]] bool initialize(const worker_pool_config& config) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& logger = get_logger();

        if (pool_) {
            logger.warning(std::format("Pool {} is already running", name_));
            return false;
        }

        auto pool = std::make_shared<kcenon::thread::thread_pool>(config.name);

        // thread_pool has no workers of its own; it needs them before start()
        const size_t count = std::max(config.thread_count, size_t{1});
        std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
        workers.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
        }

        auto enqueued = pool->enqueue_batch(std::move(workers));
        if (enqueued.is_err()) {
            logger.error(std::format("Pool {}: unable to add workers: {}",
                                     config.name, enqueued.error().message));
            return false;
        }

        auto started = pool->start();
        if (started.is_err()) {
            logger.error(std::format("Pool {}: unable to start: {}", config.name,
                                     started.error().message));
            return false;
        }

        name_ = config.name;
        pool_ = std::move(pool);
        logger.debug(std::format("Pool {} started with {} worker(s)", name_, count));
        return true;
    }

    void shutdown(bool wait_for_completion) override {
        std::shared_ptr<kcenon::thread::thread_pool> pool;
        std::string name;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pool = std::move(pool_);
            name = name_;
        }
        if (!pool) {
            return;
        }

        pool->stop(!wait_for_completion);
        in_flight_.store(0, std::memory_order_release);
        get_logger().debug(std::format("Pool {} stopped", name));
    }

    [[nodiscard]] size_t in_flight() const noexcept override {
        return in_flight_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_running() const noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pool_ && pool_->is_running();
    }

protected:
    bool submit_internal(std::function<void()> task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pool_) {
            return false;
        }

        in_flight_.fetch_add(1, std::memory_order_release);
        pool_->submit_task([this, task = std::move(task)]() {
            task();
            in_flight_.fetch_sub(1, std::memory_order_release);
        });
        return true;
    }

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    std::string name_;
    std::atomic<size_t> in_flight_{0};
    mutable std::mutex mutex_;
};

}  // namespace

std::unique_ptr<thread_adapter> create_thread_adapter() {
    return std::make_unique<thread_pool_adapter>();
}

}  // namespace pacs::forward::integration
