#ifndef PACS_FORWARD_INTEGRATION_THREAD_ADAPTER_H
#define PACS_FORWARD_INTEGRATION_THREAD_ADAPTER_H

/**
 * @file thread_adapter.h
 * @brief Integration Module - Thread system adapter
 *
 * Provides the worker pool a route uses to fan out deliveries.
 */

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace pacs::forward::integration {

/**
 * @brief Worker pool configuration
 */
struct worker_pool_config {
    std::string name = "worker_pool";
    size_t thread_count = 4;
};

/**
 * @brief Thread adapter interface
 *
 * A fixed-size pool; the relay gives every route its own instance so a
 * hung delivery only ever occupies threads of its own route.
 */
class thread_adapter {
public:
    virtual ~thread_adapter() = default;

    /**
     * @brief Start the pool's workers
     * @return false if already initialized or the pool could not start
     */
    [[nodiscard]] virtual bool initialize(const worker_pool_config& config) = 0;

    /**
     * @brief Stop the pool
     * @param wait_for_completion Drain queued tasks before returning
     *
     * The adapter may be initialized again afterwards.
     */
    virtual void shutdown(bool wait_for_completion = true) = 0;

    /**
     * @brief Submit a task for execution
     *
     * A task the pool refuses is counted in rejected_tasks() and its
     * future reports std::future_errc::broken_promise.
     */
    template <typename F>
    [[nodiscard]] auto submit(F&& task)
        -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using result_type = std::invoke_result_t<std::decay_t<F>>;
        auto packaged = std::make_shared<std::packaged_task<result_type()>>(
            std::forward<F>(task));
        auto future = packaged->get_future();
        if (!submit_internal([packaged]() { (*packaged)(); })) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
        }
        return future;
    }

    /**
     * @brief Tasks accepted but not finished yet
     */
    [[nodiscard]] virtual size_t in_flight() const noexcept = 0;

    [[nodiscard]] virtual bool is_running() const noexcept = 0;

    [[nodiscard]] size_t rejected_tasks() const noexcept {
        return rejected_.load(std::memory_order_relaxed);
    }

protected:
    /**
     * @return false if the task was not queued
     */
    virtual bool submit_internal(std::function<void()> task) = 0;

private:
    std::atomic<size_t> rejected_{0};
};

/**
 * @brief Create a thread adapter backed by thread_system's thread_pool
 */
[[nodiscard]] std::unique_ptr<thread_adapter> create_thread_adapter();

}  // namespace pacs::forward::integration

#endif  // PACS_FORWARD_INTEGRATION_THREAD_ADAPTER_H
