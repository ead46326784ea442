#ifndef PACS_FORWARD_RELAY_ROUTE_WORKER_H
#define PACS_FORWARD_RELAY_ROUTE_WORKER_H

/**
 * @file route_worker.h
 * @brief Store-and-forward loop for one route
 *
 * A worker repeatedly scans its route's source directory, fans every
 * eligible object out to all of the route's endpoints on its own thread
 * pool, and removes an object only once every endpoint accepted it.
 * Objects with at least one failed delivery stay in place and are retried
 * by a later scan, so an endpoint may receive the same object more than
 * once.
 *
 * The stop channel is consulted at two safe points: before the scan and
 * between the scan and the fan-out. A started fan-out always runs through
 * completion.
 */

#include "pacs/forward/config/forward_config.h"
#include "pacs/forward/delivery/endpoint_delivery.h"
#include "pacs/forward/integration/logger_adapter.h"
#include "pacs/forward/relay/route.h"
#include "pacs/forward/relay/stop_channel.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace pacs::forward::integration {
class thread_adapter;
}  // namespace pacs::forward::integration

namespace pacs::forward::relay {

/**
 * @brief Scan and fan-out tuning for a worker
 */
struct worker_options {
    /** Maximum objects collected per scan (0 = no limit) */
    size_t buffer_size = 0;

    /** Objects modified more recently than this are still being written */
    std::chrono::milliseconds minimum_age{1000};

    /** Wait after a scan that found nothing */
    std::chrono::milliseconds idle_backoff{500};

    /** Thread count of the worker's delivery pool */
    size_t max_parallel_deliveries = 8;

    [[nodiscard]] static worker_options from_config(
        const config::worker_config& config) noexcept;
};

/**
 * @brief Outcome of one scan/fan-out/completion pass
 */
struct cycle_result {
    size_t collected = 0;
    size_t delivered = 0;
    size_t failed = 0;
    size_t removed = 0;
};

/**
 * @brief Cumulative counters for one route
 */
struct worker_statistics {
    uint64_t cycles = 0;
    uint64_t objects_delivered = 0;
    uint64_t objects_failed = 0;
    uint64_t endpoint_failures = 0;
    uint64_t remove_failures = 0;
    uint64_t scan_errors = 0;
};

/**
 * @brief Check whether an object is old enough to relay
 *
 * Eligible means a regular file whose last write time is strictly before
 * @p now minus @p minimum_age.
 */
[[nodiscard]] bool is_eligible(const std::filesystem::directory_entry& entry,
                               std::chrono::milliseconds minimum_age,
                               std::filesystem::file_time_type now);

/**
 * @brief Recursively collect eligible objects below @p dir
 *
 * A directory that cannot be opened or fully listed is logged and skipped;
 * the scan goes on with the remaining directories. Symbolic links to
 * directories are not followed.
 *
 * @param limit Stop after this many objects (0 = collect all)
 * @param scan_errors Incremented for every directory that could not be read
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_eligible_files(
    const std::filesystem::path& dir, std::chrono::milliseconds minimum_age,
    size_t limit, size_t* scan_errors = nullptr);

/**
 * @brief Worker owning one route
 */
class route_worker {
public:
    route_worker(route r, worker_options options,
                 std::shared_ptr<delivery::network_sender> sender,
                 std::shared_ptr<stop_channel> channel);
    ~route_worker();

    route_worker(const route_worker&) = delete;
    route_worker& operator=(const route_worker&) = delete;

    /**
     * @brief Start the delivery pool
     * @return false if the pool could not be started
     */
    [[nodiscard]] bool start();

    /**
     * @brief Loop until the stop channel requests a stop
     */
    void run();

    /**
     * @brief Run a single scan, fan-out and completion pass
     */
    cycle_result run_cycle();

    /**
     * @brief Shut down the delivery pool after run() has returned
     */
    void shutdown();

    [[nodiscard]] const route& get_route() const noexcept { return route_; }

    [[nodiscard]] worker_statistics get_statistics() const noexcept;

private:
    [[nodiscard]] std::vector<std::filesystem::path> scan();
    cycle_result process(const std::vector<std::filesystem::path>& objects);

    route route_;
    worker_options options_;
    delivery::endpoint_dispatcher dispatcher_;
    std::shared_ptr<stop_channel> channel_;
    std::unique_ptr<integration::thread_adapter> pool_;
    std::unique_ptr<integration::logger_adapter> logger_;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> objects_delivered_{0};
    std::atomic<uint64_t> objects_failed_{0};
    std::atomic<uint64_t> endpoint_failures_{0};
    std::atomic<uint64_t> remove_failures_{0};
    std::atomic<uint64_t> scan_errors_{0};
};

}  // namespace pacs::forward::relay

#endif  // PACS_FORWARD_RELAY_ROUTE_WORKER_H
