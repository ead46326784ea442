#ifndef PACS_FORWARD_RELAY_ENDPOINT_MANAGER_H
#define PACS_FORWARD_RELAY_ENDPOINT_MANAGER_H

/**
 * @file endpoint_manager.h
 * @brief Lifecycle of listeners and route workers
 *
 * The manager launches one listener process per configured listener and
 * runs one worker thread per route. Shutdown signals every worker through
 * its stop channel with a bounded number of attempts and then joins all
 * worker threads.
 *
 * @example
 * ```cpp
 * relay::endpoint_manager manager(config);
 * if (auto result = manager.start(); !result) {
 *     std::cerr << relay::to_string(result.error()) << std::endl;
 *     return 1;
 * }
 * // ... wait for shutdown signal
 * auto stopped = manager.stop();
 * ```
 */

#include "pacs/forward/config/forward_config.h"
#include "pacs/forward/delivery/endpoint_delivery.h"
#include "pacs/forward/relay/listener_launcher.h"
#include "pacs/forward/relay/route.h"
#include "pacs/forward/relay/route_worker.h"
#include "pacs/forward/relay/stop_channel.h"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace pacs::forward::relay {

// =============================================================================
// Error Codes (-1000 to -1009)
// =============================================================================

/**
 * @brief Endpoint manager error codes
 *
 * Allocated range: -1000 to -1009
 */
enum class manager_error : int {
    /** Manager is already running */
    already_running = -1000,

    /** Manager is not running */
    not_running = -1001,

    /** Configuration failed validation */
    invalid_configuration = -1002,

    /** A listener could not be started */
    listener_start_failed = -1003,

    /** A listener could not be stopped */
    listener_stop_failed = -1004,

    /** A worker's delivery pool could not be started */
    worker_start_failed = -1005,

    /** Some workers never accepted the stop signal */
    workers_not_stopped = -1006
};

/**
 * @brief Convert manager_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(manager_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of manager error
 */
[[nodiscard]] constexpr const char* to_string(manager_error error) noexcept {
    switch (error) {
        case manager_error::already_running:
            return "Endpoint manager is already running";
        case manager_error::not_running:
            return "Endpoint manager is not running";
        case manager_error::invalid_configuration:
            return "Relay configuration is invalid";
        case manager_error::listener_start_failed:
            return "Failed to start a DICOM listener";
        case manager_error::listener_stop_failed:
            return "Failed to stop a DICOM listener";
        case manager_error::worker_start_failed:
            return "Failed to start a route worker";
        case manager_error::workers_not_stopped:
            return "Not all route workers could be signalled to stop";
        default:
            return "Unknown endpoint manager error";
    }
}

/**
 * @brief Collaborators used by the manager
 *
 * Null members are replaced by the DCMTK-backed defaults built from the
 * configuration's tool names.
 */
struct manager_dependencies {
    std::shared_ptr<listener_launcher> launcher;
    std::shared_ptr<delivery::network_sender> sender;
    std::shared_ptr<stop_channel_factory> channel_factory;
};

/**
 * @brief Statistics of one route
 */
struct route_statistics {
    std::string route_name;
    worker_statistics worker;
};

/**
 * @brief Runs listeners and one worker per route
 */
class endpoint_manager {
public:
    explicit endpoint_manager(config::forward_config config,
                              manager_dependencies dependencies = {});

    /**
     * @brief Destructor - stops the manager if running
     */
    ~endpoint_manager();

    endpoint_manager(const endpoint_manager&) = delete;
    endpoint_manager& operator=(const endpoint_manager&) = delete;

    endpoint_manager(endpoint_manager&&) noexcept;
    endpoint_manager& operator=(endpoint_manager&&) noexcept;

    /**
     * @brief Start listeners and workers
     *
     * Nothing is left running when an error is returned.
     */
    [[nodiscard]] std::expected<void, manager_error> start();

    /**
     * @brief Stop listeners and workers
     *
     * Every worker thread is joined and the manager is no longer running
     * when this returns, whatever the result. workers_not_stopped takes
     * precedence over listener_stop_failed.
     */
    [[nodiscard]] std::expected<void, manager_error> stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Route table built by the last start()
     */
    [[nodiscard]] std::vector<route> routes() const;

    /**
     * @brief Per-route statistics
     *
     * While stopped, returns the figures captured by the last stop().
     */
    [[nodiscard]] std::vector<route_statistics> get_statistics() const;

    [[nodiscard]] const config::forward_config& config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace pacs::forward::relay

#endif  // PACS_FORWARD_RELAY_ENDPOINT_MANAGER_H
