#ifndef PACS_FORWARD_CONFIG_FORWARD_CONFIG_H
#define PACS_FORWARD_CONFIG_FORWARD_CONFIG_H

/**
 * @file forward_config.h
 * @brief Configuration structures for the DICOM store-and-forward relay
 *
 * Defines the listeners (inbound storescp processes), the delivery
 * endpoints (remote DICOM receivers and directory mirrors) and the routes
 * binding a listener's output directory to a list of endpoints.
 *
 * Configuration Hierarchy:
 *   forward_config (root)
 *   ├── listeners (storescp processes and their output directories)
 *   ├── endpoints (network or directory destinations)
 *   ├── routes (listener name -> endpoint names)
 *   ├── manager_config (shutdown policy)
 *   ├── worker_config (scan and fan-out tuning)
 *   ├── tool_config (DCMTK executables)
 *   └── logging_config
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pacs::forward::config {

// =============================================================================
// Error Codes (-750 to -759)
// =============================================================================

/**
 * @brief Configuration specific error codes
 *
 * Allocated range: -750 to -759
 */
enum class config_error : int {
    /** Configuration file not found */
    file_not_found = -750,

    /** Failed to parse configuration file */
    parse_error = -751,

    /** Configuration validation failed */
    validation_error = -752,

    /** Required field is missing */
    missing_required_field = -753,

    /** Invalid value for configuration field */
    invalid_value = -754,

    /** Environment variable not found */
    env_var_not_found = -755,

    /** Invalid file format (not JSON) */
    invalid_format = -756,

    /** Configuration file is empty */
    empty_config = -757,

    /** IO error reading or writing file */
    io_error = -759
};

/**
 * @brief Convert config_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(config_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of config error
 */
[[nodiscard]] constexpr const char* to_string(config_error error) noexcept {
    switch (error) {
        case config_error::file_not_found:
            return "Configuration file not found";
        case config_error::parse_error:
            return "Failed to parse configuration file";
        case config_error::validation_error:
            return "Configuration validation failed";
        case config_error::missing_required_field:
            return "Required configuration field is missing";
        case config_error::invalid_value:
            return "Invalid value for configuration field";
        case config_error::env_var_not_found:
            return "Environment variable not found";
        case config_error::invalid_format:
            return "Invalid configuration file format";
        case config_error::empty_config:
            return "Configuration file is empty";
        case config_error::io_error:
            return "IO error accessing configuration file";
        default:
            return "Unknown configuration error";
    }
}

// =============================================================================
// Validation Error Details
// =============================================================================

/**
 * @brief Detailed validation error information
 */
struct validation_error_info {
    /** Path to the configuration field (e.g., "routes[0].endpoints[1]") */
    std::string field_path;

    /** Error message describing the validation failure */
    std::string message;

    /** Actual value that failed validation (if applicable) */
    std::optional<std::string> actual_value;

    /** Expected value or constraint description */
    std::optional<std::string> expected;
};

/** Maximum length of a DICOM Application Entity title */
inline constexpr std::size_t MAX_AE_TITLE_LENGTH = 16;

// =============================================================================
// Listener Configuration
// =============================================================================

/**
 * @brief Inbound DICOM listener (storescp) configuration
 */
struct listener_config {
    /** Unique listener name, referenced by a route */
    std::string name;

    /** Port the listener accepts associations on */
    uint16_t port = 104;

    /** AE title the listener answers to */
    std::string ae_title;

    /** Directory the listener writes received objects into */
    std::string output_dir;
};

// =============================================================================
// Endpoint Configuration
// =============================================================================

/**
 * @brief Remote DICOM storage endpoint, reached through storescu
 */
struct network_endpoint {
    /** Unique endpoint name */
    std::string name;

    /** Hostname or IP address of the receiver */
    std::string address;

    /** Port of the receiver */
    uint16_t port = 104;

    /** Our (calling) AE title */
    std::string calling_ae;

    /** Receiver (called) AE title */
    std::string called_ae;
};

/**
 * @brief Local directory mirror endpoint
 */
struct directory_endpoint {
    /** Unique endpoint name */
    std::string name;

    /** Destination directory; must exist */
    std::string path;
};

/**
 * @brief Delivery endpoint, one alternative per delivery strategy
 */
using endpoint = std::variant<network_endpoint, directory_endpoint>;

/**
 * @brief Name of an endpoint regardless of its kind
 */
[[nodiscard]] const std::string& endpoint_name(const endpoint& ep) noexcept;

/**
 * @brief Short label for the endpoint kind ("dicom" or "directory")
 */
[[nodiscard]] std::string_view endpoint_kind(const endpoint& ep) noexcept;

// =============================================================================
// Route / Manager / Worker Configuration
// =============================================================================

/**
 * @brief Route from a listener's output directory to a set of endpoints
 *
 * The route name is the name of the listener whose output directory is the
 * route's source. The endpoint list is kept in declaration order.
 */
struct route_config {
    /** Listener name */
    std::string name;

    /** Endpoint names */
    std::vector<std::string> endpoints;
};

/**
 * @brief Endpoint manager policy
 */
struct manager_config {
    /** Maximum number of signalling rounds when stopping workers */
    std::size_t max_stop_attempts = 100;
};

/**
 * @brief Worker tuning shared by every route
 */
struct worker_config {
    /** Maximum objects per scan cycle (0 = unbounded) */
    std::size_t buffer_size = 0;

    /** Minimum time since last modification before an object is eligible */
    std::chrono::milliseconds minimum_age{1000};

    /** Wait after a scan that found nothing */
    std::chrono::milliseconds idle_backoff{500};

    /** Size hint for the per-route delivery pool */
    std::size_t max_parallel_deliveries = 8;
};

/**
 * @brief External DCMTK executables, resolved through PATH
 */
struct tool_config {
    std::string storescp = "storescp";
    std::string storescu = "storescu";
    std::string echoscu = "echoscu";
};

// =============================================================================
// Logging Configuration
// =============================================================================

/**
 * @brief Log level enumeration
 */
enum class log_level { trace, debug, info, warning, error, critical };

/**
 * @brief Get string representation of log level
 */
[[nodiscard]] constexpr const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::trace:
            return "trace";
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warning:
            return "warning";
        case log_level::error:
            return "error";
        case log_level::critical:
            return "critical";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a log level name (case-insensitive, "warn" accepted)
 */
[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view str);

/**
 * @brief Logging configuration
 */
struct logging_config {
    log_level level = log_level::info;
};

// =============================================================================
// Complete Configuration
// =============================================================================

/**
 * @brief Complete relay configuration
 */
struct forward_config {
    std::vector<listener_config> listeners;
    std::vector<endpoint> endpoints;
    std::vector<route_config> routes;
    manager_config manager;
    worker_config worker;
    tool_config tools;
    logging_config logging;

    /**
     * @brief Look up a listener by name
     */
    [[nodiscard]] const listener_config* find_listener(
        std::string_view name) const noexcept;

    /**
     * @brief Look up an endpoint by name
     */
    [[nodiscard]] const endpoint* find_endpoint(
        std::string_view name) const noexcept;

    /**
     * @brief Validate the complete configuration
     *
     * Checks required fields, name uniqueness, directory endpoint existence
     * and that every route reference resolves to a declared listener and
     * declared endpoints.
     *
     * @return List of validation errors (empty if valid)
     */
    [[nodiscard]] std::vector<validation_error_info> validate() const;

    /**
     * @brief Check if configuration is valid
     */
    [[nodiscard]] bool is_valid() const { return validate().empty(); }
};

}  // namespace pacs::forward::config

#endif  // PACS_FORWARD_CONFIG_FORWARD_CONFIG_H
