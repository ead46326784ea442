#ifndef PACS_FORWARD_INTEGRATION_LOGGER_ADAPTER_H
#define PACS_FORWARD_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Integration Module - Logger system adapter
 *
 * Provides leveled logging for relay operations. The process-wide logger
 * writes timestamped lines to the console unless an ILogger from
 * common_system is installed with set_default_logger(). Route workers log
 * through category loggers so every line names its route.
 */

#include <memory>
#include <string>
#include <string_view>

namespace kcenon::common::interfaces {
class ILogger;
}  // namespace kcenon::common::interfaces

namespace pacs::forward::integration {

/**
 * @brief Log levels
 */
enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

/**
 * @brief Logger adapter interface
 */
class logger_adapter {
public:
    virtual ~logger_adapter() = default;

    /**
     * @brief Log a message at specified level
     * @param level Log level
     * @param message Log message
     */
    virtual void log(log_level level, std::string_view message) = 0;

    void trace(std::string_view message) { log(log_level::trace, message); }

    void debug(std::string_view message) { log(log_level::debug, message); }

    void info(std::string_view message) { log(log_level::info, message); }

    void warning(std::string_view message) { log(log_level::warning, message); }

    void error(std::string_view message) { log(log_level::error, message); }

    void critical(std::string_view message) {
        log(log_level::critical, message);
    }

    /**
     * @brief Set minimum log level
     * @param level Minimum level to log
     */
    virtual void set_level(log_level level) = 0;

    /**
     * @brief Get current log level
     */
    [[nodiscard]] virtual log_level get_level() const noexcept = 0;

    /**
     * @brief Check whether a message at this level would be written
     */
    [[nodiscard]] bool is_enabled(log_level level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(get_level());
    }

    /**
     * @brief Flush pending log entries
     */
    virtual void flush() = 0;
};

/**
 * @brief Get the global logger instance
 *
 * The returned reference stays valid for the life of the process and
 * follows later set_default_logger() and reset_default_logger() calls.
 */
[[nodiscard]] logger_adapter& get_logger();

/**
 * @brief Create a logger tagging every record with @p category
 *
 * Records are written through get_logger(), so installing an ILogger with
 * set_default_logger() also redirects category loggers created earlier.
 * set_level() on the result can only raise the threshold.
 *
 * @param category Tag such as "route CT_1"
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view category);

/**
 * @brief Create a logger that forwards to a common_system ILogger
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Replace the global logger with an ILogger-backed adapter
 */
void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Drop the installed logger; the next record goes to a fresh
 *        console logger
 */
void reset_default_logger();

}  // namespace pacs::forward::integration

#endif  // PACS_FORWARD_INTEGRATION_LOGGER_ADAPTER_H
