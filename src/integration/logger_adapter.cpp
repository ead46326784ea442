/**
 * @file logger_adapter.cpp
 * @brief Implementation of logger adapter for pacs_forward
 *
 * Three adapters share the logger_adapter interface:
 *   - console_logger_adapter: the process-wide default, one line per record
 *   - ilogger_adapter: forwards to common_system's ILogger
 *   - scoped_logger_adapter: tags records with a category (usually a route
 *     name) and writes through whatever global logger is installed
 *
 * get_logger() hands out a global_logger that forwards to the installed
 * adapter.
 *
 * @see include/pacs/forward/integration/logger_adapter.h
 */

#include "pacs/forward/integration/logger_adapter.h"

#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace pacs::forward::integration {

namespace {

namespace kci = kcenon::common::interfaces;

// =============================================================================
// Level Table
// =============================================================================

struct level_traits {
    log_level level;
    kci::log_level kcenon;
    std::string_view label;
};

// Indexed by log_level
constexpr std::array<level_traits, 6> k_levels{{
    {log_level::trace, kci::log_level::trace, "TRACE"},
    {log_level::debug, kci::log_level::debug, "DEBUG"},
    {log_level::info, kci::log_level::info, "INFO"},
    {log_level::warning, kci::log_level::warning, "WARN"},
    {log_level::error, kci::log_level::error, "ERROR"},
    {log_level::critical, kci::log_level::critical, "CRIT"},
}};

const level_traits& traits_of(log_level level) {
    auto index = static_cast<size_t>(level);
    return index < k_levels.size() ? k_levels[index] : k_levels[2];
}

log_level from_kcenon_level(kci::log_level level) {
    if (level == kci::log_level::off) {
        return log_level::critical;
    }
    for (const auto& entry : k_levels) {
        if (entry.kcenon == level) {
            return entry.level;
        }
    }
    return log_level::info;
}

// =============================================================================
// Console Output
// =============================================================================

// Shared by every console writer so records from concurrent routes never
// interleave within a line.
std::mutex g_console_mutex;

void write_console(log_level level, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm local_time{};
    localtime_r(&time, &local_time);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local_time);

    std::ostringstream tid;
    tid << std::this_thread::get_id();

    auto line = std::format("{}.{:03} [{:<5}] [{}] {}\n", stamp, ms.count(),
                            traits_of(level).label, tid.str(), message);

    std::lock_guard<std::mutex> lock(g_console_mutex);
    auto& stream = (level >= log_level::error) ? std::cerr : std::cout;
    stream << line;
}

}  // namespace

// =============================================================================
// console_logger_adapter
// =============================================================================

/**
 * @class console_logger_adapter
 * @brief Default daemon logger
 *
 * Errors and above go to stderr, everything else to stdout.
 */
class console_logger_adapter : public logger_adapter {
public:
    void log(log_level level, std::string_view message) override {
        if (is_enabled(level)) {
            write_console(level, message);
        }
    }

    void set_level(log_level level) override { level_ = level; }

    [[nodiscard]] log_level get_level() const noexcept override { return level_; }

    void flush() override {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::atomic<log_level> level_{log_level::info};
};

// =============================================================================
// ilogger_adapter
// =============================================================================

/**
 * @class ilogger_adapter
 * @brief Forwards records to common_system's ILogger
 *
 * The minimum level is read from the wrapped logger once and mirrored
 * locally afterwards. Records the ILogger refuses fall back to stderr.
 */
class ilogger_adapter : public logger_adapter {
public:
    explicit ilogger_adapter(std::shared_ptr<kci::ILogger> logger)
        : logger_(std::move(logger)) {
        if (logger_) {
            level_ = from_kcenon_level(logger_->get_level());
        }
    }

    void log(log_level level, std::string_view message) override {
        if (!logger_ || !is_enabled(level)) {
            return;
        }
        if (logger_->log(traits_of(level).kcenon, message).is_err()) {
            write_console(level, message);
        }
    }

    void set_level(log_level level) override {
        level_ = level;
        if (logger_ && logger_->set_level(traits_of(level).kcenon).is_err()) {
            write_console(log_level::warning, "ILogger rejected level change");
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override { return level_; }

    void flush() override {
        if (logger_ && logger_->flush().is_err()) {
            write_console(log_level::warning, "ILogger flush failed");
        }
    }

private:
    std::shared_ptr<kci::ILogger> logger_;
    std::atomic<log_level> level_{log_level::info};
};

// =============================================================================
// scoped_logger_adapter
// =============================================================================

/**
 * @class scoped_logger_adapter
 * @brief Prefixes records with "[category] " and hands them to get_logger()
 *
 * Its own level can only narrow the global one: get_level() is the
 * stricter of the two.
 */
class scoped_logger_adapter : public logger_adapter {
public:
    explicit scoped_logger_adapter(std::string_view category)
        : prefix_(std::format("[{}] ", category)) {}

    void log(log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }
        get_logger().log(level, prefix_ + std::string(message));
    }

    void set_level(log_level level) override { own_level_ = level; }

    [[nodiscard]] log_level get_level() const noexcept override {
        return std::max(own_level_.load(), get_logger().get_level());
    }

    void flush() override { get_logger().flush(); }

private:
    std::string prefix_;
    std::atomic<log_level> own_level_{log_level::trace};
};

// =============================================================================
// Global Logger Instance
// =============================================================================

/**
 * @class global_logger
 * @brief Stable handle returned by get_logger()
 *
 * Never destroyed; installing or resetting the default logger only swaps
 * the target. Each record holds its own reference to the target, so a
 * replacement cannot free an adapter that is still writing.
 */
class global_logger : public logger_adapter {
public:
    void log(log_level level, std::string_view message) override {
        current()->log(level, message);
    }

    void set_level(log_level level) override { current()->set_level(level); }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current()->get_level();
    }

    void flush() override { current()->flush(); }

    void replace(std::shared_ptr<logger_adapter> target) {
        std::lock_guard<std::mutex> lock(mutex_);
        target_ = std::move(target);
    }

private:
    std::shared_ptr<logger_adapter> current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!target_) {
            target_ = std::make_shared<console_logger_adapter>();
        }
        return target_;
    }

    mutable std::mutex mutex_;
    mutable std::shared_ptr<logger_adapter> target_;
};

namespace {

global_logger& global_instance() {
    static auto* instance = new global_logger();
    return *instance;
}

}  // namespace

logger_adapter& get_logger() {
    return global_instance();
}

std::unique_ptr<logger_adapter> create_logger(std::string_view category) {
    return std::make_unique<scoped_logger_adapter>(category);
}

std::unique_ptr<logger_adapter> create_logger(std::shared_ptr<kci::ILogger> logger) {
    return std::make_unique<ilogger_adapter>(std::move(logger));
}

void set_default_logger(std::shared_ptr<kci::ILogger> logger) {
    global_instance().replace(std::make_shared<ilogger_adapter>(std::move(logger)));
}

void reset_default_logger() {
    global_instance().replace(nullptr);
}

}  // namespace pacs::forward::integration
