/**
 * @file endpoint_manager.cpp
 * @brief Listener and worker lifecycle
 */

#include "pacs/forward/relay/endpoint_manager.h"

#include "pacs/forward/integration/logger_adapter.h"

#include <atomic>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>

namespace pacs::forward::relay {

// =============================================================================
// Implementation
// =============================================================================

class endpoint_manager::impl {
public:
    impl(config::forward_config config, manager_dependencies deps)
        : config_(std::move(config)), deps_(std::move(deps)) {
        if (!deps_.launcher) {
            deps_.launcher =
                std::make_shared<storescp_launcher>(config_.tools.storescp);
        }
        if (!deps_.sender) {
            deps_.sender =
                std::make_shared<delivery::storescu_sender>(config_.tools.storescu);
        }
        if (!deps_.channel_factory) {
            deps_.channel_factory =
                std::make_shared<default_stop_channel_factory>();
        }
    }

    ~impl() {
        if (running_.load(std::memory_order_acquire)) {
            auto result = stop();
            if (!result) {
                integration::get_logger().error(
                    std::format("Shutdown during destruction: {}",
                                to_string(result.error())));
            }
        }
    }

    std::expected<void, manager_error> start() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& logger = integration::get_logger();

        if (running_.load(std::memory_order_acquire)) {
            return std::unexpected(manager_error::already_running);
        }

        auto errors = config_.validate();
        if (!errors.empty()) {
            for (const auto& e : errors) {
                logger.error(std::format("Invalid configuration: {}: {}",
                                         e.field_path, e.message));
            }
            return std::unexpected(manager_error::invalid_configuration);
        }

        auto table = build_routes(config_);
        if (!table) {
            return std::unexpected(manager_error::invalid_configuration);
        }

        if (auto result = start_listeners(); !result) {
            return result;
        }

        routes_ = std::move(*table);
        if (auto result = start_workers(); !result) {
            shutdown_workers();
            rollback_listeners();
            routes_.clear();
            return result;
        }

        running_.store(true, std::memory_order_release);
        logger.info(std::format("Relay started: {} listener(s), {} route(s)",
                                listeners_.size(), routes_.size()));
        return {};
    }

    std::expected<void, manager_error> stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& logger = integration::get_logger();

        if (!running_.load(std::memory_order_acquire)) {
            return std::unexpected(manager_error::not_running);
        }

        bool listeners_ok = stop_listeners();

        // Bounded signalling rounds; a failed send is retried next round
        std::vector<bool> acknowledged(workers_.size(), false);
        size_t remaining = workers_.size();
        for (size_t attempt = 0;
             attempt < config_.manager.max_stop_attempts && remaining > 0;
             ++attempt) {
            for (size_t i = 0; i < workers_.size(); ++i) {
                if (acknowledged[i]) {
                    continue;
                }
                auto sent = workers_[i].channel->send_stop();
                if (sent) {
                    acknowledged[i] = true;
                    --remaining;
                } else {
                    logger.debug(std::format(
                        "Stop signal to route {} failed (attempt {}): {}",
                        workers_[i].worker->get_route().name, attempt + 1,
                        to_string(sent.error())));
                }
            }
        }

        for (size_t i = 0; i < workers_.size(); ++i) {
            if (!acknowledged[i]) {
                logger.error(std::format(
                    "Route {} did not accept the stop signal after {} attempts",
                    workers_[i].worker->get_route().name,
                    config_.manager.max_stop_attempts));
            }
        }

        shutdown_workers();
        running_.store(false, std::memory_order_release);
        logger.info("Relay stopped");

        if (remaining > 0) {
            return std::unexpected(manager_error::workers_not_stopped);
        }
        if (!listeners_ok) {
            return std::unexpected(manager_error::listener_stop_failed);
        }
        return {};
    }

    bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::vector<route> routes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return routes_;
    }

    std::vector<route_statistics> get_statistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (workers_.empty()) {
            return last_statistics_;
        }
        return collect_statistics();
    }

    const config::forward_config& config() const noexcept { return config_; }

private:
    struct running_worker {
        std::shared_ptr<stop_channel> channel;
        std::unique_ptr<route_worker> worker;
        std::thread thread;
    };

    std::expected<void, manager_error> start_listeners() {
        auto& logger = integration::get_logger();

        for (const auto& listener : config_.listeners) {
            std::error_code ec;
            std::filesystem::create_directories(listener.output_dir, ec);
            if (ec) {
                logger.error(std::format("Unable to create output directory {}: {}",
                                         listener.output_dir, ec.message()));
                rollback_listeners();
                return std::unexpected(manager_error::listener_start_failed);
            }

            auto handle = deps_.launcher->start(listener);
            if (!handle) {
                logger.error(std::format("Listener {} failed to start: {}",
                                         listener.name,
                                         integration::to_string(handle.error())));
                rollback_listeners();
                return std::unexpected(manager_error::listener_start_failed);
            }
            listeners_.push_back(std::move(*handle));
        }
        return {};
    }

    /**
     * @return false if any listener failed to stop
     */
    bool stop_listeners() {
        bool ok = true;
        for (auto& handle : listeners_) {
            if (auto result = deps_.launcher->stop(handle); !result) {
                ok = false;
            }
        }
        listeners_.clear();
        return ok;
    }

    void rollback_listeners() {
        if (!stop_listeners()) {
            integration::get_logger().warning(
                "Some listeners could not be stopped while rolling back start");
        }
    }

    /**
     * @brief Spawn one worker thread per route
     *
     * On failure the workers already running stay in workers_ so the caller
     * can join them through shutdown_workers().
     */
    std::expected<void, manager_error> start_workers() {
        const auto options = worker_options::from_config(config_.worker);

        try {
            // push_back below must not throw once a thread is running
            workers_.reserve(routes_.size());
            for (const auto& r : routes_) {
                running_worker entry;
                entry.channel = deps_.channel_factory->create(r.name);
                entry.worker = std::make_unique<route_worker>(r, options, deps_.sender,
                                                              entry.channel);
                if (!entry.worker->start()) {
                    return std::unexpected(manager_error::worker_start_failed);
                }
                auto* worker = entry.worker.get();
                entry.thread = std::thread([worker] { worker->run(); });
                workers_.push_back(std::move(entry));
            }
        } catch (const std::exception& e) {
            integration::get_logger().error(std::format(
                "Unable to start worker {} of {}: {}", workers_.size() + 1,
                routes_.size(), e.what()));
            return std::unexpected(manager_error::worker_start_failed);
        }
        return {};
    }

    /**
     * @brief Close every channel, join every thread, drop the workers
     */
    void shutdown_workers() {
        for (auto& w : workers_) {
            w.channel->close();
        }
        for (auto& w : workers_) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
            w.worker->shutdown();
        }
        last_statistics_ = collect_statistics();
        workers_.clear();
    }

    std::vector<route_statistics> collect_statistics() const {
        std::vector<route_statistics> stats;
        stats.reserve(workers_.size());
        for (const auto& w : workers_) {
            stats.push_back({.route_name = w.worker->get_route().name,
                             .worker = w.worker->get_statistics()});
        }
        return stats;
    }

    config::forward_config config_;
    manager_dependencies deps_;

    std::vector<listener_handle> listeners_;
    std::vector<route> routes_;
    std::vector<running_worker> workers_;
    std::vector<route_statistics> last_statistics_;

    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
};

// =============================================================================
// Public Interface
// =============================================================================

endpoint_manager::endpoint_manager(config::forward_config config,
                                   manager_dependencies dependencies)
    : pimpl_(std::make_unique<impl>(std::move(config), std::move(dependencies))) {}

endpoint_manager::~endpoint_manager() = default;

endpoint_manager::endpoint_manager(endpoint_manager&&) noexcept = default;
endpoint_manager& endpoint_manager::operator=(endpoint_manager&&) noexcept = default;

std::expected<void, manager_error> endpoint_manager::start() {
    return pimpl_->start();
}

std::expected<void, manager_error> endpoint_manager::stop() {
    return pimpl_->stop();
}

bool endpoint_manager::is_running() const noexcept {
    return pimpl_->is_running();
}

std::vector<route> endpoint_manager::routes() const {
    return pimpl_->routes();
}

std::vector<route_statistics> endpoint_manager::get_statistics() const {
    return pimpl_->get_statistics();
}

const config::forward_config& endpoint_manager::config() const noexcept {
    return pimpl_->config();
}

}  // namespace pacs::forward::relay
