/**
 * @file route_worker.cpp
 * @brief Scan, fan-out and completion loop for one route
 */

#include "pacs/forward/relay/route_worker.h"

#include "pacs/forward/integration/logger_adapter.h"
#include "pacs/forward/integration/thread_adapter.h"

#include <algorithm>
#include <format>
#include <future>

namespace pacs::forward::relay {

worker_options worker_options::from_config(
    const config::worker_config& config) noexcept {
    return worker_options{.buffer_size = config.buffer_size,
                          .minimum_age = config.minimum_age,
                          .idle_backoff = config.idle_backoff,
                          .max_parallel_deliveries =
                              config.max_parallel_deliveries};
}

// =============================================================================
// Scanning
// =============================================================================

bool is_eligible(const std::filesystem::directory_entry& entry,
                 std::chrono::milliseconds minimum_age,
                 std::filesystem::file_time_type now) {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) {
        return false;
    }
    auto modified = entry.last_write_time(ec);
    if (ec) {
        return false;
    }
    return modified < now - minimum_age;
}

std::vector<std::filesystem::path> collect_eligible_files(
    const std::filesystem::path& dir, std::chrono::milliseconds minimum_age,
    size_t limit, size_t* scan_errors) {
    std::vector<std::filesystem::path> result;
    auto& logger = integration::get_logger();
    const auto now = std::filesystem::file_time_type::clock::now();

    auto skip = [&](const std::filesystem::path& where, const std::error_code& ec) {
        logger.warning(std::format("Skipping {} while scanning {}: {}",
                                   where.string(), dir.string(), ec.message()));
        if (scan_errors != nullptr) {
            ++*scan_errors;
        }
    };

    // Depth-first; an unreadable directory is skipped, its siblings are not
    std::vector<std::filesystem::path> pending{dir};
    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        std::filesystem::directory_iterator it(current, ec);
        if (ec) {
            skip(current, ec);
            continue;
        }

        // A failed increment may leave the iterator at end, so ec is tested first
        for (std::filesystem::directory_iterator end; !ec && it != end;
             it.increment(ec)) {
            std::error_code type_ec;
            auto status = it->symlink_status(type_ec);
            if (!type_ec && std::filesystem::is_directory(status)) {
                pending.push_back(it->path());
                continue;
            }

            if (is_eligible(*it, minimum_age, now)) {
                result.push_back(it->path());
                if (limit != 0 && result.size() >= limit) {
                    return result;
                }
            }
        }
        if (ec) {
            skip(current, ec);
        }
    }
    return result;
}

// =============================================================================
// route_worker
// =============================================================================

route_worker::route_worker(route r, worker_options options,
                           std::shared_ptr<delivery::network_sender> sender,
                           std::shared_ptr<stop_channel> channel)
    : route_(std::move(r)),
      options_(options),
      dispatcher_(std::move(sender)),
      channel_(std::move(channel)),
      pool_(integration::create_thread_adapter()),
      logger_(integration::create_logger("route " + route_.name)) {}

route_worker::~route_worker() {
    shutdown();
}

bool route_worker::start() {
    integration::worker_pool_config pool_config;
    pool_config.name = "route_" + route_.name;
    pool_config.thread_count = std::max<size_t>(options_.max_parallel_deliveries, 1);
    if (!pool_->initialize(pool_config)) {
        logger_->error("Unable to start delivery pool");
        return false;
    }
    return true;
}

void route_worker::shutdown() {
    if (!pool_) {
        return;
    }
    if (auto pending = pool_->in_flight(); pending > 0) {
        logger_->info(std::format("Waiting for {} delivery task(s)", pending));
    }
    pool_->shutdown(true);
}

void route_worker::run() {
    logger_->info(std::format("Worker started, watching {}",
                              route_.source_dir.string()));

    while (!channel_->stop_requested()) {
        auto objects = scan();

        if (channel_->stop_requested()) {
            break;
        }

        if (objects.empty()) {
            if (channel_->wait_for(options_.idle_backoff)) {
                break;
            }
            continue;
        }

        process(objects);
    }

    logger_->info("Worker stopped");
}

cycle_result route_worker::run_cycle() {
    auto objects = scan();
    return process(objects);
}

std::vector<std::filesystem::path> route_worker::scan() {
    size_t errors = 0;
    auto objects = collect_eligible_files(route_.source_dir, options_.minimum_age,
                                          options_.buffer_size, &errors);
    cycles_.fetch_add(1, std::memory_order_relaxed);
    scan_errors_.fetch_add(errors, std::memory_order_relaxed);
    if (!objects.empty()) {
        logger_->debug(std::format("{} object(s) ready", objects.size()));
    }
    return objects;
}

cycle_result route_worker::process(
    const std::vector<std::filesystem::path>& objects) {
    cycle_result result;
    result.collected = objects.size();

    // One pool task per (object, endpoint) pair
    std::vector<std::vector<std::future<delivery::delivery_result>>> pending;
    pending.reserve(objects.size());
    for (const auto& object : objects) {
        auto& futures = pending.emplace_back();
        futures.reserve(route_.endpoints.size());
        for (const auto& ep : route_.endpoints) {
            futures.push_back(pool_->submit(
                [this, object, &ep]() { return dispatcher_.deliver(object, ep); }));
        }
    }

    for (size_t i = 0; i < objects.size(); ++i) {
        bool all_delivered = true;
        for (size_t j = 0; j < pending[i].size(); ++j) {
            const auto& name = config::endpoint_name(route_.endpoints[j]);
            try {
                auto outcome = pending[i][j].get();
                if (!outcome) {
                    all_delivered = false;
                    endpoint_failures_.fetch_add(1, std::memory_order_relaxed);
                    logger_->warning(std::format(
                        "Delivery of {} to {} failed: {}", objects[i].string(),
                        name, delivery::to_string(outcome.error())));
                }
            } catch (const std::future_error& e) {
                all_delivered = false;
                endpoint_failures_.fetch_add(1, std::memory_order_relaxed);
                logger_->error(std::format(
                    "Delivery of {} to {} was not executed: {}",
                    objects[i].string(), name, e.what()));
            } catch (const std::exception& e) {
                all_delivered = false;
                endpoint_failures_.fetch_add(1, std::memory_order_relaxed);
                logger_->error(std::format("Delivery of {} to {} threw: {}",
                                           objects[i].string(), name, e.what()));
            }
        }

        if (!all_delivered) {
            ++result.failed;
            objects_failed_.fetch_add(1, std::memory_order_relaxed);
            logger_->error(std::format(
                "{} was not delivered to every endpoint, keeping it",
                objects[i].string()));
            continue;
        }

        ++result.delivered;
        objects_delivered_.fetch_add(1, std::memory_order_relaxed);

        std::error_code ec;
        if (std::filesystem::remove(objects[i], ec)) {
            ++result.removed;
            logger_->debug(std::format("Forwarded {}", objects[i].string()));
        } else {
            remove_failures_.fetch_add(1, std::memory_order_relaxed);
            logger_->error(std::format("Unable to remove {}: {}",
                                       objects[i].string(),
                                       ec ? ec.message() : "file vanished"));
        }
    }
    return result;
}

worker_statistics route_worker::get_statistics() const noexcept {
    return worker_statistics{
        .cycles = cycles_.load(std::memory_order_relaxed),
        .objects_delivered = objects_delivered_.load(std::memory_order_relaxed),
        .objects_failed = objects_failed_.load(std::memory_order_relaxed),
        .endpoint_failures = endpoint_failures_.load(std::memory_order_relaxed),
        .remove_failures = remove_failures_.load(std::memory_order_relaxed),
        .scan_errors = scan_errors_.load(std::memory_order_relaxed)};
}

}  // namespace pacs::forward::relay
