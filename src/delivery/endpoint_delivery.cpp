/**
 * @file endpoint_delivery.cpp
 * @brief Network and directory delivery primitives
 */

#include "pacs/forward/delivery/endpoint_delivery.h"

#include "pacs/forward/integration/logger_adapter.h"
#include "pacs/forward/integration/process_runner.h"

#include <atomic>
#include <format>
#include <type_traits>
#include <unistd.h>

namespace pacs::forward::delivery {

namespace {

std::atomic<unsigned long> g_temp_counter{0};

[[nodiscard]] std::filesystem::path temporary_sibling(
    const std::filesystem::path& destination) {
    auto name = std::format(".{}.{}.{}.part", destination.filename().string(),
                            ::getpid(), g_temp_counter.fetch_add(1));
    return destination.parent_path() / name;
}

}  // namespace

// =============================================================================
// storescu_sender
// =============================================================================

storescu_sender::storescu_sender(std::string executable)
    : executable_(std::move(executable)) {}

delivery_result storescu_sender::send(const std::filesystem::path& object,
                                      const config::network_endpoint& target) {
    auto& logger = integration::get_logger();
    logger.trace(std::format("Sending {} to endpoint {}", object.string(),
                             target.name));

    auto status = integration::run_command(
        {executable_, "-aec", target.called_ae, "-aet", target.calling_ae,
         target.address, std::to_string(target.port), object.string()});

    if (!status) {
        logger.error(std::format("Unable to run {} for endpoint {}: {}",
                                 executable_, target.name,
                                 integration::to_string(status.error())));
        return std::unexpected(
            status.error() == integration::process_error::executable_not_found ||
                    status.error() == integration::process_error::spawn_failed
                ? delivery_error::tool_unavailable
                : delivery_error::send_failed);
    }
    if (*status != 0) {
        logger.error(std::format(
            "Failed to send {} to endpoint {} ({}:{}): {} exited with {}",
            object.string(), target.name, target.address, target.port,
            executable_, *status));
        return std::unexpected(delivery_error::send_failed);
    }

    logger.trace(std::format("Sent {} to endpoint {}", object.string(),
                             target.name));
    return {};
}

// =============================================================================
// copy_to_directory
// =============================================================================

delivery_result copy_to_directory(const std::filesystem::path& object,
                                  const config::directory_endpoint& target) {
    auto& logger = integration::get_logger();
    std::error_code ec;

    if (!std::filesystem::is_regular_file(object, ec)) {
        logger.error(std::format("Source object {} does not exist",
                                 object.string()));
        return std::unexpected(delivery_error::source_not_found);
    }
    if (!std::filesystem::is_directory(target.path, ec)) {
        logger.error(std::format("Directory endpoint {} path {} does not exist",
                                 target.name, target.path));
        return std::unexpected(delivery_error::destination_not_found);
    }

    auto destination = std::filesystem::path(target.path) / object.filename();
    auto temp = temporary_sibling(destination);

    std::filesystem::copy_file(object, temp,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
        logger.error(std::format("Failed to copy {} to directory endpoint {}: {}",
                                 object.string(), target.name, ec.message()));
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return std::unexpected(delivery_error::copy_failed);
    }

    std::filesystem::rename(temp, destination, ec);
    if (ec) {
        logger.error(std::format("Failed to move copy into {}: {}",
                                 destination.string(), ec.message()));
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return std::unexpected(delivery_error::copy_failed);
    }

    logger.trace(std::format("Copied {} to {}", object.string(),
                             destination.string()));
    return {};
}

// =============================================================================
// endpoint_dispatcher
// =============================================================================

endpoint_dispatcher::endpoint_dispatcher(std::shared_ptr<network_sender> sender)
    : sender_(std::move(sender)) {}

delivery_result endpoint_dispatcher::deliver(const std::filesystem::path& object,
                                             const config::endpoint& target) const {
    return std::visit(
        [&](const auto& ep) -> delivery_result {
            using T = std::decay_t<decltype(ep)>;
            if constexpr (std::is_same_v<T, config::network_endpoint>) {
                if (!sender_) {
                    return std::unexpected(delivery_error::tool_unavailable);
                }
                return sender_->send(object, ep);
            } else {
                return copy_to_directory(object, ep);
            }
        },
        target);
}

}  // namespace pacs::forward::delivery
