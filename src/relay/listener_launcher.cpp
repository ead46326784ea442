/**
 * @file listener_launcher.cpp
 * @brief storescp process management
 */

#include "pacs/forward/relay/listener_launcher.h"

#include "pacs/forward/integration/logger_adapter.h"

#include <format>

namespace pacs::forward::relay {

storescp_launcher::storescp_launcher(std::string executable)
    : executable_(std::move(executable)) {}

std::expected<listener_handle, integration::process_error>
storescp_launcher::start(const config::listener_config& listener) {
    auto& logger = integration::get_logger();

    if (!integration::find_executable(executable_)) {
        logger.error(std::format("{} is not installed or not on PATH",
                                 executable_));
        return std::unexpected(integration::process_error::executable_not_found);
    }

    auto child = integration::spawn_command(
        {executable_, "-aet", listener.ae_title, "-od", listener.output_dir,
         std::to_string(listener.port)});
    if (!child) {
        logger.error(std::format("Unable to start listener {}: {}", listener.name,
                                 integration::to_string(child.error())));
        return std::unexpected(child.error());
    }

    logger.info(std::format("Listener {} ({}) on port {} writing to {}, pid {}",
                            listener.name, listener.ae_title, listener.port,
                            listener.output_dir, child->pid()));
    return listener_handle{.name = listener.name, .process = std::move(*child)};
}

std::expected<void, integration::process_error> storescp_launcher::stop(
    listener_handle& handle) {
    auto result = handle.process.kill();
    if (!result) {
        integration::get_logger().error(
            std::format("Unable to kill listener {}: {}", handle.name,
                        integration::to_string(result.error())));
        return result;
    }
    integration::get_logger().info(
        std::format("Listener {} stopped", handle.name));
    return {};
}

}  // namespace pacs::forward::relay
