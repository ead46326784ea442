/**
 * @file echo.cpp
 * @brief C-ECHO verification through echoscu
 */

#include "pacs/forward/delivery/echo.h"

#include "pacs/forward/integration/logger_adapter.h"
#include "pacs/forward/integration/process_runner.h"

#include <format>

namespace pacs::forward::delivery {

std::expected<void, echo_error> map_echo_exit_code(int code) noexcept {
    switch (code) {
        case 0:
            return {};
        case 1:
            return std::unexpected(echo_error::syntax_error);
        case 60:
            return std::unexpected(echo_error::network_init_failed);
        case 70:
            return std::unexpected(echo_error::association_aborted);
        default:
            return std::unexpected(echo_error::other);
    }
}

std::expected<void, echo_error> verify_endpoint(
    const config::network_endpoint& target, const std::string& executable) {
    auto& logger = integration::get_logger();

    auto status = integration::run_command(
        {executable, "-q", "-aet", target.calling_ae, "-aec", target.called_ae,
         target.address, std::to_string(target.port)});
    if (!status) {
        logger.error(std::format("Unable to execute {}: {}", executable,
                                 integration::to_string(status.error())));
        return std::unexpected(
            status.error() == integration::process_error::abnormal_exit
                ? echo_error::other
                : echo_error::tool_unavailable);
    }

    auto result = map_echo_exit_code(*status);
    if (!result) {
        logger.warning(std::format("C-ECHO to {} ({}:{}) failed: {}", target.name,
                                   target.address, target.port,
                                   to_string(result.error())));
    } else {
        logger.debug(std::format("C-ECHO to {} succeeded", target.name));
    }
    return result;
}

}  // namespace pacs::forward::delivery
