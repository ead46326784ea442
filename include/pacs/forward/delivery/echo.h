#ifndef PACS_FORWARD_DELIVERY_ECHO_H
#define PACS_FORWARD_DELIVERY_ECHO_H

/**
 * @file echo.h
 * @brief C-ECHO verification of network endpoints via echoscu
 */

#include "pacs/forward/config/forward_config.h"

#include <expected>
#include <string>

namespace pacs::forward::delivery {

// =============================================================================
// Error Codes (-970 to -979)
// =============================================================================

/**
 * @brief Echo verification error codes
 *
 * Allocated range: -970 to -979
 */
enum class echo_error : int {
    /** echoscu rejected its command line (exit 1) */
    syntax_error = -970,

    /** echoscu could not initialise the network (exit 60) */
    network_init_failed = -971,

    /** Association was aborted (exit 70) */
    association_aborted = -972,

    /** Any other non-zero exit */
    other = -973,

    /** echoscu could not be launched */
    tool_unavailable = -974
};

/**
 * @brief Convert echo_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(echo_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of echo error
 */
[[nodiscard]] constexpr const char* to_string(echo_error error) noexcept {
    switch (error) {
        case echo_error::syntax_error:
            return "echoscu command line syntax error";
        case echo_error::network_init_failed:
            return "Cannot initialise network";
        case echo_error::association_aborted:
            return "Association aborted";
        case echo_error::other:
            return "C-ECHO failed";
        case echo_error::tool_unavailable:
            return "echoscu is not available";
        default:
            return "Unknown echo error";
    }
}

/**
 * @brief Map an echoscu exit status to the echo outcome
 */
[[nodiscard]] std::expected<void, echo_error> map_echo_exit_code(int code) noexcept;

/**
 * @brief Send a C-ECHO to a network endpoint
 *
 * Runs `echoscu -q -aet <calling> -aec <called> <address> <port>`.
 */
[[nodiscard]] std::expected<void, echo_error> verify_endpoint(
    const config::network_endpoint& target,
    const std::string& executable = "echoscu");

}  // namespace pacs::forward::delivery

#endif  // PACS_FORWARD_DELIVERY_ECHO_H
