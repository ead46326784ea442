#ifndef PACS_FORWARD_DELIVERY_ENDPOINT_DELIVERY_H
#define PACS_FORWARD_DELIVERY_ENDPOINT_DELIVERY_H

/**
 * @file endpoint_delivery.h
 * @brief Delivery of one stored object to one endpoint
 *
 * A delivery never modifies or removes the source object, whatever the
 * outcome. Retries are the caller's concern: an object that fails stays in
 * the listener's output directory and is picked up again by the next scan.
 */

#include "pacs/forward/config/forward_config.h"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace pacs::forward::delivery {

// =============================================================================
// Error Codes (-960 to -969)
// =============================================================================

/**
 * @brief Delivery error codes
 *
 * Allocated range: -960 to -969
 */
enum class delivery_error : int {
    /** Remote store failed or was refused */
    send_failed = -960,

    /** Sending tool could not be launched */
    tool_unavailable = -961,

    /** Source object does not exist */
    source_not_found = -962,

    /** Destination directory does not exist */
    destination_not_found = -963,

    /** Copy into the destination directory failed */
    copy_failed = -964
};

/**
 * @brief Convert delivery_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(delivery_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of delivery error
 */
[[nodiscard]] constexpr const char* to_string(delivery_error error) noexcept {
    switch (error) {
        case delivery_error::send_failed:
            return "Failed to send object to network endpoint";
        case delivery_error::tool_unavailable:
            return "Sending tool is not available";
        case delivery_error::source_not_found:
            return "Source object not found";
        case delivery_error::destination_not_found:
            return "Destination directory not found";
        case delivery_error::copy_failed:
            return "Failed to copy object to directory endpoint";
        default:
            return "Unknown delivery error";
    }
}

using delivery_result = std::expected<void, delivery_error>;

// =============================================================================
// Network Delivery
// =============================================================================

/**
 * @brief Sends one object to a remote DICOM receiver
 *
 * Implementations must be safe to call from several pool threads at once.
 */
class network_sender {
public:
    virtual ~network_sender() = default;

    [[nodiscard]] virtual delivery_result send(
        const std::filesystem::path& object,
        const config::network_endpoint& target) = 0;
};

/**
 * @brief network_sender running DCMTK's storescu
 *
 * Runs `storescu -aec <called> -aet <calling> <address> <port> <object>`.
 */
class storescu_sender : public network_sender {
public:
    explicit storescu_sender(std::string executable = "storescu");

    [[nodiscard]] delivery_result send(
        const std::filesystem::path& object,
        const config::network_endpoint& target) override;

private:
    std::string executable_;
};

// =============================================================================
// Directory Delivery
// =============================================================================

/**
 * @brief Copy an object into a directory endpoint
 *
 * The destination is `<target.path>/<object file name>`; an existing file
 * of that name is replaced. Bytes go to a temporary sibling first and are
 * renamed into place, so the destination never holds a partial copy.
 */
[[nodiscard]] delivery_result copy_to_directory(
    const std::filesystem::path& object,
    const config::directory_endpoint& target);

// =============================================================================
// Dispatcher
// =============================================================================

/**
 * @brief Routes a delivery to the primitive matching the endpoint kind
 */
class endpoint_dispatcher {
public:
    explicit endpoint_dispatcher(std::shared_ptr<network_sender> sender);

    [[nodiscard]] delivery_result deliver(const std::filesystem::path& object,
                                          const config::endpoint& target) const;

private:
    std::shared_ptr<network_sender> sender_;
};

}  // namespace pacs::forward::delivery

#endif  // PACS_FORWARD_DELIVERY_ENDPOINT_DELIVERY_H
