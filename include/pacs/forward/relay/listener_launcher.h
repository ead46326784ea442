#ifndef PACS_FORWARD_RELAY_LISTENER_LAUNCHER_H
#define PACS_FORWARD_RELAY_LISTENER_LAUNCHER_H

/**
 * @file listener_launcher.h
 * @brief Start and stop of the inbound DICOM listener processes
 */

#include "pacs/forward/config/forward_config.h"
#include "pacs/forward/integration/process_runner.h"

#include <expected>
#include <string>

namespace pacs::forward::relay {

/**
 * @brief A launched listener
 *
 * @c process is empty for launchers that do not spawn a child.
 */
struct listener_handle {
    std::string name;
    integration::child_process process;
};

/**
 * @brief Launches listeners that store received objects in their output
 *        directory
 */
class listener_launcher {
public:
    virtual ~listener_launcher() = default;

    [[nodiscard]] virtual std::expected<listener_handle, integration::process_error>
    start(const config::listener_config& listener) = 0;

    [[nodiscard]] virtual std::expected<void, integration::process_error> stop(
        listener_handle& handle) = 0;
};

/**
 * @brief listener_launcher running DCMTK's storescp
 *
 * Runs `storescp -aet <ae_title> -od <output_dir> <port>` and stops it
 * with SIGKILL.
 */
class storescp_launcher : public listener_launcher {
public:
    explicit storescp_launcher(std::string executable = "storescp");

    [[nodiscard]] std::expected<listener_handle, integration::process_error>
    start(const config::listener_config& listener) override;

    [[nodiscard]] std::expected<void, integration::process_error> stop(
        listener_handle& handle) override;

private:
    std::string executable_;
};

}  // namespace pacs::forward::relay

#endif  // PACS_FORWARD_RELAY_LISTENER_LAUNCHER_H
