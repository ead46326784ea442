#ifndef PACS_FORWARD_INTEGRATION_PROCESS_RUNNER_H
#define PACS_FORWARD_INTEGRATION_PROCESS_RUNNER_H

/**
 * @file process_runner.h
 * @brief Integration Module - External tool execution
 *
 * Runs the DCMTK command-line tools (storescp, storescu, echoscu) as child
 * processes. Children inherit the relay's standard streams.
 */

#include <sys/types.h>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pacs::forward::integration {

// =============================================================================
// Error Codes (-980 to -989)
// =============================================================================

/**
 * @brief Process execution error codes
 *
 * Allocated range: -980 to -989
 */
enum class process_error : int {
    /** Executable is not on PATH */
    executable_not_found = -980,

    /** fork() or exec() failed */
    spawn_failed = -981,

    /** waitpid() failed */
    wait_failed = -982,

    /** Signal could not be delivered */
    signal_failed = -983,

    /** Child terminated by a signal */
    abnormal_exit = -984
};

/**
 * @brief Convert process_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(process_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of process error
 */
[[nodiscard]] constexpr const char* to_string(process_error error) noexcept {
    switch (error) {
        case process_error::executable_not_found:
            return "Executable not found on PATH";
        case process_error::spawn_failed:
            return "Failed to spawn process";
        case process_error::wait_failed:
            return "Failed to wait for process";
        case process_error::signal_failed:
            return "Failed to signal process";
        case process_error::abnormal_exit:
            return "Process terminated abnormally";
        default:
            return "Unknown process error";
    }
}

/**
 * @brief Locate an executable
 *
 * Names containing '/' are checked directly; other names are searched in
 * the directories of $PATH.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_executable(
    std::string_view name);

/**
 * @brief Handle to a running child process
 *
 * Move-only. A handle still owning a process when destroyed kills and
 * reaps it.
 */
class child_process {
public:
    child_process() = default;
    explicit child_process(pid_t pid) noexcept : pid_(pid) {}
    ~child_process();

    child_process(const child_process&) = delete;
    child_process& operator=(const child_process&) = delete;
    child_process(child_process&& other) noexcept;
    child_process& operator=(child_process&& other) noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /**
     * @brief Check whether the handle owns an unreaped process
     */
    [[nodiscard]] bool valid() const noexcept { return pid_ > 0; }

    /**
     * @brief Check without blocking whether the process is still alive
     */
    [[nodiscard]] bool running();

    /**
     * @brief Block until the process exits
     * @return Exit status of the process
     */
    [[nodiscard]] std::expected<int, process_error> wait();

    /**
     * @brief Send SIGKILL and reap the process
     */
    [[nodiscard]] std::expected<void, process_error> kill();

private:
    pid_t pid_ = -1;
};

/**
 * @brief Start a command without waiting for it
 * @param argv Program name followed by its arguments
 */
[[nodiscard]] std::expected<child_process, process_error> spawn_command(
    const std::vector<std::string>& argv);

/**
 * @brief Run a command to completion
 * @param argv Program name followed by its arguments
 * @return Exit status of the command
 */
[[nodiscard]] std::expected<int, process_error> run_command(
    const std::vector<std::string>& argv);

}  // namespace pacs::forward::integration

#endif  // PACS_FORWARD_INTEGRATION_PROCESS_RUNNER_H
