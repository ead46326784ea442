/**
 * @file process_runner.cpp
 * @brief fork/exec based child process management
 */

#include "pacs/forward/integration/process_runner.h"

#include "pacs/forward/integration/logger_adapter.h"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <format>
#include <utility>

namespace pacs::forward::integration {

namespace {

[[nodiscard]] bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) &&
           ::access(path.c_str(), X_OK) == 0;
}

[[nodiscard]] std::expected<int, process_error> decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return std::unexpected(process_error::abnormal_exit);
}

[[nodiscard]] std::expected<int, process_error> wait_pid(pid_t pid) {
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        get_logger().error(std::format("waitpid({}) failed: {}", pid,
                                       std::strerror(errno)));
        return std::unexpected(process_error::wait_failed);
    }
    return decode_status(status);
}

}  // namespace

std::optional<std::filesystem::path> find_executable(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path path(name);
        return is_executable_file(path) ? std::optional(path) : std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    if (env_path == nullptr) {
        return std::nullopt;
    }

    std::string_view dirs(env_path);
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        auto candidate =
            std::filesystem::path(dir.empty() ? "." : std::string(dir)) /
            std::string(name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
        if (sep == std::string_view::npos) {
            break;
        }
        dirs.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

// =============================================================================
// child_process
// =============================================================================

child_process::~child_process() {
    if (valid()) {
        auto result = kill();
        if (!result) {
            get_logger().warning(std::format("Unable to reap child {}: {}",
                                             pid_, to_string(result.error())));
        }
    }
}

child_process::child_process(child_process&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)) {}

child_process& child_process::operator=(child_process&& other) noexcept {
    if (this != &other) {
        if (valid()) {
            if (auto result = kill(); !result) {
                get_logger().warning(std::format("Unable to reap child {}: {}",
                                                 pid_, to_string(result.error())));
            }
        }
        pid_ = std::exchange(other.pid_, -1);
    }
    return *this;
}

bool child_process::running() {
    if (!valid()) {
        return false;
    }
    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == 0) {
        return true;
    }
    // Exited (reaped now) or no longer our child
    pid_ = -1;
    return false;
}

std::expected<int, process_error> child_process::wait() {
    if (!valid()) {
        return std::unexpected(process_error::wait_failed);
    }
    auto result = wait_pid(pid_);
    pid_ = -1;
    return result;
}

std::expected<void, process_error> child_process::kill() {
    if (!valid()) {
        return {};
    }
    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        get_logger().error(std::format("kill({}) failed: {}", pid_,
                                       std::strerror(errno)));
        return std::unexpected(process_error::signal_failed);
    }

    auto status = wait_pid(pid_);
    pid_ = -1;
    // A SIGKILLed child reports abnormal_exit; only a failed reap is an error
    if (!status && status.error() == process_error::wait_failed) {
        return std::unexpected(status.error());
    }
    return {};
}

// =============================================================================
// Command execution
// =============================================================================

std::expected<child_process, process_error> spawn_command(
    const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected(process_error::spawn_failed);
    }

    auto executable = find_executable(argv.front());
    if (!executable) {
        get_logger().error(
            std::format("Executable '{}' not found", argv.front()));
        return std::unexpected(process_error::executable_not_found);
    }

    // Build argv before fork; only async-signal-safe calls in the child
    std::string exe_path = executable->string();
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        get_logger().error(std::format("fork() failed: {}", std::strerror(errno)));
        return std::unexpected(process_error::spawn_failed);
    }
    if (pid == 0) {
        ::execv(exe_path.c_str(), args.data());
        ::_exit(127);
    }

    get_logger().trace(std::format("Spawned '{}' as pid {}", exe_path, pid));
    return child_process(pid);
}

std::expected<int, process_error> run_command(
    const std::vector<std::string>& argv) {
    auto child = spawn_command(argv);
    if (!child) {
        return std::unexpected(child.error());
    }
    return child->wait();
}

}  // namespace pacs::forward::integration
