/**
 * @file main.cpp
 * @brief pacs_forward CLI executable entrypoint
 *
 * Usage:
 *   pacs_forward generate                 Print a sample configuration
 *   pacs_forward show [config]            Print the loaded configuration
 *   pacs_forward start [config]           Run the relay until SIGINT/SIGTERM
 *   pacs_forward echo [config]            C-ECHO every network endpoint
 *   pacs_forward --help                   Show help message
 *   pacs_forward --version                Show version information
 */

#include "pacs/forward/config/config_loader.h"
#include "pacs/forward/delivery/echo.h"
#include "pacs/forward/integration/logger_adapter.h"
#include "pacs/forward/relay/endpoint_manager.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace {

constexpr std::string_view VERSION = "0.1.0";
constexpr std::string_view PROGRAM_NAME = "pacs_forward";

namespace cfg = pacs::forward::config;
namespace integration = pacs::forward::integration;
namespace relay = pacs::forward::relay;

// =============================================================================
// Signal Handling
// =============================================================================

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = 1;
    }
}

void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void wait_for_shutdown() {
    while (g_shutdown_requested == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
    }
}

// =============================================================================
// Command Line
// =============================================================================

void print_version() {
    std::cout << PROGRAM_NAME << " version " << VERSION << "\n";
    std::cout << "PACS Forward - DICOM store-and-forward relay\n";
}

void print_usage() {
    std::cout << "Usage: " << PROGRAM_NAME
              << " [--verbose|--debug|--trace] <command> [config]\n\n";
    std::cout << "PACS Forward - DICOM store-and-forward relay\n\n";
    std::cout << "Commands:\n";
    std::cout << "  generate               Print a sample configuration (JSON)\n";
    std::cout << "  show [config]          Load and print the configuration\n";
    std::cout << "  start [config]         Start listeners and route workers\n";
    std::cout << "  echo [config]          Verify network endpoints with C-ECHO\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --verbose              Log at info level\n";
    std::cout << "  --debug                Log at debug level\n";
    std::cout << "  --trace                Log at trace level\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version information\n";
    std::cout << "\n";
    std::cout << "The configuration defaults to config.json next to the "
                 "executable.\n";
    std::cout << "\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGINT  (Ctrl+C)    Graceful shutdown\n";
    std::cout << "  SIGTERM             Graceful shutdown\n";
}

enum class command { none, generate, show, start, echo };

struct cli_options {
    command cmd = command::none;
    std::filesystem::path config_path;
    std::optional<integration::log_level> level;
    bool show_help = false;
    bool show_version = false;
    bool valid = true;
    std::string error_message;
};

cli_options parse_args(int argc, char* argv[]) {
    cli_options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return opts;
        }
        if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
            return opts;
        }
        if (arg == "--verbose") {
            opts.level = integration::log_level::info;
            continue;
        }
        if (arg == "--debug") {
            opts.level = integration::log_level::debug;
            continue;
        }
        if (arg == "--trace") {
            opts.level = integration::log_level::trace;
            continue;
        }

        if (opts.cmd == command::none) {
            if (arg == "generate") {
                opts.cmd = command::generate;
            } else if (arg == "show") {
                opts.cmd = command::show;
            } else if (arg == "start") {
                opts.cmd = command::start;
            } else if (arg == "echo") {
                opts.cmd = command::echo;
            } else {
                opts.valid = false;
                opts.error_message = "Unknown command: " + std::string(arg);
                return opts;
            }
            continue;
        }

        if (opts.cmd != command::generate && opts.config_path.empty()) {
            opts.config_path = std::string(arg);
            continue;
        }

        opts.valid = false;
        opts.error_message = "Unexpected argument: " + std::string(arg);
        return opts;
    }

    if (opts.cmd == command::none) {
        opts.valid = false;
        opts.error_message = "Command required";
    }
    return opts;
}

std::filesystem::path default_config_path() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "config.json";
    }
    return exe.parent_path() / "config.json";
}

integration::log_level to_logger_level(cfg::log_level level) {
    switch (level) {
        case cfg::log_level::trace:
            return integration::log_level::trace;
        case cfg::log_level::debug:
            return integration::log_level::debug;
        case cfg::log_level::info:
            return integration::log_level::info;
        case cfg::log_level::warning:
            return integration::log_level::warning;
        case cfg::log_level::error:
            return integration::log_level::error;
        case cfg::log_level::critical:
            return integration::log_level::critical;
        default:
            return integration::log_level::info;
    }
}

std::optional<cfg::forward_config> load_config(const cli_options& opts) {
    auto path = opts.config_path.empty() ? default_config_path()
                                         : opts.config_path;
    auto result = cfg::config_loader::load(path);
    if (!result) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return std::nullopt;
    }
    if (!opts.level) {
        integration::get_logger().set_level(
            to_logger_level(result->logging.level));
    }
    integration::get_logger().debug("Configuration loaded from " + path.string());
    return std::move(*result);
}

// =============================================================================
// Commands
// =============================================================================

int run_generate() {
    std::cout << cfg::config_loader::to_json(cfg::config_loader::sample_config())
              << "\n";
    return EXIT_SUCCESS;
}

int run_show(const cli_options& opts) {
    auto config = load_config(opts);
    if (!config) {
        return EXIT_FAILURE;
    }
    std::cout << cfg::config_loader::to_json(*config) << "\n";
    return EXIT_SUCCESS;
}

int run_echo(const cli_options& opts) {
    auto config = load_config(opts);
    if (!config) {
        return EXIT_FAILURE;
    }

    int failures = 0;
    for (const auto& ep : config->endpoints) {
        const auto* network = std::get_if<cfg::network_endpoint>(&ep);
        if (network == nullptr) {
            continue;
        }
        auto result = pacs::forward::delivery::verify_endpoint(
            *network, config->tools.echoscu);
        std::cout << "  " << network->name << " (" << network->address << ":"
                  << network->port << "): "
                  << (result ? "OK"
                             : pacs::forward::delivery::to_string(result.error()))
                  << "\n";
        if (!result) {
            ++failures;
        }
    }
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

void print_statistics(const std::vector<relay::route_statistics>& stats) {
    std::cout << "Final statistics:\n";
    for (const auto& s : stats) {
        std::cout << "  Route " << s.route_name << ":\n";
        std::cout << "    Scans:             " << s.worker.cycles << "\n";
        std::cout << "    Objects forwarded: " << s.worker.objects_delivered
                  << "\n";
        std::cout << "    Objects retained:  " << s.worker.objects_failed << "\n";
        std::cout << "    Endpoint failures: " << s.worker.endpoint_failures
                  << "\n";
    }
}

int run_start(const cli_options& opts) {
    auto config = load_config(opts);
    if (!config) {
        return EXIT_FAILURE;
    }

    if (auto errors = config->validate(); !errors.empty()) {
        std::cerr << "Error: configuration is invalid\n";
        for (const auto& e : errors) {
            std::cerr << "  " << e.field_path << ": " << e.message << "\n";
        }
        return EXIT_FAILURE;
    }

    relay::endpoint_manager manager(std::move(*config));

    install_signal_handlers();

    auto start_result = manager.start();
    if (!start_result) {
        std::cerr << "Failed to start relay: "
                  << relay::to_string(start_result.error()) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "PACS Forward started, press Ctrl+C to shutdown...\n";

    wait_for_shutdown();

    std::cout << "\nShutdown signal received, stopping relay...\n";

    auto stop_result = manager.stop();
    print_statistics(manager.get_statistics());
    if (!stop_result) {
        std::cerr << "Relay stopped with error: "
                  << relay::to_string(stop_result.error()) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "PACS Forward stopped successfully\n";
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);

    if (opts.show_version) {
        print_version();
        return EXIT_SUCCESS;
    }

    if (opts.show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }

    if (!opts.valid) {
        std::cerr << "Error: " << opts.error_message << "\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    if (opts.level) {
        integration::get_logger().set_level(*opts.level);
    }

    try {
        switch (opts.cmd) {
            case command::generate:
                return run_generate();
            case command::show:
                return run_show(opts);
            case command::start:
                return run_start(opts);
            case command::echo:
                return run_echo(opts);
            default:
                print_usage();
                return EXIT_FAILURE;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
