/**
 * @file config_loader.cpp
 * @brief Implementation of JSON configuration loading and serialization
 *
 * Uses nlohmann/json for parsing and serialization. Every string value is
 * passed through environment variable expansion before it is stored.
 */

#include "pacs/forward/config/config_loader.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace pacs::forward::config {

namespace {

using json = nlohmann::json;

template <typename T>
using load_expected = std::expected<T, config_load_error>;

// =============================================================================
// Helper Functions
// =============================================================================

[[nodiscard]] config_load_error make_error(
    config_error code, std::string message,
    std::optional<std::filesystem::path> file_path = std::nullopt) {
    return config_load_error{.code = code,
                             .message = std::move(message),
                             .file_path = std::move(file_path),
                             .validation_errors = {}};
}

/**
 * @brief Read entire file contents
 */
[[nodiscard]] load_expected<std::string> read_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(make_error(
            config_error::file_not_found,
            std::format("Configuration file not found: {}", path.string()),
            path));
    }

    std::ifstream file(path);
    if (!file) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Failed to open file: {}", path.string()), path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Error reading file: {}", path.string()), path));
    }

    return buffer.str();
}

/**
 * @brief Check the file extension is .json
 */
[[nodiscard]] load_expected<void> check_format(
    const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == ".json") {
        return {};
    }

    return std::unexpected(make_error(
        config_error::invalid_format,
        std::format("Unknown configuration file format: {}. Use .json", ext),
        path));
}

/**
 * @brief Read a string member, expanding environment variables
 */
[[nodiscard]] load_expected<std::string> read_string(
    const json& obj, const char* key, const std::string& prefix,
    bool required, std::string_view fallback = {}) {
    if (!obj.contains(key)) {
        if (required) {
            return std::unexpected(make_error(
                config_error::missing_required_field,
                std::format("Missing required field '{}{}'", prefix, key)));
        }
        return std::string(fallback);
    }

    const auto& value = obj.at(key);
    if (!value.is_string()) {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Field '{}{}' must be a string", prefix, key)));
    }

    auto expanded = config_loader::expand_env_vars(value.get<std::string>());
    if (!expanded) {
        auto error = expanded.error();
        error.message = std::format("{}{}: {}", prefix, key, error.message);
        return std::unexpected(std::move(error));
    }
    return *expanded;
}

/**
 * @brief Read a non-negative integer member
 *
 * Accepts a JSON number or a string (after environment expansion) so that
 * values such as "${PORT:-104}" can be used.
 */
template <typename T>
[[nodiscard]] load_expected<T> read_unsigned(
    const json& obj, const char* key, const std::string& prefix, T fallback,
    T max_value = std::numeric_limits<T>::max()) {
    if (!obj.contains(key)) {
        return fallback;
    }

    const auto& value = obj.at(key);
    unsigned long long parsed = 0;

    if (value.is_number_unsigned()) {
        parsed = value.get<unsigned long long>();
    } else if (value.is_number_integer()) {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Field '{}{}' must not be negative", prefix, key)));
    } else if (value.is_string()) {
        auto expanded = config_loader::expand_env_vars(value.get<std::string>());
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        const auto& str = *expanded;
        auto [ptr, ec] =
            std::from_chars(str.data(), str.data() + str.size(), parsed);
        if (ec != std::errc{} || ptr != str.data() + str.size()) {
            return std::unexpected(make_error(
                config_error::invalid_value,
                std::format("Field '{}{}' is not a number: {}", prefix, key,
                            str)));
        }
    } else {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Field '{}{}' must be a number", prefix, key)));
    }

    if (parsed > static_cast<unsigned long long>(max_value)) {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Field '{}{}' is out of range: {}", prefix, key,
                        parsed)));
    }
    return static_cast<T>(parsed);
}

[[nodiscard]] load_expected<const json*> read_array(const json& root,
                                                    const char* key) {
    if (!root.contains(key)) {
        static const json empty = json::array();
        return &empty;
    }
    const auto& value = root.at(key);
    if (!value.is_array()) {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Field '{}' must be an array", key)));
    }
    return &value;
}

[[nodiscard]] load_expected<const json*> read_section(const json& root,
                                                      const char* key) {
    if (!root.contains(key)) {
        static const json empty = json::object();
        return &empty;
    }
    const auto& value = root.at(key);
    if (!value.is_object()) {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Field '{}' must be an object", key)));
    }
    return &value;
}

// =============================================================================
// Section Parsers
// =============================================================================

[[nodiscard]] load_expected<listener_config> parse_listener(
    const json& obj, const std::string& prefix) {
    listener_config listener;

    auto name = read_string(obj, "name", prefix, true);
    if (!name) return std::unexpected(name.error());
    listener.name = std::move(*name);

    auto port = read_unsigned<uint16_t>(obj, "port", prefix, listener.port);
    if (!port) return std::unexpected(port.error());
    listener.port = *port;

    auto ae = read_string(obj, "ae_title", prefix, true);
    if (!ae) return std::unexpected(ae.error());
    listener.ae_title = std::move(*ae);

    auto output = read_string(obj, "output_dir", prefix, true);
    if (!output) return std::unexpected(output.error());
    listener.output_dir = std::move(*output);

    return listener;
}

[[nodiscard]] load_expected<endpoint> parse_endpoint(
    const json& obj, const std::string& prefix) {
    auto type = read_string(obj, "type", prefix, true);
    if (!type) return std::unexpected(type.error());

    auto name = read_string(obj, "name", prefix, true);
    if (!name) return std::unexpected(name.error());

    if (*type == "dicom" || *type == "network") {
        network_endpoint ep;
        ep.name = std::move(*name);

        auto address = read_string(obj, "address", prefix, true);
        if (!address) return std::unexpected(address.error());
        ep.address = std::move(*address);

        auto port = read_unsigned<uint16_t>(obj, "port", prefix, ep.port);
        if (!port) return std::unexpected(port.error());
        ep.port = *port;

        auto calling = read_string(obj, "calling_ae", prefix, true);
        if (!calling) return std::unexpected(calling.error());
        ep.calling_ae = std::move(*calling);

        auto called = read_string(obj, "called_ae", prefix, true);
        if (!called) return std::unexpected(called.error());
        ep.called_ae = std::move(*called);

        return ep;
    }

    if (*type == "directory" || *type == "dir") {
        directory_endpoint ep;
        ep.name = std::move(*name);

        auto path = read_string(obj, "path", prefix, true);
        if (!path) return std::unexpected(path.error());
        ep.path = std::move(*path);

        return ep;
    }

    return std::unexpected(make_error(
        config_error::invalid_value,
        std::format("Field '{}type' has unknown endpoint type '{}' "
                    "(expected \"dicom\" or \"directory\")",
                    prefix, *type)));
}

[[nodiscard]] load_expected<route_config> parse_route(
    const json& obj, const std::string& prefix) {
    route_config route;

    auto name = read_string(obj, "name", prefix, true);
    if (!name) return std::unexpected(name.error());
    route.name = std::move(*name);

    if (!obj.contains("endpoints") || !obj.at("endpoints").is_array()) {
        return std::unexpected(make_error(
            config_error::missing_required_field,
            std::format("Field '{}endpoints' must be an array of names",
                        prefix)));
    }

    const auto& names = obj.at("endpoints");
    for (size_t i = 0; i < names.size(); ++i) {
        if (!names[i].is_string()) {
            return std::unexpected(make_error(
                config_error::invalid_value,
                std::format("Field '{}endpoints[{}]' must be a string", prefix,
                            i)));
        }
        auto expanded = config_loader::expand_env_vars(names[i].get<std::string>());
        if (!expanded) return std::unexpected(expanded.error());
        route.endpoints.push_back(std::move(*expanded));
    }

    return route;
}

[[nodiscard]] config_result parse_config(const json& root) {
    if (!root.is_object()) {
        return std::unexpected(make_error(
            config_error::parse_error,
            "Configuration root must be a JSON object"));
    }

    forward_config config;

    auto listeners = read_array(root, "listeners");
    if (!listeners) return std::unexpected(listeners.error());
    for (size_t i = 0; i < (*listeners)->size(); ++i) {
        auto listener =
            parse_listener((**listeners)[i], std::format("listeners[{}].", i));
        if (!listener) return std::unexpected(listener.error());
        config.listeners.push_back(std::move(*listener));
    }

    auto endpoints = read_array(root, "endpoints");
    if (!endpoints) return std::unexpected(endpoints.error());
    for (size_t i = 0; i < (*endpoints)->size(); ++i) {
        auto ep =
            parse_endpoint((**endpoints)[i], std::format("endpoints[{}].", i));
        if (!ep) return std::unexpected(ep.error());
        config.endpoints.push_back(std::move(*ep));
    }

    auto routes = read_array(root, "routes");
    if (!routes) return std::unexpected(routes.error());
    for (size_t i = 0; i < (*routes)->size(); ++i) {
        auto route = parse_route((**routes)[i], std::format("routes[{}].", i));
        if (!route) return std::unexpected(route.error());
        config.routes.push_back(std::move(*route));
    }

    auto manager = read_section(root, "manager");
    if (!manager) return std::unexpected(manager.error());
    {
        auto attempts = read_unsigned<size_t>(**manager, "max_stop_attempts",
                                              "manager.",
                                              config.manager.max_stop_attempts);
        if (!attempts) return std::unexpected(attempts.error());
        config.manager.max_stop_attempts = *attempts;
    }

    auto worker = read_section(root, "worker");
    if (!worker) return std::unexpected(worker.error());
    {
        const auto& section = **worker;
        auto buffer = read_unsigned<size_t>(section, "buffer_size", "worker.",
                                            config.worker.buffer_size);
        if (!buffer) return std::unexpected(buffer.error());
        config.worker.buffer_size = *buffer;

        auto min_age = read_unsigned<uint64_t>(
            section, "minimum_age_ms", "worker.",
            static_cast<uint64_t>(config.worker.minimum_age.count()));
        if (!min_age) return std::unexpected(min_age.error());
        config.worker.minimum_age = std::chrono::milliseconds(*min_age);

        auto backoff = read_unsigned<uint64_t>(
            section, "idle_backoff_ms", "worker.",
            static_cast<uint64_t>(config.worker.idle_backoff.count()));
        if (!backoff) return std::unexpected(backoff.error());
        config.worker.idle_backoff = std::chrono::milliseconds(*backoff);

        auto parallel = read_unsigned<size_t>(
            section, "max_parallel_deliveries", "worker.",
            config.worker.max_parallel_deliveries);
        if (!parallel) return std::unexpected(parallel.error());
        config.worker.max_parallel_deliveries = *parallel;
    }

    auto tools = read_section(root, "tools");
    if (!tools) return std::unexpected(tools.error());
    {
        const auto& section = **tools;
        auto storescp = read_string(section, "storescp", "tools.", false,
                                    config.tools.storescp);
        if (!storescp) return std::unexpected(storescp.error());
        config.tools.storescp = std::move(*storescp);

        auto storescu = read_string(section, "storescu", "tools.", false,
                                    config.tools.storescu);
        if (!storescu) return std::unexpected(storescu.error());
        config.tools.storescu = std::move(*storescu);

        auto echoscu = read_string(section, "echoscu", "tools.", false,
                                   config.tools.echoscu);
        if (!echoscu) return std::unexpected(echoscu.error());
        config.tools.echoscu = std::move(*echoscu);
    }

    auto logging = read_section(root, "logging");
    if (!logging) return std::unexpected(logging.error());
    {
        auto level = read_string(**logging, "level", "logging.", false,
                                 to_string(config.logging.level));
        if (!level) return std::unexpected(level.error());
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return std::unexpected(make_error(
                config_error::invalid_value,
                std::format("Field 'logging.level' has unknown level '{}'",
                            *level)));
        }
        config.logging.level = *parsed;
    }

    return config;
}

[[nodiscard]] json endpoint_to_json(const endpoint& ep) {
    return std::visit(
        [](const auto& e) -> json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, network_endpoint>) {
                return {{"type", "dicom"},
                        {"name", e.name},
                        {"address", e.address},
                        {"port", e.port},
                        {"calling_ae", e.calling_ae},
                        {"called_ae", e.called_ae}};
            } else {
                return {{"type", "directory"},
                        {"name", e.name},
                        {"path", e.path}};
            }
        },
        ep);
}

}  // namespace

// =============================================================================
// config_load_error
// =============================================================================

std::string config_load_error::to_string() const {
    std::string result = message;

    if (file_path) {
        result += " (file: " + file_path->string() + ")";
    }

    if (!validation_errors.empty()) {
        result += "\nValidation errors:";
        for (const auto& err : validation_errors) {
            result += "\n  - " + err.field_path + ": " + err.message;
            if (err.actual_value) {
                result += " (got: " + *err.actual_value + ")";
            }
            if (err.expected) {
                result += " (expected: " + *err.expected + ")";
            }
        }
    }

    return result;
}

// =============================================================================
// config_loader Implementation
// =============================================================================

config_result config_loader::load(const std::filesystem::path& path) {
    if (auto format = check_format(path); !format) {
        return std::unexpected(format.error());
    }

    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto result = load_json_string(*content, path.string());
    if (!result) {
        auto error = result.error();
        error.file_path = path;
        return std::unexpected(std::move(error));
    }
    return result;
}

config_result config_loader::load_and_validate(
    const std::filesystem::path& path) {
    auto result = load(path);
    if (!result) {
        return result;
    }

    auto errors = result->validate();
    if (!errors.empty()) {
        auto error = make_error(config_error::validation_error,
                                to_string(config_error::validation_error), path);
        error.validation_errors = std::move(errors);
        return std::unexpected(std::move(error));
    }
    return result;
}

config_result config_loader::load_json_string(std::string_view json_content,
                                              std::string_view source_name) {
    if (json_content.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return std::unexpected(make_error(
            config_error::empty_config,
            std::format("Configuration is empty: {}", source_name)));
    }

    json root;
    try {
        root = json::parse(json_content);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(
            config_error::parse_error,
            std::format("Failed to parse {}: {}", source_name, e.what())));
    }

    try {
        return parse_config(root);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Invalid value in {}: {}", source_name, e.what())));
    }
}

std::expected<void, config_load_error> config_loader::save_json(
    const forward_config& config, const std::filesystem::path& path) {
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(make_error(
                config_error::io_error,
                std::format("Failed to create directory: {}", parent.string()),
                path));
        }
    }

    std::ofstream file(path);
    if (!file) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Failed to create file: {}", path.string()), path));
    }

    file << to_json(config, true) << '\n';

    if (!file) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Failed to write file: {}", path.string()), path));
    }
    return {};
}

std::string config_loader::to_json(const forward_config& config, bool pretty) {
    json root;

    root["listeners"] = json::array();
    for (const auto& listener : config.listeners) {
        root["listeners"].push_back({{"name", listener.name},
                                     {"port", listener.port},
                                     {"ae_title", listener.ae_title},
                                     {"output_dir", listener.output_dir}});
    }

    root["endpoints"] = json::array();
    for (const auto& ep : config.endpoints) {
        root["endpoints"].push_back(endpoint_to_json(ep));
    }

    root["routes"] = json::array();
    for (const auto& route : config.routes) {
        root["routes"].push_back(
            {{"name", route.name}, {"endpoints", route.endpoints}});
    }

    root["manager"] = {{"max_stop_attempts", config.manager.max_stop_attempts}};
    root["worker"] = {
        {"buffer_size", config.worker.buffer_size},
        {"minimum_age_ms", config.worker.minimum_age.count()},
        {"idle_backoff_ms", config.worker.idle_backoff.count()},
        {"max_parallel_deliveries", config.worker.max_parallel_deliveries}};
    root["tools"] = {{"storescp", config.tools.storescp},
                     {"storescu", config.tools.storescu},
                     {"echoscu", config.tools.echoscu}};
    root["logging"] = {{"level", to_string(config.logging.level)}};

    return pretty ? root.dump(2) : root.dump();
}

std::expected<std::string, config_load_error> config_loader::expand_env_vars(
    std::string_view value) {
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        if (value[pos] == '$' && pos + 1 < value.size() &&
            value[pos + 1] == '{') {
            size_t end = value.find('}', pos + 2);
            if (end == std::string_view::npos) {
                return std::unexpected(make_error(
                    config_error::parse_error,
                    "Unclosed environment variable reference"));
            }

            std::string_view ref = value.substr(pos + 2, end - pos - 2);
            std::string var_name;
            std::string default_value;
            bool has_default = false;

            if (auto colon_pos = ref.find(":-");
                colon_pos != std::string_view::npos) {
                var_name = std::string(ref.substr(0, colon_pos));
                default_value = std::string(ref.substr(colon_pos + 2));
                has_default = true;
            } else {
                var_name = std::string(ref);
            }

            const char* env_val = std::getenv(var_name.c_str());
            if (env_val != nullptr) {
                result += env_val;
            } else if (has_default) {
                result += default_value;
            } else {
                return std::unexpected(make_error(
                    config_error::env_var_not_found,
                    std::format("Environment variable '{}' not found",
                                var_name)));
            }

            pos = end + 1;
        } else {
            result += value[pos];
            ++pos;
        }
    }

    return result;
}

forward_config config_loader::sample_config() {
    const auto temp_dir = std::filesystem::temp_directory_path();

    forward_config config;
    config.listeners = {
        {.name = "Listener_1",
         .port = 104,
         .ae_title = "AE_1",
         .output_dir = (temp_dir / "Listener_1").string()},
        {.name = "Listener_2",
         .port = 105,
         .ae_title = "AE_2",
         .output_dir = (temp_dir / "Listener_2").string()},
    };
    config.endpoints = {
        network_endpoint{.name = "DSE_1",
                         .address = "192.168.1.10",
                         .port = 106,
                         .calling_ae = "AET_1",
                         .called_ae = "DSE_1"},
        network_endpoint{.name = "DSE_2",
                         .address = "192.168.2.10",
                         .port = 107,
                         .calling_ae = "AET_2",
                         .called_ae = "DSE_2"},
        directory_endpoint{.name = "DE_1", .path = (temp_dir / "DE_1").string()},
        directory_endpoint{.name = "DE_2", .path = (temp_dir / "DE_2").string()},
    };
    config.routes = {
        {.name = "Listener_1", .endpoints = {"DSE_1", "DE_1"}},
        {.name = "Listener_2", .endpoints = {"DSE_2", "DE_2"}},
    };
    config.manager.max_stop_attempts = 100;
    return config;
}

}  // namespace pacs::forward::config
