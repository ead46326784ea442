/**
 * @file forward_config.cpp
 * @brief Implementation of relay configuration validation
 */

#include "pacs/forward/config/forward_config.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <set>
#include <type_traits>

namespace pacs::forward::config {

namespace {

/**
 * @brief Check the DICOM AE title constraints (1-16 characters)
 */
[[nodiscard]] bool is_valid_ae_title(std::string_view ae) noexcept {
    return !ae.empty() && ae.size() <= MAX_AE_TITLE_LENGTH;
}

void check_ae_title(std::vector<validation_error_info>& errors,
                    const std::string& field_path, const std::string& ae) {
    if (!is_valid_ae_title(ae)) {
        errors.push_back({.field_path = field_path,
                          .message = "AE title must be 1-16 characters",
                          .actual_value = ae,
                          .expected = "AE title string"});
    }
}

/**
 * @brief Absolute, symlink-resolved form of a directory, without a
 *        trailing separator
 */
[[nodiscard]] std::filesystem::path normalized_directory(const std::string& dir) {
    std::error_code ec;
    auto path = std::filesystem::weakly_canonical(dir, ec);
    if (ec) {
        path = std::filesystem::absolute(dir, ec).lexically_normal();
        if (ec) {
            path = std::filesystem::path(dir).lexically_normal();
        }
    }
    if (!path.has_filename() && path.has_relative_path()) {
        path = path.parent_path();
    }
    return path;
}

/**
 * @brief True if @p inner is @p outer or lies below it
 */
[[nodiscard]] bool is_same_or_nested(const std::filesystem::path& outer,
                                     const std::filesystem::path& inner) {
    auto [o, i] = std::mismatch(outer.begin(), outer.end(), inner.begin(),
                                inner.end());
    return o == outer.end();
}

}  // namespace

const std::string& endpoint_name(const endpoint& ep) noexcept {
    return std::visit(
        [](const auto& e) -> const std::string& { return e.name; }, ep);
}

std::string_view endpoint_kind(const endpoint& ep) noexcept {
    return std::holds_alternative<network_endpoint>(ep) ? "dicom"
                                                        : "directory";
}

std::optional<log_level> parse_log_level(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warning" || lower == "warn") return log_level::warning;
    if (lower == "error") return log_level::error;
    if (lower == "critical" || lower == "fatal") return log_level::critical;
    return std::nullopt;
}

const listener_config* forward_config::find_listener(
    std::string_view name) const noexcept {
    auto it = std::find_if(listeners.begin(), listeners.end(),
                           [name](const auto& l) { return l.name == name; });
    return it != listeners.end() ? &*it : nullptr;
}

const endpoint* forward_config::find_endpoint(
    std::string_view name) const noexcept {
    auto it = std::find_if(endpoints.begin(), endpoints.end(),
                           [name](const auto& e) {
                               return endpoint_name(e) == name;
                           });
    return it != endpoints.end() ? &*it : nullptr;
}

std::vector<validation_error_info> forward_config::validate() const {
    std::vector<validation_error_info> errors;

    if (listeners.empty()) {
        errors.push_back({.field_path = "listeners",
                          .message = "No listeners have been configured",
                          .actual_value = std::nullopt,
                          .expected = "At least one listener"});
    }
    if (endpoints.empty()) {
        errors.push_back({.field_path = "endpoints",
                          .message = "No endpoints have been configured",
                          .actual_value = std::nullopt,
                          .expected = "At least one endpoint"});
    }

    // Validate listeners
    std::set<std::string> listener_names;
    std::vector<std::filesystem::path> output_dirs;
    for (size_t i = 0; i < listeners.size(); ++i) {
        const auto& listener = listeners[i];
        const std::string prefix = std::format("listeners[{}].", i);

        if (listener.name.empty()) {
            errors.push_back({.field_path = prefix + "name",
                              .message = "Listener name cannot be empty",
                              .actual_value = std::nullopt,
                              .expected = "Non-empty string"});
        } else if (!listener_names.insert(listener.name).second) {
            errors.push_back({.field_path = prefix + "name",
                              .message = "Listener name is not unique",
                              .actual_value = listener.name,
                              .expected = "Unique listener name"});
        }
        if (listener.port == 0) {
            errors.push_back({.field_path = prefix + "port",
                              .message = "Listener port must be > 0",
                              .actual_value = "0",
                              .expected = "1-65535"});
        }
        check_ae_title(errors, prefix + "ae_title", listener.ae_title);

        if (listener.output_dir.empty()) {
            errors.push_back({.field_path = prefix + "output_dir",
                              .message = "Listener output directory cannot be empty",
                              .actual_value = std::nullopt,
                              .expected = "Directory path"});
        } else {
            auto dir = normalized_directory(listener.output_dir);
            bool overlaps = std::any_of(
                output_dirs.begin(), output_dirs.end(), [&](const auto& other) {
                    return is_same_or_nested(other, dir) ||
                           is_same_or_nested(dir, other);
                });
            if (overlaps) {
                errors.push_back(
                    {.field_path = prefix + "output_dir",
                     .message = "Output directory overlaps another listener's",
                     .actual_value = listener.output_dir,
                     .expected = "Directory disjoint from other listeners"});
            }
            output_dirs.push_back(std::move(dir));
        }
    }

    // Validate endpoints
    std::set<std::string> endpoint_names;
    for (size_t i = 0; i < endpoints.size(); ++i) {
        const std::string prefix = std::format("endpoints[{}].", i);
        const auto& name = endpoint_name(endpoints[i]);

        if (name.empty()) {
            errors.push_back({.field_path = prefix + "name",
                              .message = "Endpoint name cannot be empty",
                              .actual_value = std::nullopt,
                              .expected = "Non-empty string"});
        } else if (!endpoint_names.insert(name).second) {
            errors.push_back({.field_path = prefix + "name",
                              .message = "Endpoint name is not unique",
                              .actual_value = name,
                              .expected = "Unique endpoint name"});
        }

        std::visit(
            [&](const auto& ep) {
                using T = std::decay_t<decltype(ep)>;
                if constexpr (std::is_same_v<T, network_endpoint>) {
                    if (ep.address.empty()) {
                        errors.push_back(
                            {.field_path = prefix + "address",
                             .message = "Endpoint address cannot be empty",
                             .actual_value = std::nullopt,
                             .expected = "Hostname or IP address"});
                    }
                    if (ep.port == 0) {
                        errors.push_back(
                            {.field_path = prefix + "port",
                             .message = "Endpoint port must be > 0",
                             .actual_value = "0",
                             .expected = "1-65535"});
                    }
                    check_ae_title(errors, prefix + "calling_ae", ep.calling_ae);
                    check_ae_title(errors, prefix + "called_ae", ep.called_ae);
                } else {
                    std::error_code ec;
                    if (ep.path.empty() ||
                        !std::filesystem::is_directory(ep.path, ec)) {
                        errors.push_back(
                            {.field_path = prefix + "path",
                             .message = "Directory endpoint path does not exist",
                             .actual_value = ep.path,
                             .expected = "Existing directory"});
                    }
                }
            },
            endpoints[i]);
    }

    // Validate route links
    std::set<std::string> route_names;
    for (size_t i = 0; i < routes.size(); ++i) {
        const auto& route = routes[i];
        const std::string prefix = std::format("routes[{}].", i);

        if (find_listener(route.name) == nullptr) {
            errors.push_back({.field_path = prefix + "name",
                              .message = "Route does not name a declared listener",
                              .actual_value = route.name,
                              .expected = "Listener name"});
        }
        if (!route_names.insert(route.name).second) {
            errors.push_back(
                {.field_path = prefix + "name",
                 .message = "Listener is the source of more than one route",
                 .actual_value = route.name,
                 .expected = "One route per listener"});
        }
        if (route.endpoints.empty()) {
            errors.push_back({.field_path = prefix + "endpoints",
                              .message = "Route has no endpoints",
                              .actual_value = std::nullopt,
                              .expected = "At least one endpoint name"});
        }
        for (size_t j = 0; j < route.endpoints.size(); ++j) {
            if (find_endpoint(route.endpoints[j]) == nullptr) {
                errors.push_back(
                    {.field_path = std::format("{}endpoints[{}]", prefix, j),
                     .message = "Route references an undeclared endpoint",
                     .actual_value = route.endpoints[j],
                     .expected = "Endpoint name"});
            }
        }
    }

    if (manager.max_stop_attempts == 0) {
        errors.push_back({.field_path = "manager.max_stop_attempts",
                          .message = "Maximum stop attempts must be > 0",
                          .actual_value = "0",
                          .expected = "Positive integer"});
    }
    if (worker.max_parallel_deliveries == 0) {
        errors.push_back({.field_path = "worker.max_parallel_deliveries",
                          .message = "Parallel deliveries must be > 0",
                          .actual_value = "0",
                          .expected = "Positive integer"});
    }
    if (worker.minimum_age.count() < 0) {
        errors.push_back({.field_path = "worker.minimum_age_ms",
                          .message = "Minimum age cannot be negative",
                          .actual_value = std::to_string(worker.minimum_age.count()),
                          .expected = "Non-negative duration"});
    }

    return errors;
}

}  // namespace pacs::forward::config
