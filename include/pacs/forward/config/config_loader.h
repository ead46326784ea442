#ifndef PACS_FORWARD_CONFIG_CONFIG_LOADER_H
#define PACS_FORWARD_CONFIG_CONFIG_LOADER_H

/**
 * @file config_loader.h
 * @brief JSON configuration loader for the relay
 *
 * Provides loading, serialization and environment variable substitution
 * for forward_config. Supported environment variable syntax in any string
 * value:
 *   - ${VAR} - Required variable (error if not set)
 *   - ${VAR:-default} - Optional with default value
 *
 * @example Loading Configuration
 * ```cpp
 * auto result = config_loader::load("/etc/pacs_forward/config.json");
 * if (!result) {
 *     std::cerr << result.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto config = std::move(result.value());
 * ```
 */

#include "forward_config.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pacs::forward::config {

// =============================================================================
// Load Result Types
// =============================================================================

/**
 * @brief Detailed error information from configuration loading
 */
struct config_load_error {
    /** Error code */
    config_error code;

    /** Human-readable error message */
    std::string message;

    /** File path where error occurred (if applicable) */
    std::optional<std::filesystem::path> file_path;

    /** Validation errors (if validation failed) */
    std::vector<validation_error_info> validation_errors;

    /**
     * @brief Get formatted error message with location
     */
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Result type for configuration loading operations
 */
using config_result = std::expected<forward_config, config_load_error>;

// =============================================================================
// Configuration Loader
// =============================================================================

/**
 * @brief Configuration file loader
 *
 * Static class providing configuration loading and serialization.
 * Loading does not validate; call forward_config::validate() or
 * load_and_validate() for that.
 */
class config_loader {
public:
    /**
     * @brief Load configuration from a .json file
     */
    [[nodiscard]] static config_result load(const std::filesystem::path& path);

    /**
     * @brief Load configuration and reject it if validation fails
     */
    [[nodiscard]] static config_result load_and_validate(
        const std::filesystem::path& path);

    /**
     * @brief Load configuration from JSON string
     *
     * @param json_content JSON configuration string
     * @param source_name Optional source name for error messages
     */
    [[nodiscard]] static config_result load_json_string(
        std::string_view json_content,
        std::string_view source_name = "<string>");

    /**
     * @brief Save configuration to JSON file
     */
    [[nodiscard]] static std::expected<void, config_load_error> save_json(
        const forward_config& config, const std::filesystem::path& path);

    /**
     * @brief Serialize configuration to JSON string
     *
     * @param config Configuration to serialize
     * @param pretty If true, format with indentation
     */
    [[nodiscard]] static std::string to_json(const forward_config& config,
                                             bool pretty = true);

    /**
     * @brief Expand environment variables in a string
     *
     * @param value String containing environment variable references
     * @return Expanded string or error if required variable is missing
     */
    [[nodiscard]] static std::expected<std::string, config_load_error>
    expand_env_vars(std::string_view value);

    /**
     * @brief Sample configuration with two listeners and four endpoints
     *
     * Directories are placed under the system temporary directory.
     */
    [[nodiscard]] static forward_config sample_config();
};

}  // namespace pacs::forward::config

#endif  // PACS_FORWARD_CONFIG_CONFIG_LOADER_H
