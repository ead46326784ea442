#ifndef PACS_FORWARD_RELAY_ROUTE_H
#define PACS_FORWARD_RELAY_ROUTE_H

/**
 * @file route.h
 * @brief Resolved route table entry
 */

#include "pacs/forward/config/forward_config.h"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace pacs::forward::relay {

/**
 * @brief A listener output directory and the endpoints it is relayed to
 *
 * Endpoints keep the order in which the route configuration lists them.
 */
struct route {
    std::string name;
    std::filesystem::path source_dir;
    std::vector<config::endpoint> endpoints;
};

/**
 * @brief Resolve the configured routes against listeners and endpoints
 *
 * @return invalid_value if a route names an undeclared listener or endpoint
 */
[[nodiscard]] std::expected<std::vector<route>, config::config_error>
build_routes(const config::forward_config& config);

}  // namespace pacs::forward::relay

#endif  // PACS_FORWARD_RELAY_ROUTE_H
