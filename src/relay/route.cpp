/**
 * @file route.cpp
 * @brief Route table construction
 */

#include "pacs/forward/relay/route.h"

#include "pacs/forward/integration/logger_adapter.h"

#include <format>

namespace pacs::forward::relay {

std::expected<std::vector<route>, config::config_error> build_routes(
    const config::forward_config& config) {
    std::vector<route> routes;
    routes.reserve(config.routes.size());

    for (const auto& rc : config.routes) {
        const auto* listener = config.find_listener(rc.name);
        if (listener == nullptr) {
            integration::get_logger().error(
                std::format("Route {} does not name a listener", rc.name));
            return std::unexpected(config::config_error::invalid_value);
        }

        route r{.name = rc.name,
                .source_dir = listener->output_dir,
                .endpoints = {}};
        r.endpoints.reserve(rc.endpoints.size());
        for (const auto& endpoint_name : rc.endpoints) {
            const auto* ep = config.find_endpoint(endpoint_name);
            if (ep == nullptr) {
                integration::get_logger().error(std::format(
                    "Route {} references unknown endpoint {}", rc.name,
                    endpoint_name));
                return std::unexpected(config::config_error::invalid_value);
            }
            r.endpoints.push_back(*ep);
        }
        routes.push_back(std::move(r));
    }
    return routes;
}

}  // namespace pacs::forward::relay
