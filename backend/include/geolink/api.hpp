#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geolink/road_network.hpp"
#include "geolink/spatial_linker.hpp"
#include "geolink/types.hpp"

namespace geolink
{

struct ResolverParams
{
    std::optional<double> radius_km;
    std::optional<std::size_t> limit;
    std::vector<std::string> categories;
    std::vector<std::string> road_classes;
};

// Request parsing; malformed input raises InvalidRequest.
InputKind parse_input_kind(const std::string &name);
InputPoint parse_input_point(const nlohmann::json &item);
std::vector<InputPoint> parse_input_points(const nlohmann::json &items);
ResolverParams parse_resolver_params(const nlohmann::json &params);
std::vector<std::string> parse_name_list(const nlohmann::json &value, const char *field);

nlohmann::json to_json(const GeoPoint &point);
nlohmann::json to_json(const LinkReport &report);
nlohmann::json to_json(const PlaceMatch &place);
nlohmann::json to_json(const LoadSummary &summary);
nlohmann::json to_json(const RouteResponse &response);
nlohmann::json to_json(const NetworkStatus &status);

} // namespace geolink
