#include "geolink/api.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "geolink/config.hpp"
#include "geolink/errors.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

std::optional<double> coordinate(const json &item, const char *name, const char *short_name)
{
    for (const char *key : {name, short_name})
    {
        if (!item.contains(key) || item[key].is_null())
        {
            continue;
        }
        if (!item[key].is_number())
        {
            throw InvalidRequest(std::string("'") + key + "' must be a number");
        }
        return item[key].get<double>();
    }
    return std::nullopt;
}

std::string text(const json &item, const char *key)
{
    if (!item.contains(key) || item[key].is_null())
    {
        return "";
    }
    if (!item[key].is_string())
    {
        throw InvalidRequest(std::string("'") + key + "' must be a string");
    }
    return item[key].get<std::string>();
}

} // namespace

InputKind parse_input_kind(const std::string &name)
{
    if (name.empty() || name == "location")
    {
        return InputKind::location;
    }
    if (name == "place")
    {
        return InputKind::place;
    }
    if (name == "ip" || name == "ip_address")
    {
        return InputKind::ip_address;
    }
    throw InvalidRequest("unknown point kind '" + name + "'");
}

InputPoint parse_input_point(const json &item)
{
    if (!item.is_object())
    {
        throw InvalidRequest("each point must be an object");
    }

    InputPoint point;
    point.id = text(item, "id");
    if (point.id.empty())
    {
        throw InvalidRequest("each point needs an 'id'");
    }
    point.kind = parse_input_kind(text(item, "kind"));
    point.lat = coordinate(item, "latitude", "lat");
    point.lon = coordinate(item, "longitude", "lon");
    point.address = text(item, "address");
    point.city = text(item, "city");
    point.name = text(item, "name");
    point.category = text(item, "category");
    point.region_id = text(item, "region_id");

    if (point.lat && (*point.lat < -90.0 || *point.lat > 90.0))
    {
        throw InvalidRequest("latitude of '" + point.id + "' is out of range");
    }
    if (point.lon && (*point.lon < -180.0 || *point.lon > 180.0))
    {
        throw InvalidRequest("longitude of '" + point.id + "' is out of range");
    }
    return point;
}

std::vector<InputPoint> parse_input_points(const json &items)
{
    if (!items.is_array())
    {
        throw InvalidRequest("'points' must be an array");
    }

    std::vector<InputPoint> points;
    points.reserve(items.size());
    for (const auto &item : items)
    {
        points.push_back(parse_input_point(item));
    }
    return points;
}

std::vector<std::string> parse_name_list(const json &value, const char *field)
{
    if (value.is_null())
    {
        return {};
    }
    if (value.is_string())
    {
        std::string lowered = value.get<std::string>();
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (lowered == "all")
        {
            return {};
        }
        return split_list(value.get<std::string>());
    }
    if (!value.is_array())
    {
        throw InvalidRequest(std::string("'") + field + "' must be a string or a list of strings");
    }

    std::vector<std::string> names;
    for (const auto &item : value)
    {
        if (!item.is_string())
        {
            throw InvalidRequest(std::string("'") + field + "' must be a string or a list of strings");
        }
        names.push_back(item.get<std::string>());
    }
    return names;
}

ResolverParams parse_resolver_params(const json &params)
{
    ResolverParams result;
    if (params.is_null())
    {
        return result;
    }
    if (!params.is_object())
    {
        throw InvalidRequest("'params' must be an object");
    }

    if (params.contains("radius_km") && !params["radius_km"].is_null())
    {
        if (!params["radius_km"].is_number() || params["radius_km"].get<double>() <= 0.0)
        {
            throw InvalidRequest("'radius_km' must be a positive number");
        }
        result.radius_km = params["radius_km"].get<double>();
    }
    if (params.contains("limit") && !params["limit"].is_null())
    {
        if (!params["limit"].is_number_integer() || params["limit"].get<long long>() <= 0)
        {
            throw InvalidRequest("'limit' must be a positive integer");
        }
        result.limit = params["limit"].get<std::size_t>();
    }
    if (params.contains("categories"))
    {
        result.categories = parse_name_list(params["categories"], "categories");
    }
    if (params.contains("road_classes"))
    {
        result.road_classes = parse_name_list(params["road_classes"], "road_classes");
    }
    return result;
}

json to_json(const GeoPoint &point)
{
    return json::array({point.lat, point.lon});
}

json to_json(const LinkReport &report)
{
    json records = json::array();
    for (const auto &record : report.records)
    {
        json entry = {{"point_id", record.point_id},
                      {"resolver", record.resolver},
                      {"outcome", to_string(record.outcome)}};
        if (!record.target_key.empty())
        {
            entry["target"] = record.target_key;
        }
        if (!record.detail.empty())
        {
            entry["detail"] = record.detail;
        }
        records.push_back(entry);
    }

    return {{"linked", report.count(Outcome::linked)},
            {"no_candidate", report.count(Outcome::no_candidate)},
            {"missing_coordinates", report.count(Outcome::missing_coordinates)},
            {"failed", report.count(Outcome::failed)},
            {"records", records}};
}

json to_json(const PlaceMatch &place)
{
    return {{"gers_id", place.gers_id},
            {"name", place.name},
            {"category", place.category},
            {"latitude", place.position.lat},
            {"longitude", place.position.lon},
            {"linked_from", place.linked_from}};
}

json to_json(const LoadSummary &summary)
{
    return {{"queried_points", summary.queried_points},
            {"skipped_points", summary.skipped_points},
            {"failed_points", summary.failed_points},
            {"intersections", summary.intersections},
            {"segments", summary.segments},
            {"dropped_segments", summary.dropped_segments},
            {"linked_points", summary.linked_points}};
}

json to_json(const RouteResponse &response)
{
    json route = json::array();
    for (const auto &point : response.route)
    {
        route.push_back(to_json(point));
    }

    json result = {{"route", route},
                   {"distance_m", response.distance_m},
                   {"intersection_count", response.intersection_count},
                   {"success", response.found}};
    result["message"] = response.message.empty() ? json() : json(response.message);
    return result;
}

json to_json(const NetworkStatus &status)
{
    return {{"intersection_count", status.intersection_count},
            {"segment_count", status.segment_count},
            {"linked_locations", status.linked_point_count},
            {"has_network", status.has_network}};
}

} // namespace geolink
