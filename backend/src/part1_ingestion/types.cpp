#include "geolink/types.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

#include "geolink/errors.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geolink
{

BoundingBox box_around(const GeoPoint &point, double buffer_deg)
{
    return {point.lon - buffer_deg, point.lat - buffer_deg, point.lon + buffer_deg, point.lat + buffer_deg};
}

BoundingBox box_around_km(const GeoPoint &point, double radius_km)
{
    const double lat_delta = radius_km / 111.0;
    const double lon_delta = radius_km / (111.0 * std::cos(point.lat * M_PI / 180.0));
    return {point.lon - lon_delta, point.lat - lat_delta, point.lon + lon_delta, point.lat + lat_delta};
}

BoundingBox geometry_bounds(const Geometry &geometry)
{
    BoundingBox box{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                    std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};

    auto extend = [&box](const Coord &c)
    {
        box.min_lon = std::min(box.min_lon, c.x);
        box.min_lat = std::min(box.min_lat, c.y);
        box.max_lon = std::max(box.max_lon, c.x);
        box.max_lat = std::max(box.max_lat, c.y);
    };

    for (const auto &c : geometry.coords)
    {
        extend(c);
    }
    for (const auto &polygon : geometry.polygons)
    {
        for (const auto &ring : polygon.rings)
        {
            for (const auto &c : ring.points)
            {
                extend(c);
            }
        }
    }
    return box;
}

GeoPoint InputPoint::position() const
{
    if (!has_coordinates())
    {
        throw MissingCoordinates(id);
    }
    return {*lat, *lon};
}

std::string input_label(InputKind kind)
{
    switch (kind)
    {
    case InputKind::location:
        return labels::kLocation;
    case InputKind::place:
        return labels::kPlace;
    case InputKind::ip_address:
        return labels::kIpAddress;
    }
    return labels::kLocation;
}

std::string describe(const InputPoint &point)
{
    if (!point.address.empty())
    {
        return point.address;
    }
    if (!point.name.empty())
    {
        return point.name;
    }
    if (point.has_coordinates())
    {
        std::ostringstream label;
        label << std::fixed << std::setprecision(4) << *point.lat << ", " << *point.lon;
        return label.str();
    }
    return point.id.empty() ? "unknown" : point.id;
}

std::string to_string(FeatureKind kind)
{
    switch (kind)
    {
    case FeatureKind::place:
        return "place";
    case FeatureKind::building:
        return "building";
    case FeatureKind::address:
        return "address";
    case FeatureKind::division:
        return "division";
    case FeatureKind::road_segment:
        return "segment";
    case FeatureKind::road_connector:
        return "connector";
    }
    return "unknown";
}

std::optional<PathAlgorithm> parse_algorithm(const std::string &name)
{
    if (name.empty() || name == "dijkstra")
    {
        return PathAlgorithm::uniform_cost;
    }
    if (name == "astar")
    {
        return PathAlgorithm::heuristic;
    }
    return std::nullopt;
}

std::string to_string(PathAlgorithm algorithm)
{
    return algorithm == PathAlgorithm::heuristic ? "astar" : "dijkstra";
}

} // namespace geolink
