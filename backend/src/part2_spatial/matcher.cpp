#include "geolink/matcher.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <vector>

#include "geolink/geometry.hpp"

namespace geolink
{
namespace
{

bool usable(const Geometry &geometry)
{
    switch (geometry.type)
    {
    case GeometryType::point:
    case GeometryType::line_string:
        return !geometry.coords.empty();
    case GeometryType::polygon:
    case GeometryType::multi_polygon:
        return !geometry.polygons.empty() && !geometry.polygons.front().rings.empty();
    case GeometryType::empty:
        break;
    }
    return false;
}

} // namespace

std::optional<Match> containing(const GeoPoint &point, const std::vector<Feature> &candidates)
{
    const Coord target{point.lon, point.lat};

    for (const auto &candidate : candidates)
    {
        if (!usable(candidate.geometry))
        {
            std::cerr << "Skipping feature " << candidate.id << " with unusable geometry" << std::endl;
            continue;
        }

        if (contains(candidate.geometry, target))
        {
            return Match{&candidate, 0.0, true};
        }
    }
    return std::nullopt;
}

std::optional<Match> nearest(const GeoPoint &point, const std::vector<Feature> &candidates, double max_distance)
{
    const Coord target{point.lon, point.lat};

    const Feature *best = nullptr;
    double best_distance = std::numeric_limits<double>::infinity();

    for (const auto &candidate : candidates)
    {
        if (!usable(candidate.geometry))
        {
            std::cerr << "Skipping feature " << candidate.id << " with unusable geometry" << std::endl;
            continue;
        }

        const double d = distance(candidate.geometry, target);
        if (!std::isfinite(d))
        {
            continue;
        }

        if (d < best_distance)
        {
            best_distance = d;
            best = &candidate;
        }
    }

    if (!best || !(best_distance < max_distance))
    {
        return std::nullopt;
    }
    return Match{best, best_distance, best_distance == 0.0 && contains(best->geometry, target)};
}

std::optional<Match> containing_or_nearest(const GeoPoint &point, const std::vector<Feature> &candidates, double max_distance)
{
    if (auto match = containing(point, candidates))
    {
        return match;
    }
    return nearest(point, candidates, max_distance);
}

} // namespace geolink
