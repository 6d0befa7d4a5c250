#pragma once

#include <limits>
#include <optional>
#include <vector>

#include "geolink/types.hpp"

namespace geolink
{

struct Match
{
    const Feature *feature{nullptr};
    // planar, in degrees
    double distance{0.0};
    bool contained{false};
};

constexpr double kUnbounded = std::numeric_limits<double>::infinity();

// First candidate in input order whose areal geometry contains the point.
std::optional<Match> containing(const GeoPoint &point, const std::vector<Feature> &candidates);

// Closest candidate with distance strictly below max_distance (degrees).
// Ties keep the earlier candidate.
std::optional<Match> nearest(const GeoPoint &point, const std::vector<Feature> &candidates, double max_distance);

std::optional<Match> containing_or_nearest(const GeoPoint &point, const std::vector<Feature> &candidates, double max_distance);

} // namespace geolink
