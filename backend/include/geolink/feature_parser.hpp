#pragma once

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

#include "geolink/types.hpp"

namespace geolink
{

Geometry parse_geometry(const nlohmann::json &geometry);
Feature parse_feature(FeatureKind kind, const nlohmann::json &feature);

// Malformed features are logged and skipped; skipped may be null.
std::vector<Feature> parse_feature_collection(FeatureKind kind, const nlohmann::json &collection, std::size_t limit, std::size_t *skipped = nullptr);

} // namespace geolink
