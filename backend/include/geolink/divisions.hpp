#pragma once

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "geolink/config.hpp"
#include "geolink/feature_source.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/types.hpp"

namespace geolink
{

struct Division
{
    std::string gers_id;
    std::string name;
    std::string subtype;
    std::string country_iso;
};

struct DivisionResolution
{
    std::vector<Division> containing;
    std::map<std::string, Division> by_kind;
    std::vector<std::pair<std::string, std::string>> hierarchy_links;
};

Division make_division(const Feature &feature);

// (child, parent) pairs: every present kind but the largest links to the
// first larger kind present, skipping absent ones.
std::vector<std::pair<std::string, std::string>> link_hierarchy(const std::map<std::string, Division> &by_kind,
                                                                const std::vector<std::string> &ordering);

class DivisionHierarchyResolver
{
public:
    DivisionHierarchyResolver(FeatureSource &source, GraphStore &store, DivisionSettings settings,
                              std::chrono::milliseconds timeout);

    // point_key must already exist in the store.
    DivisionResolution resolve(const std::string &point_key, const GeoPoint &point);

private:
    FeatureSource &source_;
    GraphStore &store_;
    DivisionSettings settings_;
    std::chrono::milliseconds timeout_;
};

} // namespace geolink
