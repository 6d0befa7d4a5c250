#pragma once

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "geolink/batch.hpp"
#include "geolink/config.hpp"
#include "geolink/divisions.hpp"
#include "geolink/feature_source.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/road_network.hpp"
#include "geolink/route_resolver.hpp"
#include "geolink/spatial_linker.hpp"

namespace geolink
{

// Request handlers behind the HTTP routes. Each takes and returns JSON and
// reports failures by throwing; http_status() maps them to a status code.
class GeoLinkService
{
public:
    GeoLinkService(FeatureSource &source, MemoryGraphStore &store, const EngineConfig &config);

    nlohmann::json enrich(const nlohmann::json &request);
    nlohmann::json load_road_network(const nlohmann::json &request);
    nlohmann::json shortest_path(const nlohmann::json &request) const;
    nlohmann::json check_network(const std::string &region_id) const;
    nlohmann::json save_snapshot();
    nlohmann::json list_resolvers() const;
    nlohmann::json health() const;

    // Running batches stop scheduling new points.
    void shutdown();

private:
    MemoryGraphStore &store_;
    EngineConfig config_;
    SpatialLinker linker_;
    DivisionHierarchyResolver divisions_;
    RoadNetworkBuilder network_;
    RouteResolver routes_;
    CancellationToken shutdown_;
};

int http_status(const std::exception &ex);

} // namespace geolink
