#pragma once

#include <string>
#include <utility>

#include "geolink/graph_store.hpp"
#include "geolink/types.hpp"

namespace geolink
{

class RouteResolver
{
public:
    explicit RouteResolver(const GraphStore &store);

    // Maps both point ids to their NEAREST_INTERSECTION targets.
    // Throws NodeNotFound for unknown ids and UnlinkedEndpoint for unlinked points.
    std::pair<std::string, std::string> resolve_endpoints(const std::string &origin_id, const std::string &destination_id) const;

    RouteResult route(const std::string &origin_id, const std::string &destination_id, PathAlgorithm algorithm) const;
    RouteResponse query(const RouteQuery &query) const;

    NetworkStatus network_status(const std::string &region_id) const;

private:
    std::string entry_intersection(const std::string &point_id) const;

    const GraphStore &store_;
};

} // namespace geolink
