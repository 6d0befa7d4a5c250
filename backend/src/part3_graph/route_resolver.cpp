#include "geolink/route_resolver.hpp"

#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "geolink/errors.hpp"

namespace geolink
{

RouteResolver::RouteResolver(const GraphStore &store)
    : store_(store)
{
}

std::string RouteResolver::entry_intersection(const std::string &point_id) const
{
    if (!store_.find_node(point_id))
    {
        throw NodeNotFound(point_id);
    }

    const auto targets = store_.edge_targets(point_id, relations::kNearestIntersection);
    if (targets.empty())
    {
        throw UnlinkedEndpoint("'" + point_id + "' is not linked to the road network; load the road network around it first");
    }
    return targets.front().key;
}

std::pair<std::string, std::string> RouteResolver::resolve_endpoints(const std::string &origin_id,
                                                                     const std::string &destination_id) const
{
    return {entry_intersection(origin_id), entry_intersection(destination_id)};
}

RouteResult RouteResolver::route(const std::string &origin_id, const std::string &destination_id, PathAlgorithm algorithm) const
{
    const auto [source, target] = resolve_endpoints(origin_id, destination_id);
    std::cout << "Routing " << origin_id << " -> " << destination_id << " via " << source << " -> " << target
              << " (" << to_string(algorithm) << ")" << std::endl;
    return store_.shortest_path(source, target, relations::kRoadSegment, "length", algorithm);
}

RouteResponse RouteResolver::query(const RouteQuery &query) const
{
    const RouteResult result = route(query.origin_id, query.destination_id, query.algorithm);

    RouteResponse response;
    if (!result.found)
    {
        response.message = "No path found between the specified locations. The road network may be incomplete.";
        return response;
    }

    response.route = result.waypoints;
    response.distance_m = result.total_weight;
    response.intersection_count = result.node_count;
    response.found = true;
    response.message = "Route found with " + std::to_string(result.node_count) + " intersections";
    return response;
}

NetworkStatus RouteResolver::network_status(const std::string &region_id) const
{
    NetworkStatus status;
    status.intersection_count = store_.count_nodes(labels::kIntersection);
    status.segment_count = store_.count_edges(relations::kRoadSegment);

    std::set<std::string> linked;
    for (const auto &edge : store_.edges_of_type(relations::kNearestIntersection))
    {
        if (linked.count(edge.from))
        {
            continue;
        }
        if (region_id.empty())
        {
            linked.insert(edge.from);
            continue;
        }

        const auto node = store_.find_node(edge.from);
        if (node && node->attributes.value("region_id", std::string()) == region_id)
        {
            linked.insert(edge.from);
        }
    }

    status.linked_point_count = linked.size();
    status.has_network = status.intersection_count > 0 && status.segment_count > 0;
    return status;
}

} // namespace geolink
