#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "geolink/types.hpp"

namespace geolink
{

struct RoadGraph
{
    std::unordered_map<std::string, GeoPoint> nodes;
    std::unordered_map<std::string, std::vector<std::pair<std::string, double>>> adjacency;

    void add_node(const std::string &id, const GeoPoint &position);
    // Undirected: both directions are traversable.
    void add_edge(const std::string &from, const std::string &to, double weight);
};

class PathStrategy
{
public:
    virtual ~PathStrategy() = default;
    virtual RouteResult search(const RoadGraph &graph, const std::string &source, const std::string &target) const = 0;
};

// Dijkstra; frontier ties break by insertion order.
class UniformCostSearch : public PathStrategy
{
public:
    RouteResult search(const RoadGraph &graph, const std::string &source, const std::string &target) const override;
};

// A* with the haversine distance to the target as heuristic.
class HeuristicSearch : public PathStrategy
{
public:
    RouteResult search(const RoadGraph &graph, const std::string &source, const std::string &target) const override;
};

std::unique_ptr<PathStrategy> make_path_strategy(PathAlgorithm algorithm);

} // namespace geolink
