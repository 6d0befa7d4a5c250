#include "geolink/routing.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "geolink/geometry.hpp"

namespace geolink
{
namespace
{

struct FrontierEntry
{
    double priority{};
    std::uint64_t sequence{};
    std::string node_id;
    double g_score{};

    bool operator>(const FrontierEntry &other) const
    {
        if (priority != other.priority)
        {
            return priority > other.priority;
        }
        return sequence > other.sequence;
    }
};

using Frontier = std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, std::greater<FrontierEntry>>;
using Heuristic = std::function<double(const std::string &)>;

RouteResult reconstruct(const RoadGraph &graph, const std::unordered_map<std::string, std::string> &came_from,
                        const std::string &source, const std::string &target, double total_weight)
{
    RouteResult result;
    std::vector<std::string> path;

    std::string node = target;
    path.push_back(node);
    while (node != source)
    {
        node = came_from.at(node);
        path.push_back(node);
    }
    std::reverse(path.begin(), path.end());

    for (const auto &id : path)
    {
        result.waypoints.push_back(graph.nodes.at(id));
    }
    result.node_ids = std::move(path);
    result.node_count = result.node_ids.size();
    result.total_weight = total_weight;
    result.found = true;
    return result;
}

// Shared best-first loop; a zero heuristic makes it Dijkstra.
RouteResult best_first(const RoadGraph &graph, const std::string &source, const std::string &target, const Heuristic &heuristic)
{
    if (graph.nodes.find(source) == graph.nodes.end() || graph.nodes.find(target) == graph.nodes.end())
    {
        return {};
    }

    std::unordered_map<std::string, double> g_score;
    std::unordered_map<std::string, std::string> came_from;
    std::unordered_set<std::string> closed;
    Frontier open;
    std::uint64_t sequence = 0;

    g_score[source] = 0.0;
    open.push({heuristic(source), sequence++, source, 0.0});

    while (!open.empty())
    {
        const FrontierEntry current = open.top();
        open.pop();

        if (closed.count(current.node_id))
        {
            continue;
        }
        closed.insert(current.node_id);

        if (current.node_id == target)
        {
            return reconstruct(graph, came_from, source, target, current.g_score);
        }

        const auto edges = graph.adjacency.find(current.node_id);
        if (edges == graph.adjacency.end())
        {
            continue;
        }

        for (const auto &[neighbor, edge_weight] : edges->second)
        {
            if (closed.count(neighbor))
            {
                continue;
            }

            const double tentative_g = current.g_score + edge_weight;
            const auto known = g_score.find(neighbor);
            if (known == g_score.end() || tentative_g < known->second)
            {
                g_score[neighbor] = tentative_g;
                came_from[neighbor] = current.node_id;
                open.push({tentative_g + heuristic(neighbor), sequence++, neighbor, tentative_g});
            }
        }
    }

    return {};
}

} // namespace

void RoadGraph::add_node(const std::string &id, const GeoPoint &position)
{
    nodes[id] = position;
    adjacency[id];
}

void RoadGraph::add_edge(const std::string &from, const std::string &to, double weight)
{
    adjacency[from].push_back({to, weight});
    if (from != to)
    {
        adjacency[to].push_back({from, weight});
    }
}

RouteResult UniformCostSearch::search(const RoadGraph &graph, const std::string &source, const std::string &target) const
{
    return best_first(graph, source, target, [](const std::string &)
                      { return 0.0; });
}

RouteResult HeuristicSearch::search(const RoadGraph &graph, const std::string &source, const std::string &target) const
{
    const auto goal = graph.nodes.find(target);
    if (goal == graph.nodes.end())
    {
        return {};
    }
    const GeoPoint goal_position = goal->second;

    return best_first(graph, source, target, [&graph, goal_position](const std::string &node_id)
                      {
        const auto it = graph.nodes.find(node_id);
        if (it == graph.nodes.end())
        {
            return 0.0;
        }
        return haversine(it->second.lat, it->second.lon, goal_position.lat, goal_position.lon); });
}

std::unique_ptr<PathStrategy> make_path_strategy(PathAlgorithm algorithm)
{
    if (algorithm == PathAlgorithm::heuristic)
    {
        return std::make_unique<HeuristicSearch>();
    }
    return std::make_unique<UniformCostSearch>();
}

} // namespace geolink
