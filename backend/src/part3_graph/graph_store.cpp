#include "geolink/graph_store.hpp"

#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "geolink/errors.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

std::optional<GeoPoint> node_position(const GraphNode &node)
{
    const auto &attributes = node.attributes;
    if (!attributes.contains("latitude") || !attributes.contains("longitude") ||
        !attributes["latitude"].is_number() || !attributes["longitude"].is_number())
    {
        return std::nullopt;
    }
    return GeoPoint{attributes["latitude"].get<double>(), attributes["longitude"].get<double>()};
}

} // namespace

void upsert_input(GraphStore &store, const InputPoint &point)
{
    json attributes = json::object();
    if (point.has_coordinates())
    {
        attributes["latitude"] = *point.lat;
        attributes["longitude"] = *point.lon;
    }
    if (!point.address.empty())
    {
        attributes["address"] = point.address;
    }
    if (!point.city.empty())
    {
        attributes["city"] = point.city;
    }
    if (!point.name.empty())
    {
        attributes["name"] = point.name;
    }
    if (!point.category.empty())
    {
        attributes["category"] = point.category;
    }
    if (!point.region_id.empty())
    {
        attributes["region_id"] = point.region_id;
    }

    store.upsert_node(input_label(point.kind), "id", point.id, attributes);
}

MemoryGraphStore::MemoryGraphStore(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout)
{
}

std::shared_lock<std::shared_timed_mutex> MemoryGraphStore::read_lock() const
{
    std::shared_lock<std::shared_timed_mutex> lock(mutex_, lock_timeout_);
    if (!lock.owns_lock())
    {
        throw ProviderUnavailable("graph store read timed out");
    }
    return lock;
}

std::unique_lock<std::shared_timed_mutex> MemoryGraphStore::write_lock() const
{
    std::unique_lock<std::shared_timed_mutex> lock(mutex_, lock_timeout_);
    if (!lock.owns_lock())
    {
        throw ProviderUnavailable("graph store write timed out");
    }
    return lock;
}

std::string MemoryGraphStore::edge_identity(const std::string &type, const std::string &from, const std::string &to,
                                            const std::optional<std::string> &edge_key)
{
    if (edge_key)
    {
        return type + '\x1f' + *edge_key;
    }
    return type + '\x1f' + from + '\x1f' + to;
}

void MemoryGraphStore::upsert_node(const std::string &label, const std::string &key_field, const std::string &key_value,
                                   const json &attributes)
{
    if (key_value.empty())
    {
        throw GeoLinkError("cannot upsert " + label + " node without a " + key_field);
    }

    auto lock = write_lock();
    auto it = nodes_.find(key_value);
    if (it == nodes_.end())
    {
        GraphNode node;
        node.label = label;
        node.key_field = key_field;
        node.key = key_value;
        node.attributes = json::object();
        it = nodes_.emplace(key_value, std::move(node)).first;
    }

    GraphNode &node = it->second;
    node.label = label;
    node.key_field = key_field;
    if (attributes.is_object())
    {
        node.attributes.update(attributes);
    }
    node.attributes[key_field] = key_value;
}

bool MemoryGraphStore::upsert_edge(const std::string &relationship_type, const std::string &from_key, const std::string &to_key,
                                   const json &attributes, const std::optional<std::string> &edge_key)
{
    auto lock = write_lock();
    if (nodes_.find(from_key) == nodes_.end() || nodes_.find(to_key) == nodes_.end())
    {
        return false;
    }

    const std::string identity = edge_identity(relationship_type, from_key, to_key, edge_key);
    GraphEdge &edge = edges_[identity];
    edge.type = relationship_type;
    edge.from = from_key;
    edge.to = to_key;
    edge.key = edge_key;
    if (attributes.is_object())
    {
        edge.attributes.update(attributes);
    }
    return true;
}

RoadGraph MemoryGraphStore::road_graph(const std::string &edge_type, const std::string &weight_attribute) const
{
    RoadGraph graph;
    auto lock = read_lock();

    for (const auto &[identity, edge] : edges_)
    {
        if (edge.type != edge_type)
        {
            continue;
        }

        const auto weight = edge.attributes.find(weight_attribute);
        if (weight == edge.attributes.end() || !weight->is_number())
        {
            std::cerr << "Edge " << identity << " has no numeric " << weight_attribute << ", skipping" << std::endl;
            continue;
        }

        const auto from = node_position(nodes_.at(edge.from));
        const auto to = node_position(nodes_.at(edge.to));
        if (!from || !to)
        {
            continue;
        }

        graph.add_node(edge.from, *from);
        graph.add_node(edge.to, *to);
        graph.add_edge(edge.from, edge.to, weight->get<double>());
    }
    return graph;
}

RouteResult MemoryGraphStore::shortest_path(const std::string &source_key, const std::string &target_key, const std::string &edge_type,
                                            const std::string &weight_attribute, PathAlgorithm algorithm) const
{
    RoadGraph graph = road_graph(edge_type, weight_attribute);

    for (const auto &key : {source_key, target_key})
    {
        if (graph.nodes.count(key))
        {
            continue;
        }
        const auto node = find_node(key);
        if (node)
        {
            if (const auto position = node_position(*node))
            {
                graph.add_node(key, *position);
            }
        }
    }

    return make_path_strategy(algorithm)->search(graph, source_key, target_key);
}

std::optional<GraphNode> MemoryGraphStore::find_node(const std::string &key) const
{
    auto lock = read_lock();
    const auto it = nodes_.find(key);
    if (it == nodes_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<GraphNode> MemoryGraphStore::edge_targets(const std::string &from_key, const std::string &relationship_type) const
{
    std::vector<GraphNode> targets;
    auto lock = read_lock();
    for (const auto &[identity, edge] : edges_)
    {
        if (edge.type == relationship_type && edge.from == from_key)
        {
            targets.push_back(nodes_.at(edge.to));
        }
    }
    return targets;
}

std::vector<GraphEdge> MemoryGraphStore::edges_of_type(const std::string &relationship_type) const
{
    std::vector<GraphEdge> result;
    auto lock = read_lock();
    for (const auto &[identity, edge] : edges_)
    {
        if (edge.type == relationship_type)
        {
            result.push_back(edge);
        }
    }
    return result;
}

std::size_t MemoryGraphStore::count_nodes(const std::string &label) const
{
    size_t count = 0;
    auto lock = read_lock();
    for (const auto &[key, node] : nodes_)
    {
        if (node.label == label)
        {
            count++;
        }
    }
    return count;
}

std::size_t MemoryGraphStore::count_edges(const std::string &relationship_type) const
{
    size_t count = 0;
    auto lock = read_lock();
    for (const auto &[identity, edge] : edges_)
    {
        if (edge.type == relationship_type)
        {
            count++;
        }
    }
    return count;
}

std::size_t MemoryGraphStore::node_count() const
{
    auto lock = read_lock();
    return nodes_.size();
}

std::size_t MemoryGraphStore::edge_count() const
{
    auto lock = read_lock();
    return edges_.size();
}

json MemoryGraphStore::to_json() const
{
    auto lock = read_lock();

    json nodes = json::array();
    for (const auto &[key, node] : nodes_)
    {
        nodes.push_back({{"label", node.label},
                         {"key_field", node.key_field},
                         {"key", node.key},
                         {"attributes", node.attributes}});
    }

    json edges = json::array();
    for (const auto &[identity, edge] : edges_)
    {
        json edge_json = {{"type", edge.type},
                          {"from", edge.from},
                          {"to", edge.to},
                          {"attributes", edge.attributes}};
        if (edge.key)
        {
            edge_json["key"] = *edge.key;
        }
        edges.push_back(edge_json);
    }

    return {{"nodes", nodes}, {"edges", edges}};
}

void MemoryGraphStore::load_json(const json &snapshot)
{
    std::map<std::string, GraphNode> nodes;
    std::map<std::string, GraphEdge> edges;

    try
    {
        for (const auto &item : snapshot.at("nodes"))
        {
            GraphNode node;
            node.label = item.at("label").get<std::string>();
            node.key_field = item.at("key_field").get<std::string>();
            node.key = item.at("key").get<std::string>();
            node.attributes = item.value("attributes", json::object());
            nodes[node.key] = std::move(node);
        }

        for (const auto &item : snapshot.at("edges"))
        {
            GraphEdge edge;
            edge.type = item.at("type").get<std::string>();
            edge.from = item.at("from").get<std::string>();
            edge.to = item.at("to").get<std::string>();
            if (item.contains("key"))
            {
                edge.key = item.at("key").get<std::string>();
            }
            edge.attributes = item.value("attributes", json::object());
            if (!nodes.count(edge.from) || !nodes.count(edge.to))
            {
                throw GeoLinkError("edge references unknown node");
            }
            edges[edge_identity(edge.type, edge.from, edge.to, edge.key)] = std::move(edge);
        }
    }
    catch (const json::exception &ex)
    {
        throw GeoLinkError(std::string("malformed graph snapshot: ") + ex.what());
    }

    auto lock = write_lock();
    nodes_ = std::move(nodes);
    edges_ = std::move(edges);
}

bool MemoryGraphStore::save_snapshot(const std::string &path) const
{
    try
    {
        const json snapshot = to_json();

        std::ofstream out(path);
        if (!out.is_open())
        {
            std::cerr << "Unable to open " << path << std::endl;
            return false;
        }
        out << snapshot.dump(2);

        std::cout << "Saved graph snapshot to " << path << std::endl;
        return true;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error saving graph snapshot: " << ex.what() << std::endl;
        return false;
    }
}

bool MemoryGraphStore::load_snapshot(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        return false;
    }

    const json snapshot = json::parse(in, nullptr, false);
    if (snapshot.is_discarded())
    {
        throw GeoLinkError("graph snapshot " + path + " is not valid JSON");
    }

    load_json(snapshot);
    std::cout << "Loaded graph snapshot from " << path << " (" << node_count() << " nodes, "
              << edge_count() << " edges)" << std::endl;
    return true;
}

} // namespace geolink
