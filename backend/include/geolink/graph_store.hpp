#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geolink/routing.hpp"
#include "geolink/types.hpp"

namespace geolink
{

class GraphStore
{
public:
    virtual ~GraphStore() = default;

    // Create-or-update by key; repeated identical calls leave the same state.
    virtual void upsert_node(const std::string &label, const std::string &key_field, const std::string &key_value,
                             const nlohmann::json &attributes) = 0;

    // Merges by (type, edge_key) when edge_key is given, else by (type, from, to).
    // Returns false without writing when either endpoint node is unknown.
    virtual bool upsert_edge(const std::string &relationship_type, const std::string &from_key, const std::string &to_key,
                             const nlohmann::json &attributes, const std::optional<std::string> &edge_key = std::nullopt) = 0;

    virtual RouteResult shortest_path(const std::string &source_key, const std::string &target_key, const std::string &edge_type,
                                      const std::string &weight_attribute, PathAlgorithm algorithm) const = 0;

    virtual std::optional<GraphNode> find_node(const std::string &key) const = 0;
    virtual std::vector<GraphNode> edge_targets(const std::string &from_key, const std::string &relationship_type) const = 0;
    virtual std::vector<GraphEdge> edges_of_type(const std::string &relationship_type) const = 0;
    virtual std::size_t count_nodes(const std::string &label) const = 0;
    virtual std::size_t count_edges(const std::string &relationship_type) const = 0;
};

// Input points are keyed by "id" under the label of their kind.
void upsert_input(GraphStore &store, const InputPoint &point);

class MemoryGraphStore : public GraphStore
{
public:
    explicit MemoryGraphStore(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

    void upsert_node(const std::string &label, const std::string &key_field, const std::string &key_value,
                     const nlohmann::json &attributes) override;
    bool upsert_edge(const std::string &relationship_type, const std::string &from_key, const std::string &to_key,
                     const nlohmann::json &attributes, const std::optional<std::string> &edge_key = std::nullopt) override;

    RouteResult shortest_path(const std::string &source_key, const std::string &target_key, const std::string &edge_type,
                              const std::string &weight_attribute, PathAlgorithm algorithm) const override;

    std::optional<GraphNode> find_node(const std::string &key) const override;
    std::vector<GraphNode> edge_targets(const std::string &from_key, const std::string &relationship_type) const override;
    std::vector<GraphEdge> edges_of_type(const std::string &relationship_type) const override;
    std::size_t count_nodes(const std::string &label) const override;
    std::size_t count_edges(const std::string &relationship_type) const override;

    std::size_t node_count() const;
    std::size_t edge_count() const;

    // Copies the weighted subgraph of one edge type; endpoints need latitude/longitude.
    RoadGraph road_graph(const std::string &edge_type, const std::string &weight_attribute) const;

    nlohmann::json to_json() const;
    void load_json(const nlohmann::json &snapshot);
    bool save_snapshot(const std::string &path) const;
    bool load_snapshot(const std::string &path);

private:
    std::shared_lock<std::shared_timed_mutex> read_lock() const;
    std::unique_lock<std::shared_timed_mutex> write_lock() const;
    static std::string edge_identity(const std::string &type, const std::string &from, const std::string &to,
                                     const std::optional<std::string> &edge_key);

    std::chrono::milliseconds lock_timeout_;
    mutable std::shared_timed_mutex mutex_;
    std::map<std::string, GraphNode> nodes_;
    std::map<std::string, GraphEdge> edges_;
};

} // namespace geolink
