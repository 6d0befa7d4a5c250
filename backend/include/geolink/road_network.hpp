#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "geolink/batch.hpp"
#include "geolink/config.hpp"
#include "geolink/feature_source.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/types.hpp"

namespace geolink
{

// Everything fetched for one load, before any graph write.
struct NetworkBatch
{
    // unique by id, first fetch wins
    std::vector<Feature> connectors;
    std::vector<Feature> segments;
    std::size_t queried_points{0};
    std::size_t skipped_points{0};
    std::size_t failed_points{0};
};

struct CommitSummary
{
    std::size_t intersections{0};
    std::size_t segments{0};
    std::size_t dropped_segments{0};
};

struct LoadSummary
{
    std::size_t queried_points{0};
    std::size_t skipped_points{0};
    std::size_t failed_points{0};
    std::size_t intersections{0};
    std::size_t segments{0};
    std::size_t dropped_segments{0};
    std::size_t linked_points{0};
};

// Polyline length, or the provider's length_m without a polyline; never
// shorter than the straight line between its ends.
double segment_length(const Feature &segment, const GeoPoint &start, const GeoPoint &end);

class RoadNetworkBuilder
{
public:
    RoadNetworkBuilder(FeatureSource &source, GraphStore &store, const EngineConfig &config);

    // Empty road_classes admits every class.
    NetworkBatch ingest(const std::vector<InputPoint> &points, double radius_km, const std::vector<std::string> &road_classes,
                        const CancellationToken *cancel = nullptr);
    CommitSummary commit(const NetworkBatch &batch);
    std::size_t link_points(const std::vector<InputPoint> &points, const NetworkBatch &batch);

    LoadSummary load(const std::vector<InputPoint> &points, const CancellationToken *cancel = nullptr);
    LoadSummary load(const std::vector<InputPoint> &points, double radius_km, const std::vector<std::string> &road_classes,
                     const CancellationToken *cancel = nullptr);

    const RoadNetworkSettings &settings() const { return settings_; }

private:
    FeatureSource &source_;
    GraphStore &store_;
    RoadNetworkSettings settings_;
    std::size_t max_parallel_;
    std::chrono::milliseconds timeout_;
};

} // namespace geolink
