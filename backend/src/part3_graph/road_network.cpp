#include "geolink/road_network.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "geolink/geometry.hpp"
#include "geolink/kdtree.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

struct PointFetch
{
    std::vector<Feature> connectors;
    std::vector<Feature> segments;
    bool scheduled{false};
    bool skipped{false};
    bool failed{false};
};

GeoPoint connector_position(const Feature &connector)
{
    const Coord at = centroid(connector.geometry);
    return GeoPoint{at.y, at.x};
}

bool class_allowed(const Feature &segment, const std::vector<std::string> &road_classes)
{
    if (road_classes.empty())
    {
        return true;
    }
    const auto &attributes = std::get<RoadSegmentAttributes>(segment.attributes);
    return std::find(road_classes.begin(), road_classes.end(), attributes.road_class) != road_classes.end();
}

} // namespace

double segment_length(const Feature &segment, const GeoPoint &start, const GeoPoint &end)
{
    const auto &attributes = std::get<RoadSegmentAttributes>(segment.attributes);

    double length = 0.0;
    if (segment.geometry.type == GeometryType::line_string && segment.geometry.coords.size() >= 2)
    {
        length = polyline_length_metres(segment.geometry.coords);
    }
    else if (attributes.length_m)
    {
        length = *attributes.length_m;
    }

    const double straight = haversine(start.lat, start.lon, end.lat, end.lon);
    return std::max(length, straight);
}

RoadNetworkBuilder::RoadNetworkBuilder(FeatureSource &source, GraphStore &store, const EngineConfig &config)
    : source_(source),
      store_(store),
      settings_(config.road_network),
      max_parallel_(config.batch.max_parallel),
      timeout_(config.feature_source.timeout)
{
}

NetworkBatch RoadNetworkBuilder::ingest(const std::vector<InputPoint> &points, double radius_km,
                                        const std::vector<std::string> &road_classes, const CancellationToken *cancel)
{
    std::vector<PointFetch> fetched(points.size());

    run_batch(points, max_parallel_, cancel, [&](const InputPoint &point, std::size_t index)
              {
        PointFetch &fetch = fetched[index];
        fetch.scheduled = true;
        if (!point.has_coordinates())
        {
            std::cout << "Skipping " << describe(point) << " - missing coordinates" << std::endl;
            fetch.skipped = true;
            return;
        }

        try
        {
            const BoundingBox bbox = box_around_km(point.position(), radius_km);
            fetch.segments = source_.query(FeatureKind::road_segment, bbox, settings_.feature_limit, timeout_);
            fetch.connectors = source_.query(FeatureKind::road_connector, bbox, settings_.feature_limit, timeout_);

            fetch.segments.erase(std::remove_if(fetch.segments.begin(), fetch.segments.end(), [&road_classes](const Feature &segment)
                                                { return !class_allowed(segment, road_classes); }),
                                 fetch.segments.end());

            std::cout << "Found " << fetch.connectors.size() << " connectors, " << fetch.segments.size()
                      << " segments near " << describe(point) << std::endl;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error querying road network near " << describe(point) << ": " << ex.what() << std::endl;
            fetch.connectors.clear();
            fetch.segments.clear();
            fetch.failed = true;
        } });

    // Merge in input order so the first fetch of a connector wins.
    NetworkBatch batch;
    std::set<std::string> seen;
    for (auto &fetch : fetched)
    {
        if (!fetch.scheduled)
        {
            continue;
        }
        if (fetch.skipped)
        {
            batch.skipped_points++;
            continue;
        }
        if (fetch.failed)
        {
            batch.failed_points++;
            continue;
        }
        batch.queried_points++;

        for (auto &connector : fetch.connectors)
        {
            if (seen.insert(connector.id).second)
            {
                batch.connectors.push_back(std::move(connector));
            }
        }
        for (auto &segment : fetch.segments)
        {
            batch.segments.push_back(std::move(segment));
        }
    }

    std::cout << "Total unique connectors: " << batch.connectors.size() << ", segments: " << batch.segments.size() << std::endl;
    return batch;
}

CommitSummary RoadNetworkBuilder::commit(const NetworkBatch &batch)
{
    CommitSummary summary;
    std::unordered_map<std::string, GeoPoint> committed;
    std::set<std::string> written_segments;

    for (const auto &connector : batch.connectors)
    {
        if (connector.geometry.type != GeometryType::point)
        {
            std::cerr << "Connector " << connector.id << " has no point geometry, skipping" << std::endl;
            continue;
        }

        const GeoPoint position = connector_position(connector);
        store_.upsert_node(labels::kIntersection, "intersection_id", connector.id,
                           {{"latitude", position.lat}, {"longitude", position.lon}, {"source", "overture"}});
        committed[connector.id] = position;
        summary.intersections++;
    }

    for (const auto &segment : batch.segments)
    {
        const auto &attributes = std::get<RoadSegmentAttributes>(segment.attributes);
        if (attributes.connector_ids.size() < 2)
        {
            std::cout << "Dropping segment " << segment.id << ": fewer than 2 connectors" << std::endl;
            summary.dropped_segments++;
            continue;
        }

        const std::string &start_id = attributes.connector_ids.front();
        const std::string &end_id = attributes.connector_ids.back();
        const auto start = committed.find(start_id);
        const auto end = committed.find(end_id);
        if (start == committed.end() || end == committed.end())
        {
            std::cout << "Dropping segment " << segment.id << ": connector not in network" << std::endl;
            summary.dropped_segments++;
            continue;
        }

        const double length = segment_length(segment, start->second, end->second);
        const bool written = store_.upsert_edge(relations::kRoadSegment, start_id, end_id,
                                                {{"segment_id", segment.id},
                                                 {"name", attributes.name ? json(*attributes.name) : json()},
                                                 {"road_class", attributes.road_class},
                                                 {"length", length}},
                                                segment.id);
        if (!written)
        {
            std::cerr << "Dropping segment " << segment.id << ": endpoints missing from graph" << std::endl;
            summary.dropped_segments++;
            continue;
        }
        if (written_segments.insert(segment.id).second)
        {
            summary.segments++;
        }
    }

    std::cout << "Road network loaded: " << summary.intersections << " intersections, " << summary.segments
              << " road segments (" << summary.dropped_segments << " dropped)" << std::endl;
    return summary;
}

std::size_t RoadNetworkBuilder::link_points(const std::vector<InputPoint> &points, const NetworkBatch &batch)
{
    std::vector<IndexedPoint> indexed;
    indexed.reserve(batch.connectors.size());
    for (const auto &connector : batch.connectors)
    {
        if (connector.geometry.type == GeometryType::point)
        {
            indexed.push_back({connector.id, connector_position(connector)});
        }
    }

    const IntersectionIndex index(std::move(indexed));
    if (index.empty())
    {
        std::cout << "No intersections to link against" << std::endl;
        return 0;
    }

    size_t linked = 0;
    for (const auto &point : points)
    {
        if (!point.has_coordinates())
        {
            continue;
        }

        const GeoPoint position = point.position();
        const auto nearest = index.nearest(position);
        if (!nearest)
        {
            continue;
        }

        upsert_input(store_, point);
        const double metres = haversine(position.lat, position.lon, nearest->position.lat, nearest->position.lon);
        // keyed by point so a later load replaces the previous entry intersection
        if (!store_.upsert_edge(relations::kNearestIntersection, point.id, nearest->id, {{"distance_m", metres}}, point.id))
        {
            std::cerr << "Failed to link " << point.id << " to intersection " << nearest->id << std::endl;
            continue;
        }
        linked++;
    }

    std::cout << "Linked " << linked << " points to their nearest intersection" << std::endl;
    return linked;
}

LoadSummary RoadNetworkBuilder::load(const std::vector<InputPoint> &points, const CancellationToken *cancel)
{
    return load(points, settings_.radius_km, settings_.road_classes, cancel);
}

LoadSummary RoadNetworkBuilder::load(const std::vector<InputPoint> &points, double radius_km,
                                     const std::vector<std::string> &road_classes, const CancellationToken *cancel)
{
    std::cout << "Road network load started for " << points.size() << " points (radius " << radius_km << " km)" << std::endl;

    const NetworkBatch batch = ingest(points, radius_km, road_classes, cancel);
    const CommitSummary committed = commit(batch);

    LoadSummary summary;
    summary.queried_points = batch.queried_points;
    summary.skipped_points = batch.skipped_points;
    summary.failed_points = batch.failed_points;
    summary.intersections = committed.intersections;
    summary.segments = committed.segments;
    summary.dropped_segments = committed.dropped_segments;
    summary.linked_points = link_points(points, batch);
    return summary;
}

} // namespace geolink
