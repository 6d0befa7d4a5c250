#include "geolink/spatial_linker.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <limits>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "geolink/errors.hpp"
#include "geolink/geometry.hpp"
#include "geolink/matcher.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

std::string lowercase(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return value;
}

json optional_string(const std::optional<std::string> &value)
{
    return value ? json(*value) : json();
}

GeoPoint to_geo(const Coord &coord)
{
    return GeoPoint{coord.y, coord.x};
}

std::string canonical_address(const AddressAttributes &attributes, const std::string &fallback)
{
    const std::string number = attributes.number.value_or("");
    const std::string street = attributes.street.value_or("");
    if (!number.empty() && !street.empty())
    {
        return number + " " + street;
    }
    return fallback;
}

bool category_matches(const std::string &category, const std::vector<std::string> &filters)
{
    if (filters.empty())
    {
        return true;
    }
    const std::string haystack = lowercase(category);
    for (const auto &filter : filters)
    {
        if (haystack.find(lowercase(filter)) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

} // namespace

std::string to_string(Resolution resolution)
{
    switch (resolution)
    {
    case Resolution::building:
        return "building";
    case Resolution::street:
        return "street";
    case Resolution::address:
        return "address";
    case Resolution::place_address:
        return "place_address";
    }
    return "unknown";
}

std::string to_string(Outcome outcome)
{
    switch (outcome)
    {
    case Outcome::linked:
        return "linked";
    case Outcome::no_candidate:
        return "no_candidate";
    case Outcome::missing_coordinates:
        return "missing_coordinates";
    case Outcome::failed:
        return "failed";
    }
    return "unknown";
}

std::size_t LinkReport::count(Outcome outcome) const
{
    return static_cast<std::size_t>(std::count_if(records.begin(), records.end(), [outcome](const ResolutionRecord &record)
                                                  { return record.outcome == outcome; }));
}

void LinkReport::append(const LinkReport &other)
{
    records.insert(records.end(), other.records.begin(), other.records.end());
}

SpatialLinker::SpatialLinker(FeatureSource &source, GraphStore &store, const EngineConfig &config)
    : source_(source),
      store_(store),
      matching_(config.matching),
      places_(config.places),
      max_parallel_(config.batch.max_parallel),
      timeout_(config.feature_source.timeout),
      divisions_(source, store, config.divisions, config.feature_source.timeout)
{
}

std::optional<BuildingMatch> SpatialLinker::resolve_building(const InputPoint &point)
{
    const GeoPoint position = point.position();
    upsert_input(store_, point);
    const auto candidates = source_.query(FeatureKind::building, box_around(position, matching_.building_buffer_deg),
                                          matching_.building_limit, timeout_);

    const auto match = containing_or_nearest(position, candidates, metres_to_degrees(matching_.building_fallback_m));
    if (!match)
    {
        return std::nullopt;
    }

    const Feature &building = *match->feature;
    const auto &attributes = std::get<BuildingAttributes>(building.attributes);

    BuildingMatch result;
    result.gers_id = building.id;
    result.centroid = to_geo(centroid(building.geometry));
    result.contained = match->contained;
    result.distance_deg = match->distance;
    if (attributes.name && !attributes.name->empty())
    {
        result.name = *attributes.name;
    }
    else if (attributes.building_class)
    {
        result.name = "Building (" + *attributes.building_class + ")";
    }
    else
    {
        result.name = "Building";
    }

    store_.upsert_node(labels::kBuilding, "gers_id", result.gers_id,
                       {{"name", result.name},
                        {"height", attributes.height ? json(*attributes.height) : json()},
                        {"levels", attributes.num_floors ? json(*attributes.num_floors) : json()},
                        {"type_class", optional_string(attributes.building_class)},
                        {"latitude", result.centroid.lat},
                        {"longitude", result.centroid.lon},
                        {"geometry", to_wkt(building.geometry)}});
    if (!store_.upsert_edge(relations::kLocatedIn, point.id, result.gers_id,
                            {{"contained", result.contained}, {"distance_m", result.distance_deg * kMetresPerDegree}}))
    {
        std::cerr << "Failed to link " << point.id << " to building " << result.gers_id << std::endl;
    }
    return result;
}

std::optional<StreetMatch> SpatialLinker::resolve_street(const InputPoint &point)
{
    const GeoPoint position = point.position();
    upsert_input(store_, point);
    const auto candidates = source_.query(FeatureKind::road_segment, box_around_km(position, matching_.street_radius_km),
                                          matching_.street_limit, timeout_);

    const auto match = nearest(position, candidates, kUnbounded);
    if (!match)
    {
        return std::nullopt;
    }

    const Feature &segment = *match->feature;
    const auto &attributes = std::get<RoadSegmentAttributes>(segment.attributes);
    const GeoPoint middle = to_geo(centroid(segment.geometry));

    StreetMatch result;
    result.gers_id = segment.id;
    result.name = attributes.name && !attributes.name->empty() ? *attributes.name : "Unnamed Road";
    result.road_class = attributes.road_class;
    result.distance_deg = match->distance;

    store_.upsert_node(labels::kRoadSegment, "gers_id", result.gers_id,
                       {{"name", result.name},
                        {"road_class", result.road_class},
                        {"latitude", middle.lat},
                        {"longitude", middle.lon}});
    if (!store_.upsert_edge(relations::kLocatedOn, point.id, result.gers_id,
                            {{"distance_m", result.distance_deg * kMetresPerDegree}}))
    {
        std::cerr << "Failed to link " << point.id << " to street " << result.gers_id << std::endl;
    }
    return result;
}

std::optional<AddressMatch> SpatialLinker::match_address(const InputPoint &point, double max_distance_m,
                                                         const char *relationship, bool bridge_divisions)
{
    const GeoPoint position = point.position();
    upsert_input(store_, point);
    const auto candidates = source_.query(FeatureKind::address, box_around(position, matching_.address_buffer_deg),
                                          matching_.address_limit, timeout_);

    const auto match = nearest(position, candidates, metres_to_degrees(max_distance_m));
    if (!match)
    {
        return std::nullopt;
    }

    const Feature &address = *match->feature;
    const auto &attributes = std::get<AddressAttributes>(address.attributes);
    const std::string fallback = point.address.empty() ? point.name : point.address;

    AddressMatch result;
    result.gers_id = address.id;
    result.address = canonical_address(attributes, fallback);
    result.zip = attributes.postcode.value_or("");
    result.position = address.geometry.type == GeometryType::empty ? position : to_geo(centroid(address.geometry));
    result.distance_deg = match->distance;

    store_.upsert_node(labels::kLocation, "gers_id", result.gers_id,
                       {{"address", result.address},
                        {"zip", result.zip.empty() ? json() : json(result.zip)},
                        {"city", point.city.empty() ? json() : json(point.city)},
                        {"latitude", result.position.lat},
                        {"longitude", result.position.lon}});
    if (!store_.upsert_edge(relationship, point.id, result.gers_id,
                            {{"distance_m", result.distance_deg * kMetresPerDegree}}))
    {
        std::cerr << "Failed to link " << point.id << " to address " << result.gers_id << std::endl;
    }

    if (bridge_divisions)
    {
        try
        {
            result.division_count = divisions_.resolve(result.gers_id, result.position).containing.size();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Address " << result.gers_id << " matched but division lookup failed: " << ex.what() << std::endl;
        }
    }
    return result;
}

std::optional<AddressMatch> SpatialLinker::resolve_address(const InputPoint &point)
{
    return match_address(point, matching_.address_match_m, relations::kSameAs, true);
}

std::optional<AddressMatch> SpatialLinker::resolve_place_address(const InputPoint &point)
{
    return match_address(point, matching_.place_address_m, relations::kHasAddress, false);
}

std::vector<PlaceMatch> SpatialLinker::find_nearby_places(const std::vector<InputPoint> &points, const PlaceSearch &search,
                                                         const CancellationToken *cancel)
{
    std::vector<const InputPoint *> anchors;
    for (const auto &point : points)
    {
        if (point.has_coordinates())
        {
            upsert_input(store_, point);
            anchors.push_back(&point);
        }
        else
        {
            std::cerr << "Skipping nearby places for " << describe(point) << ": no coordinates" << std::endl;
        }
    }

    const std::vector<std::string> &categories = search.categories.empty() ? places_.categories : search.categories;

    // Nearest first, truncated to the per-anchor limit.
    std::vector<std::vector<Feature>> nearby(anchors.size());
    const std::size_t scheduled = run_batch(anchors, max_parallel_, cancel, [&](const InputPoint *anchor, std::size_t index)
                                            {
        const bool by_ip = anchor->kind == InputKind::ip_address;
        const double radius_km = search.radius_km.value_or(by_ip ? places_.ip_radius_km : places_.radius_km);
        const std::size_t limit = search.limit.value_or(by_ip ? places_.ip_limit : places_.limit);
        const GeoPoint origin = anchor->position();
        const Coord target{origin.lon, origin.lat};

        std::vector<Feature> candidates;
        try
        {
            candidates = source_.query(FeatureKind::place, box_around_km(origin, radius_km), places_.candidate_limit, timeout_);
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error finding places near " << describe(*anchor) << ": " << ex.what() << std::endl;
            return;
        }

        std::vector<std::pair<double, std::size_t>> ranked;
        for (std::size_t i = 0; i < candidates.size(); i++)
        {
            const Feature &candidate = candidates[i];
            if (candidate.geometry.type == GeometryType::empty ||
                !category_matches(std::get<PlaceAttributes>(candidate.attributes).category, categories))
            {
                continue;
            }
            ranked.emplace_back(distance(candidate.geometry, target), i);
        }
        std::stable_sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b)
                         { return a.first < b.first; });
        if (ranked.size() > limit)
        {
            ranked.resize(limit);
        }

        std::vector<Feature> &kept = nearby[index];
        for (const auto &entry : ranked)
        {
            kept.push_back(std::move(candidates[entry.second]));
        } });

    std::vector<PlaceMatch> matches;
    std::set<std::string> seen;

    for (const auto &features : nearby)
    {
        for (const Feature &feature : features)
        {
            if (!seen.insert(feature.id).second)
            {
                continue;
            }

            const auto &attributes = std::get<PlaceAttributes>(feature.attributes);
            const Coord at = centroid(feature.geometry);

            // Link from whichever input of the batch lies closest.
            const InputPoint *closest = anchors.front();
            double best = std::numeric_limits<double>::infinity();
            for (const InputPoint *other : anchors)
            {
                const double d = planar_distance(Coord{*other->lon, *other->lat}, at);
                if (d < best)
                {
                    best = d;
                    closest = other;
                }
            }

            PlaceMatch match;
            match.gers_id = feature.id;
            match.name = attributes.name;
            match.category = attributes.category;
            match.position = to_geo(at);
            match.linked_from = closest->id;

            store_.upsert_node(labels::kPlace, "gers_id", match.gers_id,
                               {{"name", match.name},
                                {"category", match.category},
                                {"latitude", match.position.lat},
                                {"longitude", match.position.lon},
                                {"confidence", attributes.confidence ? json(*attributes.confidence) : json()},
                                {"address", optional_string(attributes.address)},
                                {"brand", optional_string(attributes.brand)},
                                {"source", optional_string(attributes.source)},
                                {"websites", attributes.websites},
                                {"phones", attributes.phones},
                                {"socials", attributes.socials}});

            const char *relationship = closest->kind == InputKind::ip_address ? relations::kGeolocatesNear
                                                                              : relations::kHasNearbyPlace;
            if (!store_.upsert_edge(relationship, closest->id, match.gers_id, {{"distance_m", best * kMetresPerDegree}}))
            {
                std::cerr << "Failed to link " << closest->id << " to place " << match.gers_id << std::endl;
                continue;
            }
            matches.push_back(match);
        }
    }

    std::cout << "Linked " << matches.size() << " nearby places for " << scheduled << " of " << anchors.size()
              << " points" << std::endl;
    return matches;
}

LinkReport SpatialLinker::link(const InputPoint &point, const std::vector<Resolution> &resolutions)
{
    LinkReport report;
    upsert_input(store_, point);

    for (const Resolution resolution : resolutions)
    {
        ResolutionRecord record;
        record.point_id = point.id;
        record.resolver = to_string(resolution);

        try
        {
            std::optional<std::string> target;
            switch (resolution)
            {
            case Resolution::building:
                if (const auto match = resolve_building(point))
                {
                    target = match->gers_id;
                }
                break;
            case Resolution::street:
                if (const auto match = resolve_street(point))
                {
                    target = match->gers_id;
                }
                break;
            case Resolution::address:
                if (const auto match = resolve_address(point))
                {
                    target = match->gers_id;
                }
                break;
            case Resolution::place_address:
                if (const auto match = resolve_place_address(point))
                {
                    target = match->gers_id;
                }
                break;
            }

            if (target)
            {
                record.outcome = Outcome::linked;
                record.target_key = *target;
            }
            else
            {
                record.outcome = Outcome::no_candidate;
            }
        }
        catch (const MissingCoordinates &ex)
        {
            record.outcome = Outcome::missing_coordinates;
            record.detail = ex.what();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error resolving " << record.resolver << " for " << describe(point) << ": " << ex.what() << std::endl;
            record.outcome = Outcome::failed;
            record.detail = ex.what();
        }

        report.records.push_back(record);
    }
    return report;
}

LinkReport SpatialLinker::link_batch(const std::vector<InputPoint> &points, const std::vector<Resolution> &resolutions,
                                     const CancellationToken *cancel)
{
    LinkReport report;
    std::mutex report_mutex;

    const std::size_t scheduled = run_batch(points, max_parallel_, cancel, [&](const InputPoint &point, std::size_t)
                                            {
        LinkReport single = link(point, resolutions);
        std::lock_guard<std::mutex> guard(report_mutex);
        report.append(single); });

    std::cout << "Linked batch: " << scheduled << " of " << points.size() << " points, "
              << report.count(Outcome::linked) << " links, " << report.count(Outcome::failed) << " failures" << std::endl;
    return report;
}

} // namespace geolink
