#include "geolink/resolvers.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "geolink/errors.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

json link_with(EnrichmentServices &services, const std::vector<InputPoint> &points, Resolution resolution,
               const CancellationToken *cancel)
{
    return to_json(services.linker.link_batch(points, {resolution}, cancel));
}

json resolve_divisions(EnrichmentServices &services, const std::vector<InputPoint> &points, const CancellationToken *cancel)
{
    std::vector<json> per_point(points.size());

    run_batch(points, services.max_parallel, cancel, [&](const InputPoint &point, std::size_t index)
              {
        json entry = {{"point_id", point.id}};
        if (!point.has_coordinates())
        {
            entry["outcome"] = to_string(Outcome::missing_coordinates);
            per_point[index] = entry;
            return;
        }

        try
        {
            upsert_input(services.store, point);
            const DivisionResolution resolution = services.divisions.resolve(point.id, point.position());

            json divisions = json::array();
            for (const auto &division : resolution.containing)
            {
                divisions.push_back({{"gers_id", division.gers_id}, {"name", division.name}, {"subtype", division.subtype}});
            }
            entry["outcome"] = to_string(resolution.containing.empty() ? Outcome::no_candidate : Outcome::linked);
            entry["divisions"] = divisions;
            entry["hierarchy_links"] = resolution.hierarchy_links.size();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error resolving divisions for " << describe(point) << ": " << ex.what() << std::endl;
            entry["outcome"] = to_string(Outcome::failed);
            entry["detail"] = ex.what();
        }
        per_point[index] = entry; });

    json records = json::array();
    for (auto &entry : per_point)
    {
        if (!entry.is_null())
        {
            records.push_back(std::move(entry));
        }
    }
    return {{"records", records}};
}

json find_places(EnrichmentServices &services, const std::vector<InputPoint> &points, const ResolverParams &params,
                 const CancellationToken *cancel)
{
    PlaceSearch search;
    search.radius_km = params.radius_km;
    search.limit = params.limit;
    search.categories = params.categories;

    json places = json::array();
    for (const auto &place : services.linker.find_nearby_places(points, search, cancel))
    {
        places.push_back(to_json(place));
    }
    return {{"count", places.size()}, {"places", places}};
}

json load_network(EnrichmentServices &services, const std::vector<InputPoint> &points, const ResolverParams &params,
                  const CancellationToken *cancel)
{
    const RoadNetworkSettings &defaults = services.network.settings();
    const double radius_km = params.radius_km.value_or(defaults.radius_km);
    if (radius_km < 0.5 || radius_km > 10.0)
    {
        throw InvalidRequest("'radius_km' must be within 0.5-10");
    }

    const auto &road_classes = params.road_classes.empty() ? defaults.road_classes : params.road_classes;
    const LoadSummary summary = services.network.load(points, radius_km, road_classes, cancel);
    return to_json(summary);
}

} // namespace

const std::vector<ResolverInfo> &resolver_table()
{
    static const std::vector<ResolverInfo> table = {
        {ResolverKind::resolve_building, "resolve_building",
         "Link a location to the building that contains it, or the nearest one within 220 m", {InputKind::location}},
        {ResolverKind::resolve_division, "resolve_division",
         "Link a location to its administrative divisions and chain them", {InputKind::location}},
        {ResolverKind::link_address_to_street, "link_address_to_street",
         "Link a location to the nearest road segment", {InputKind::location}},
        {ResolverKind::link_location_to_address, "link_location_to_address",
         "Match a location to a canonical address point and its divisions", {InputKind::location}},
        {ResolverKind::link_place_to_address, "link_place_to_address",
         "Match a place to a canonical address point", {InputKind::place}},
        {ResolverKind::location_to_places, "location_to_places",
         "Find places near a location", {InputKind::location}},
        {ResolverKind::ip_to_places, "ip_to_places",
         "Find places near a geolocated IP address", {InputKind::ip_address}},
        {ResolverKind::load_road_network, "load_road_network",
         "Load the road network around points and link them to it", {InputKind::location, InputKind::place}},
    };
    return table;
}

const ResolverInfo &resolver_info(ResolverKind kind)
{
    for (const auto &info : resolver_table())
    {
        if (info.kind == kind)
        {
            return info;
        }
    }
    throw GeoLinkError("resolver missing from table");
}

std::optional<ResolverKind> parse_resolver(const std::string &name)
{
    for (const auto &info : resolver_table())
    {
        if (name == info.name)
        {
            return info.kind;
        }
    }
    return std::nullopt;
}

bool accepts(ResolverKind kind, InputKind input)
{
    const auto &allowed = resolver_info(kind).accepts;
    return std::find(allowed.begin(), allowed.end(), input) != allowed.end();
}

json run_resolver(ResolverKind kind, EnrichmentServices &services, const std::vector<InputPoint> &points,
                  const ResolverParams &params, const CancellationToken *cancel)
{
    const ResolverInfo &info = resolver_info(kind);

    std::vector<InputPoint> accepted;
    json rejected = json::array();
    for (const auto &point : points)
    {
        if (accepts(kind, point.kind))
        {
            accepted.push_back(point);
        }
        else
        {
            rejected.push_back(point.id);
        }
    }

    std::cout << "Running " << info.name << " on " << accepted.size() << " points";
    if (!rejected.empty())
    {
        std::cout << " (" << rejected.size() << " rejected)";
    }
    std::cout << std::endl;

    json report;
    switch (kind)
    {
    case ResolverKind::resolve_building:
        report = link_with(services, accepted, Resolution::building, cancel);
        break;
    case ResolverKind::resolve_division:
        report = resolve_divisions(services, accepted, cancel);
        break;
    case ResolverKind::link_address_to_street:
        report = link_with(services, accepted, Resolution::street, cancel);
        break;
    case ResolverKind::link_location_to_address:
        report = link_with(services, accepted, Resolution::address, cancel);
        break;
    case ResolverKind::link_place_to_address:
        report = link_with(services, accepted, Resolution::place_address, cancel);
        break;
    case ResolverKind::location_to_places:
    case ResolverKind::ip_to_places:
        report = find_places(services, accepted, params, cancel);
        break;
    case ResolverKind::load_road_network:
        report = load_network(services, accepted, params, cancel);
        break;
    }

    report["resolver"] = info.name;
    report["points"] = accepted.size();
    report["rejected"] = rejected;
    return report;
}

} // namespace geolink
