#include "geolink/divisions.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "geolink/geometry.hpp"

namespace geolink
{

Division make_division(const Feature &feature)
{
    const auto &attributes = std::get<DivisionAttributes>(feature.attributes);

    Division division;
    division.gers_id = feature.id;
    division.subtype = attributes.subtype;
    division.country_iso = attributes.country_iso.value_or("");

    if (attributes.primary_name && !attributes.primary_name->empty())
    {
        division.name = *attributes.primary_name;
    }
    else if (attributes.common_name && !attributes.common_name->empty())
    {
        division.name = *attributes.common_name;
    }
    else
    {
        division.name = "Unknown";
    }
    return division;
}

std::vector<std::pair<std::string, std::string>> link_hierarchy(const std::map<std::string, Division> &by_kind,
                                                                const std::vector<std::string> &ordering)
{
    std::vector<std::pair<std::string, std::string>> links;

    for (size_t i = 0; i + 1 < ordering.size(); i++)
    {
        const auto child = by_kind.find(ordering[i]);
        if (child == by_kind.end())
        {
            continue;
        }

        for (size_t j = i + 1; j < ordering.size(); j++)
        {
            const auto parent = by_kind.find(ordering[j]);
            if (parent != by_kind.end())
            {
                links.emplace_back(child->second.gers_id, parent->second.gers_id);
                break;
            }
        }
    }
    return links;
}

DivisionHierarchyResolver::DivisionHierarchyResolver(FeatureSource &source, GraphStore &store, DivisionSettings settings,
                                                     std::chrono::milliseconds timeout)
    : source_(source), store_(store), settings_(std::move(settings)), timeout_(timeout)
{
}

DivisionResolution DivisionHierarchyResolver::resolve(const std::string &point_key, const GeoPoint &point)
{
    DivisionResolution resolution;

    const auto candidates = source_.query(FeatureKind::division, box_around(point, settings_.search_buffer_deg),
                                          settings_.limit, timeout_);
    const Coord target{point.lon, point.lat};

    for (const auto &candidate : candidates)
    {
        if (!contains(candidate.geometry, target))
        {
            continue;
        }

        const Division division = make_division(candidate);
        store_.upsert_node(labels::kDivision, "gers_id", division.gers_id,
                           {{"division_id", division.gers_id},
                            {"name", division.name},
                            {"subtype", division.subtype},
                            {"country_iso", division.country_iso.empty() ? nlohmann::json() : nlohmann::json(division.country_iso)}});
        if (!store_.upsert_edge(relations::kWithinDivision, point_key, division.gers_id, nlohmann::json::object()))
        {
            std::cerr << "Point " << point_key << " is not in the graph, division " << division.gers_id << " left unlinked" << std::endl;
        }
        resolution.containing.push_back(division);

        const bool ranked = std::find(settings_.hierarchy.begin(), settings_.hierarchy.end(), division.subtype) !=
                            settings_.hierarchy.end();
        if (ranked)
        {
            // last write wins for repeated kinds
            resolution.by_kind[division.subtype] = division;
        }
    }

    resolution.hierarchy_links = link_hierarchy(resolution.by_kind, settings_.hierarchy);
    for (const auto &[child, parent] : resolution.hierarchy_links)
    {
        if (!store_.upsert_edge(relations::kWithinDivision, child, parent, nlohmann::json::object()))
        {
            std::cerr << "Failed to link division " << child << " to " << parent << std::endl;
        }
    }

    std::cout << "Resolved " << resolution.containing.size() << " containing divisions and "
              << resolution.hierarchy_links.size() << " hierarchy links for " << point_key << std::endl;
    return resolution;
}

} // namespace geolink
