#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geolink/api.hpp"
#include "geolink/batch.hpp"
#include "geolink/divisions.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/road_network.hpp"
#include "geolink/spatial_linker.hpp"
#include "geolink/types.hpp"

namespace geolink
{

enum class ResolverKind
{
    resolve_building,
    resolve_division,
    link_address_to_street,
    link_location_to_address,
    link_place_to_address,
    location_to_places,
    ip_to_places,
    load_road_network
};

struct ResolverInfo
{
    ResolverKind kind;
    const char *name;
    const char *description;
    std::vector<InputKind> accepts;
};

const std::vector<ResolverInfo> &resolver_table();
const ResolverInfo &resolver_info(ResolverKind kind);
std::optional<ResolverKind> parse_resolver(const std::string &name);
bool accepts(ResolverKind kind, InputKind input);

struct EnrichmentServices
{
    SpatialLinker &linker;
    DivisionHierarchyResolver &divisions;
    RoadNetworkBuilder &network;
    GraphStore &store;
    std::size_t max_parallel;
};

// Points of a kind the resolver does not accept are reported as rejected.
nlohmann::json run_resolver(ResolverKind kind, EnrichmentServices &services, const std::vector<InputPoint> &points,
                            const ResolverParams &params, const CancellationToken *cancel = nullptr);

} // namespace geolink
