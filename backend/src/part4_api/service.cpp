#include "geolink/service.hpp"

#include <iostream>
#include <string>
#include <vector>

#include "geolink/api.hpp"
#include "geolink/errors.hpp"
#include "geolink/resolvers.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

const json &require(const json &request, const char *field)
{
    if (!request.is_object() || !request.contains(field))
    {
        throw InvalidRequest(std::string("missing '") + field + "'");
    }
    return request[field];
}

std::string require_string(const json &request, const char *field)
{
    const json &value = require(request, field);
    if (!value.is_string() || value.get<std::string>().empty())
    {
        throw InvalidRequest(std::string("'") + field + "' must be a non-empty string");
    }
    return value.get<std::string>();
}

} // namespace

GeoLinkService::GeoLinkService(FeatureSource &source, MemoryGraphStore &store, const EngineConfig &config)
    : store_(store),
      config_(config),
      linker_(source, store, config),
      divisions_(source, store, config.divisions, config.feature_source.timeout),
      network_(source, store, config),
      routes_(store)
{
}

json GeoLinkService::enrich(const json &request)
{
    const std::string name = require_string(request, "resolver");
    const auto kind = parse_resolver(name);
    if (!kind)
    {
        throw InvalidRequest("unknown resolver '" + name + "'");
    }

    const auto points = parse_input_points(require(request, "points"));
    const auto params = parse_resolver_params(request.value("params", json()));

    EnrichmentServices services{linker_, divisions_, network_, store_, config_.batch.max_parallel};
    json report = run_resolver(*kind, services, points, params, &shutdown_);
    report["status"] = "success";
    return report;
}

json GeoLinkService::load_road_network(const json &request)
{
    const auto points = parse_input_points(require(request, "points"));
    const auto params = parse_resolver_params(request);

    EnrichmentServices services{linker_, divisions_, network_, store_, config_.batch.max_parallel};
    json report = run_resolver(ResolverKind::load_road_network, services, points, params, &shutdown_);
    report["status"] = "success";
    return report;
}

json GeoLinkService::shortest_path(const json &request) const
{
    RouteQuery query;
    query.origin_id = require_string(request, "origin_node_id");
    query.destination_id = require_string(request, "destination_node_id");

    const std::string algorithm = request.value("algorithm", std::string("dijkstra"));
    const auto parsed = parse_algorithm(algorithm);
    if (!parsed)
    {
        throw InvalidRequest("unknown algorithm '" + algorithm + "', expected 'dijkstra' or 'astar'");
    }
    query.algorithm = *parsed;

    return to_json(routes_.query(query));
}

json GeoLinkService::check_network(const std::string &region_id) const
{
    return to_json(routes_.network_status(region_id));
}

json GeoLinkService::save_snapshot()
{
    if (config_.graph.snapshot_path.empty())
    {
        throw InvalidRequest("no graph.snapshot_path configured");
    }
    if (!store_.save_snapshot(config_.graph.snapshot_path))
    {
        throw GeoLinkError("unable to write snapshot to " + config_.graph.snapshot_path);
    }

    return {{"status", "success"},
            {"path", config_.graph.snapshot_path},
            {"nodes", store_.node_count()},
            {"edges", store_.edge_count()}};
}

json GeoLinkService::list_resolvers() const
{
    json resolvers = json::array();
    for (const auto &info : resolver_table())
    {
        json accepts = json::array();
        for (const InputKind kind : info.accepts)
        {
            accepts.push_back(input_label(kind));
        }
        resolvers.push_back({{"name", info.name}, {"description", info.description}, {"accepts", accepts}});
    }
    return {{"resolvers", resolvers}};
}

json GeoLinkService::health() const
{
    return {{"status", "ok"},
            {"nodes", store_.node_count()},
            {"edges", store_.edge_count()}};
}

void GeoLinkService::shutdown()
{
    std::cout << "Cancelling running batches" << std::endl;
    shutdown_.cancel();
}

int http_status(const std::exception &ex)
{
    if (dynamic_cast<const NodeNotFound *>(&ex))
    {
        return 404;
    }
    if (dynamic_cast<const InvalidRequest *>(&ex) || dynamic_cast<const UnlinkedEndpoint *>(&ex) ||
        dynamic_cast<const nlohmann::json::exception *>(&ex))
    {
        return 400;
    }
    if (dynamic_cast<const ProviderUnavailable *>(&ex))
    {
        return 503;
    }
    return 500;
}

} // namespace geolink
