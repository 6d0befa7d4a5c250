#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "geolink/config.hpp"
#include "geolink/errors.hpp"
#include "geolink/feature_source.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/service.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

void send_error(httplib::Response &res, const std::exception &ex)
{
    json error;
    error["status"] = "error";
    error["message"] = ex.what();
    res.status = http_status(ex);
    res.set_content(error.dump(), "application/json");
}

void handle(httplib::Response &res, const std::function<json()> &handler)
{
    try
    {
        const auto start = std::chrono::high_resolution_clock::now();
        json response = handler();
        const auto end = std::chrono::high_resolution_clock::now();

        if (response.is_object())
        {
            response["timing_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        }
        res.set_content(response.dump(), "application/json");
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Request failed: " << ex.what() << std::endl;
        send_error(res, ex);
    }
}

json parse_body(const httplib::Request &req)
{
    const json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
    {
        throw InvalidRequest("request body must be a JSON object");
    }
    return body;
}

std::unique_ptr<FeatureSource> make_feature_source(const EngineConfig &config, std::unique_ptr<HttpClient> &client)
{
    if (!config.feature_source.static_directory.empty())
    {
        auto source = std::make_unique<StaticFeatureSource>();
        const size_t loaded = source->load_directory(config.feature_source.static_directory);
        std::cout << "Static feature source ready with " << loaded << " features." << std::endl;
        return source;
    }

    client = std::make_unique<CurlHttpClient>(config.feature_source.user_agent);
    std::cout << "Using " << config.feature_source.endpoints.size() << " feature catalog endpoint(s)." << std::endl;
    return std::make_unique<HttpFeatureSource>(*client, config.feature_source.endpoints);
}

} // namespace
} // namespace geolink

int main(int argc, char **argv)
{
    using namespace geolink;

    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 2;
    }

    EngineConfig config;
    std::unique_ptr<HttpClient> client;
    std::unique_ptr<FeatureSource> source;
    std::unique_ptr<MemoryGraphStore> store;

    try
    {
        config = load_config(argv[1]);
        source = make_feature_source(config, client);

        store = std::make_unique<MemoryGraphStore>(config.graph.lock_timeout);
        if (!config.graph.snapshot_path.empty() && !store->load_snapshot(config.graph.snapshot_path))
        {
            std::cout << "No snapshot at " << config.graph.snapshot_path << ", starting with an empty graph." << std::endl;
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Startup failed: " << ex.what() << std::endl;
        return 1;
    }

    GeoLinkService service(*source, *store, config);
    httplib::Server server;

    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });

    server.Post("/enrich", [&service](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]()
                         { return service.enrich(parse_body(req)); }); });

    server.Get("/resolvers", [&service](const httplib::Request &, httplib::Response &res)
               { handle(res, [&]()
                        { return service.list_resolvers(); }); });

    server.Post("/road-network/load", [&service](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]()
                         { return service.load_road_network(parse_body(req)); }); });

    server.Post("/routing/shortest-path", [&service](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]()
                         { return service.shortest_path(parse_body(req)); }); });

    server.Get(R"(/routing/check-network/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res)
               { handle(res, [&]()
                        { return service.check_network(req.matches[1].str()); }); });

    server.Post("/graph/snapshot", [&service](const httplib::Request &, httplib::Response &res)
                { handle(res, [&]()
                         { return service.save_snapshot(); }); });

    server.Get("/health", [&service](const httplib::Request &, httplib::Response &res)
               { handle(res, [&]()
                        { return service.health(); }); });

    std::cout << "Server starting on http://" << config.server.host << ":" << config.server.port << std::endl;
    if (!server.listen(config.server.host, config.server.port))
    {
        std::cerr << "Unable to listen on " << config.server.host << ":" << config.server.port << std::endl;
        service.shutdown();
        return 1;
    }

    service.shutdown();
    if (!config.graph.snapshot_path.empty() && !store->save_snapshot(config.graph.snapshot_path))
    {
        std::cerr << "Graph snapshot was not saved on shutdown." << std::endl;
        return 1;
    }
    return 0;
}
