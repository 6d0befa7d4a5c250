#include "geolink/config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "geolink/errors.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

const json &section(const json &document, const char *name)
{
    static const json empty = json::object();
    if (!document.contains(name))
    {
        return empty;
    }
    const json &value = document[name];
    if (!value.is_object())
    {
        throw ConfigError(std::string("config section '") + name + "' must be an object");
    }
    return value;
}

std::vector<std::string> string_array(const json &object, const char *key, const std::vector<std::string> &fallback)
{
    if (!object.contains(key))
    {
        return fallback;
    }

    const json &value = object[key];
    if (value.is_string())
    {
        return split_list(value.get<std::string>());
    }
    if (!value.is_array())
    {
        throw ConfigError(std::string("'") + key + "' must be a list of strings");
    }

    std::vector<std::string> result;
    for (const auto &item : value)
    {
        if (!item.is_string())
        {
            throw ConfigError(std::string("'") + key + "' must be a list of strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

} // namespace

std::vector<std::string> split_list(const std::string &value)
{
    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ','))
    {
        const auto first = part.find_first_not_of(" \t");
        const auto last = part.find_last_not_of(" \t");
        if (first == std::string::npos)
        {
            continue;
        }
        parts.push_back(part.substr(first, last - first + 1));
    }
    return parts;
}

EngineConfig parse_config(const json &document)
{
    if (!document.is_object())
    {
        throw ConfigError("config root must be an object");
    }

    EngineConfig config;

    try
    {
        const json &server = section(document, "server");
        config.server.host = server.value("host", config.server.host);
        config.server.port = server.value("port", config.server.port);

        const json &source = section(document, "feature_source");
        config.feature_source.endpoints = string_array(source, "endpoints", config.feature_source.endpoints);
        config.feature_source.timeout = std::chrono::milliseconds(source.value("timeout_ms", static_cast<long>(config.feature_source.timeout.count())));
        config.feature_source.user_agent = source.value("user_agent", config.feature_source.user_agent);
        config.feature_source.static_directory = source.value("static_directory", config.feature_source.static_directory);

        const json &graph = section(document, "graph");
        config.graph.snapshot_path = graph.value("snapshot_path", config.graph.snapshot_path);
        config.graph.lock_timeout = std::chrono::milliseconds(graph.value("lock_timeout_ms", static_cast<long>(config.graph.lock_timeout.count())));

        const json &matching = section(document, "matching");
        config.matching.building_fallback_m = matching.value("building_fallback_m", config.matching.building_fallback_m);
        config.matching.address_match_m = matching.value("address_match_m", config.matching.address_match_m);
        config.matching.place_address_m = matching.value("place_address_m", config.matching.place_address_m);
        config.matching.street_radius_km = matching.value("street_radius_km", config.matching.street_radius_km);

        const json &divisions = section(document, "divisions");
        config.divisions.hierarchy = string_array(divisions, "hierarchy", config.divisions.hierarchy);
        config.divisions.search_buffer_deg = divisions.value("search_buffer_deg", config.divisions.search_buffer_deg);

        const json &network = section(document, "road_network");
        config.road_network.radius_km = network.value("radius_km", config.road_network.radius_km);
        config.road_network.road_classes = string_array(network, "road_classes", config.road_network.road_classes);

        const json &places = section(document, "places");
        config.places.radius_km = places.value("radius_km", config.places.radius_km);
        config.places.ip_radius_km = places.value("ip_radius_km", config.places.ip_radius_km);
        config.places.limit = places.value("limit", config.places.limit);
        config.places.ip_limit = places.value("ip_limit", config.places.ip_limit);
        config.places.candidate_limit = places.value("candidate_limit", config.places.candidate_limit);
        config.places.categories = string_array(places, "categories", config.places.categories);

        const json &batch = section(document, "batch");
        config.batch.max_parallel = batch.value("max_parallel", config.batch.max_parallel);
    }
    catch (const json::type_error &ex)
    {
        throw ConfigError(std::string("config value has the wrong type: ") + ex.what());
    }

    validate(config);
    return config;
}

EngineConfig load_config(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigError("Unable to open config file " + path);
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded())
    {
        throw ConfigError("Config file " + path + " is not valid JSON");
    }

    std::cout << "Loaded configuration from " << path << std::endl;
    return parse_config(document);
}

void validate(const EngineConfig &config)
{
    if (config.server.port <= 0 || config.server.port > 65535)
    {
        throw ConfigError("server.port must be within 1-65535");
    }
    if (config.feature_source.endpoints.empty() && config.feature_source.static_directory.empty())
    {
        throw ConfigError("feature_source needs endpoints or a static_directory");
    }
    if (config.feature_source.timeout.count() <= 0 || config.graph.lock_timeout.count() <= 0)
    {
        throw ConfigError("timeouts must be positive");
    }
    if (config.matching.building_fallback_m <= 0.0 || config.matching.address_match_m <= 0.0 ||
        config.matching.place_address_m <= 0.0 || config.matching.street_radius_km <= 0.0)
    {
        throw ConfigError("matching thresholds must be positive");
    }
    if (config.divisions.hierarchy.empty())
    {
        throw ConfigError("divisions.hierarchy must list at least one kind");
    }
    if (config.divisions.search_buffer_deg <= 0.0)
    {
        throw ConfigError("divisions.search_buffer_deg must be positive");
    }
    if (config.road_network.radius_km < 0.5 || config.road_network.radius_km > 10.0)
    {
        throw ConfigError("road_network.radius_km must be within 0.5-10");
    }
    if (config.places.radius_km <= 0.0 || config.places.ip_radius_km <= 0.0 ||
        config.places.limit == 0 || config.places.ip_limit == 0)
    {
        throw ConfigError("places radius and limit must be positive");
    }
    if (config.batch.max_parallel == 0)
    {
        throw ConfigError("batch.max_parallel must be at least 1");
    }
}

} // namespace geolink
