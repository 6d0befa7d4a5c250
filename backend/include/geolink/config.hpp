#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geolink
{

struct ServerSettings
{
    std::string host{"0.0.0.0"};
    int port{8080};
};

struct FeatureSourceSettings
{
    std::vector<std::string> endpoints;
    std::chrono::milliseconds timeout{30000};
    std::string user_agent{"geolink/1.0"};
    std::string static_directory;
};

struct GraphSettings
{
    std::string snapshot_path;
    std::chrono::milliseconds lock_timeout{5000};
};

struct MatchingSettings
{
    double building_buffer_deg{0.0005};
    std::size_t building_limit{50};
    double building_fallback_m{220.0};
    double address_buffer_deg{0.0005};
    std::size_t address_limit{20};
    double address_match_m{20.0};
    double place_address_m{20.0};
    double street_radius_km{1.0};
    std::size_t street_limit{500};
};

struct DivisionSettings
{
    std::vector<std::string> hierarchy{"locality", "county", "region", "country"};
    double search_buffer_deg{0.05};
    std::size_t limit{50};
};

struct RoadNetworkSettings
{
    double radius_km{2.0};
    std::vector<std::string> road_classes;
    std::size_t feature_limit{10000};
};

struct PlaceSettings
{
    double radius_km{1.0};
    double ip_radius_km{5.0};
    std::size_t limit{25};
    std::size_t ip_limit{20};
    std::size_t candidate_limit{1000};
    std::vector<std::string> categories;
};

struct BatchSettings
{
    std::size_t max_parallel{4};
};

struct EngineConfig
{
    ServerSettings server;
    FeatureSourceSettings feature_source;
    GraphSettings graph;
    MatchingSettings matching;
    DivisionSettings divisions;
    RoadNetworkSettings road_network;
    PlaceSettings places;
    BatchSettings batch;
};

// Missing keys keep their defaults; invalid values raise ConfigError.
EngineConfig parse_config(const nlohmann::json &document);
EngineConfig load_config(const std::string &path);
void validate(const EngineConfig &config);

std::vector<std::string> split_list(const std::string &value);

} // namespace geolink
