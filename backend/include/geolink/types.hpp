#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "geolink/geometry.hpp"

namespace geolink
{

struct GeoPoint
{
    double lat{};
    double lon{};
};

struct BoundingBox
{
    double min_lon{};
    double min_lat{};
    double max_lon{};
    double max_lat{};

    bool intersects(const BoundingBox &other) const
    {
        return !(other.min_lon > max_lon || other.max_lon < min_lon ||
                 other.min_lat > max_lat || other.max_lat < min_lat);
    }
};

BoundingBox box_around(const GeoPoint &point, double buffer_deg);
BoundingBox box_around_km(const GeoPoint &point, double radius_km);
BoundingBox geometry_bounds(const Geometry &geometry);

enum class InputKind
{
    location,
    place,
    ip_address
};

struct InputPoint
{
    std::string id;
    InputKind kind{InputKind::location};
    std::optional<double> lat;
    std::optional<double> lon;
    std::string address;
    std::string city;
    std::string name;
    std::string category;
    std::string region_id;

    bool has_coordinates() const
    {
        return lat.has_value() && lon.has_value();
    }

    GeoPoint position() const;
};

std::string input_label(InputKind kind);
std::string describe(const InputPoint &point);

enum class FeatureKind
{
    place,
    building,
    address,
    division,
    road_segment,
    road_connector
};

std::string to_string(FeatureKind kind);

struct BuildingAttributes
{
    std::optional<double> height;
    std::optional<int> num_floors;
    std::optional<std::string> building_class;
    std::optional<std::string> name;
};

struct DivisionAttributes
{
    std::string subtype;
    std::optional<std::string> primary_name;
    std::optional<std::string> common_name;
    std::optional<std::string> country_iso;
};

struct AddressAttributes
{
    std::optional<std::string> number;
    std::optional<std::string> street;
    std::optional<std::string> postcode;
};

struct RoadSegmentAttributes
{
    std::vector<std::string> connector_ids;
    std::string road_class{"unknown"};
    std::optional<std::string> name;
    std::optional<double> length_m;
};

struct ConnectorAttributes
{
};

struct PlaceAttributes
{
    std::string name;
    std::string category{"unknown"};
    std::optional<double> confidence;
    std::optional<std::string> address;
    std::optional<std::string> brand;
    std::optional<std::string> source;
    std::vector<std::string> websites;
    std::vector<std::string> phones;
    std::vector<std::string> socials;
};

using FeatureAttributes = std::variant<
    BuildingAttributes,
    DivisionAttributes,
    AddressAttributes,
    RoadSegmentAttributes,
    ConnectorAttributes,
    PlaceAttributes>;

struct Feature
{
    std::string id;
    FeatureKind kind{FeatureKind::place};
    Geometry geometry;
    FeatureAttributes attributes;
};

struct GraphNode
{
    std::string label;
    std::string key_field;
    std::string key;
    nlohmann::json attributes = nlohmann::json::object();
};

struct GraphEdge
{
    std::string type;
    std::string from;
    std::string to;
    std::optional<std::string> key;
    nlohmann::json attributes = nlohmann::json::object();
};

enum class PathAlgorithm
{
    uniform_cost,
    heuristic
};

std::optional<PathAlgorithm> parse_algorithm(const std::string &name);
std::string to_string(PathAlgorithm algorithm);

struct RouteResult
{
    std::vector<GeoPoint> waypoints;
    std::vector<std::string> node_ids;
    double total_weight{0.0};
    std::size_t node_count{0};
    bool found{false};
};

struct RouteQuery
{
    std::string origin_id;
    std::string destination_id;
    PathAlgorithm algorithm{PathAlgorithm::uniform_cost};
};

struct RouteResponse
{
    std::vector<GeoPoint> route;
    double distance_m{0.0};
    std::size_t intersection_count{0};
    bool found{false};
    std::string message;
};

struct NetworkStatus
{
    std::size_t intersection_count{0};
    std::size_t segment_count{0};
    std::size_t linked_point_count{0};
    bool has_network{false};
};

namespace labels
{

inline constexpr const char *kBuilding = "Building";
inline constexpr const char *kDivision = "Division";
inline constexpr const char *kLocation = "Location";
inline constexpr const char *kPlace = "Place";
inline constexpr const char *kIpAddress = "IpAddress";
inline constexpr const char *kRoadSegment = "RoadSegment";
inline constexpr const char *kIntersection = "Intersection";

} // namespace labels

namespace relations
{

inline constexpr const char *kLocatedIn = "LOCATED_IN";
inline constexpr const char *kWithinDivision = "WITHIN_DIVISION";
inline constexpr const char *kNearestIntersection = "NEAREST_INTERSECTION";
inline constexpr const char *kRoadSegment = "ROAD_SEGMENT";
inline constexpr const char *kSameAs = "SAME_AS";
inline constexpr const char *kHasAddress = "HAS_ADDRESS";
inline constexpr const char *kLocatedOn = "LOCATED_ON";
inline constexpr const char *kHasNearbyPlace = "HAS_NEARBY_PLACE";
inline constexpr const char *kGeolocatesNear = "GEOLOCATES_NEAR";

} // namespace relations

} // namespace geolink
