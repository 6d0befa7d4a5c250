#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "geolink/batch.hpp"
#include "geolink/config.hpp"
#include "geolink/divisions.hpp"
#include "geolink/feature_source.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/types.hpp"

namespace geolink
{

enum class Resolution
{
    building,
    street,
    address,
    place_address
};

std::string to_string(Resolution resolution);

enum class Outcome
{
    linked,
    no_candidate,
    missing_coordinates,
    failed
};

std::string to_string(Outcome outcome);

struct ResolutionRecord
{
    std::string point_id;
    std::string resolver;
    Outcome outcome{Outcome::no_candidate};
    std::string target_key;
    std::string detail;
};

struct LinkReport
{
    std::vector<ResolutionRecord> records;

    std::size_t count(Outcome outcome) const;
    void append(const LinkReport &other);
};

struct BuildingMatch
{
    std::string gers_id;
    std::string name;
    GeoPoint centroid;
    bool contained{false};
    double distance_deg{0.0};
};

struct StreetMatch
{
    std::string gers_id;
    std::string name;
    std::string road_class;
    double distance_deg{0.0};
};

struct AddressMatch
{
    std::string gers_id;
    std::string address;
    std::string zip;
    GeoPoint position;
    double distance_deg{0.0};
    std::size_t division_count{0};
};

struct PlaceSearch
{
    std::optional<double> radius_km;
    std::optional<std::size_t> limit;
    std::vector<std::string> categories;
};

struct PlaceMatch
{
    std::string gers_id;
    std::string name;
    std::string category;
    GeoPoint position;
    std::string linked_from;
};

class SpatialLinker
{
public:
    SpatialLinker(FeatureSource &source, GraphStore &store, const EngineConfig &config);

    std::optional<BuildingMatch> resolve_building(const InputPoint &point);
    std::optional<StreetMatch> resolve_street(const InputPoint &point);
    std::optional<AddressMatch> resolve_address(const InputPoint &point);
    std::optional<AddressMatch> resolve_place_address(const InputPoint &point);

    // A provider failure for one input skips only that input's places.
    std::vector<PlaceMatch> find_nearby_places(const std::vector<InputPoint> &points, const PlaceSearch &search,
                                               const CancellationToken *cancel = nullptr);

    // Each resolution runs independently; failures are recorded, not thrown.
    LinkReport link(const InputPoint &point, const std::vector<Resolution> &resolutions);
    LinkReport link_batch(const std::vector<InputPoint> &points, const std::vector<Resolution> &resolutions,
                          const CancellationToken *cancel = nullptr);

private:
    std::optional<AddressMatch> match_address(const InputPoint &point, double max_distance_m, const char *relationship,
                                              bool bridge_divisions);

    FeatureSource &source_;
    GraphStore &store_;
    MatchingSettings matching_;
    PlaceSettings places_;
    std::size_t max_parallel_;
    std::chrono::milliseconds timeout_;
    DivisionHierarchyResolver divisions_;
};

} // namespace geolink
