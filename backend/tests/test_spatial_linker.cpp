#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "geolink/errors.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/spatial_linker.hpp"
#include "test_support.hpp"

using namespace geolink;
using namespace geolink::fixtures;

namespace
{

class SpatialLinkerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config = test_config();
    }

    SpatialLinker make_linker(FeatureSource &from)
    {
        return SpatialLinker(from, store, config);
    }

    EngineConfig config;
    StaticFeatureSource source;
    MemoryGraphStore store;
};

InputPoint place_input(const std::string &id, double lat, double lon)
{
    InputPoint point = location(id, lat, lon);
    point.kind = InputKind::place;
    point.name = "Corner Bakery";
    return point;
}

InputPoint ip_input(const std::string &id, double lat, double lon)
{
    InputPoint point = location(id, lat, lon);
    point.kind = InputKind::ip_address;
    return point;
}

// Place catalog that is down east of lon 5.
class RegionalOutageSource : public StaticFeatureSource
{
public:
    std::vector<Feature> query(FeatureKind kind, const BoundingBox &bbox, std::size_t limit,
                               std::chrono::milliseconds timeout) override
    {
        if (kind == FeatureKind::place && bbox.min_lon > 5.0)
        {
            throw ProviderUnavailable("place catalog timed out");
        }
        return StaticFeatureSource::query(kind, bbox, limit, timeout);
    }
};

} // namespace

TEST_F(SpatialLinkerTest, BuildingContainingPointIsLinked)
{
    source.add(building("b-near", square(0.0002, -0.0001, 0.0003, 0.0001), std::string("Annex")));
    source.add(building("b-home", square(-0.0001, -0.0001, 0.0001, 0.0001), std::string("Town Hall")));
    SpatialLinker linker = make_linker(source);

    const auto match = linker.resolve_building(location("p1", 0.0, 0.0));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->gers_id, "b-home");
    EXPECT_TRUE(match->contained);
    EXPECT_EQ(match->name, "Town Hall");

    const auto targets = store.edge_targets("p1", relations::kLocatedIn);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets.front().key, "b-home");
    EXPECT_EQ(targets.front().label, labels::kBuilding);
    EXPECT_EQ(targets.front().attributes["geometry"].get<std::string>().rfind("POLYGON", 0), 0u);
}

TEST_F(SpatialLinkerTest, BuildingFallsBackToNearestWithinThreshold)
{
    Feature shed = building("b-shed", square(0.0004, -0.0001, 0.0008, 0.0001));
    std::get<BuildingAttributes>(shed.attributes).building_class = "shed";
    source.add(shed);
    SpatialLinker linker = make_linker(source);

    const auto match = linker.resolve_building(location("p1", 0.0, 0.0));
    ASSERT_TRUE(match.has_value());
    EXPECT_FALSE(match->contained);
    EXPECT_NEAR(match->distance_deg, 0.0004, 1e-12);
    EXPECT_EQ(match->name, "Building (shed)");

    const auto edges = store.edges_of_type(relations::kLocatedIn);
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_FALSE(edges.front().attributes["contained"].get<bool>());
    EXPECT_NEAR(edges.front().attributes["distance_m"].get<double>(), 44.4, 1e-6);
}

TEST_F(SpatialLinkerTest, BuildingBeyondThresholdIsNotLinked)
{
    config.matching.building_fallback_m = 20.0;
    source.add(building("b-far", square(0.0004, -0.0001, 0.0008, 0.0001)));
    SpatialLinker linker = make_linker(source);

    EXPECT_FALSE(linker.resolve_building(location("p1", 0.0, 0.0)).has_value());
    EXPECT_EQ(store.count_edges(relations::kLocatedIn), 0u);
}

TEST_F(SpatialLinkerTest, StreetLinksNearestSegment)
{
    Feature main_street = segment("s-main", {"c1", "c2"}, 0.0, -0.01, 0.0, 0.01, "residential");
    std::get<RoadSegmentAttributes>(main_street.attributes).name = "Main St";
    source.add(main_street);
    source.add(segment("s-side", {"c3", "c4"}, 0.002, -0.01, 0.002, 0.01, "service"));
    SpatialLinker linker = make_linker(source);

    const auto match = linker.resolve_street(location("p1", 0.0001, 0.0));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->gers_id, "s-main");
    EXPECT_EQ(match->name, "Main St");
    EXPECT_EQ(match->road_class, "residential");

    const auto node = store.find_node("s-main");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->label, labels::kRoadSegment);
    EXPECT_NEAR(node->attributes["latitude"].get<double>(), 0.0, 1e-12);
    EXPECT_EQ(store.count_edges(relations::kLocatedOn), 1u);
}

TEST_F(SpatialLinkerTest, UnnamedStreetGetsPlaceholderName)
{
    source.add(segment("s-1", {"c1", "c2"}, 0.0, -0.01, 0.0, 0.01));
    SpatialLinker linker = make_linker(source);

    const auto match = linker.resolve_street(location("p1", 0.0, 0.0));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->name, "Unnamed Road");
}

TEST_F(SpatialLinkerTest, AddressMatchBridgesToDivisions)
{
    source.add(address("a1", 0.0001, 0.0, "12", "Main St", "12345"));
    source.add(division("town", "locality", "Springfield", square(-1.0, -1.0, 1.0, 1.0)));
    SpatialLinker linker = make_linker(source);

    const auto match = linker.resolve_address(location("p1", 0.0, 0.0));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->gers_id, "a1");
    EXPECT_EQ(match->address, "12 Main St");
    EXPECT_EQ(match->zip, "12345");
    EXPECT_EQ(match->division_count, 1u);

    const auto same = store.edge_targets("p1", relations::kSameAs);
    ASSERT_EQ(same.size(), 1u);
    EXPECT_EQ(same.front().attributes["address"], "12 Main St");
    EXPECT_EQ(store.edge_targets("a1", relations::kWithinDivision).size(), 1u);
}

TEST_F(SpatialLinkerTest, StreetOnlyAddressKeepsInputText)
{
    source.add(address("a1", 0.0001, 0.0, "", "Main St"));
    SpatialLinker linker = make_linker(source);

    InputPoint point = location("p1", 0.0, 0.0);
    point.address = "12 Main Street, Springfield";
    const auto match = linker.resolve_address(point);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->address, "12 Main Street, Springfield");
    EXPECT_EQ(store.find_node("a1")->attributes["address"], "12 Main Street, Springfield");
}

TEST_F(SpatialLinkerTest, DivisionOutageKeepsAddressMatch)
{
    FlakyFeatureSource flaky({FeatureKind::division});
    flaky.add(address("a1", 0.0001, 0.0, "12", "Main St"));
    SpatialLinker linker(flaky, store, config);

    const LinkReport report = linker.link(location("p1", 0.0, 0.0), {Resolution::address});
    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.records.front().outcome, Outcome::linked);
    EXPECT_EQ(report.records.front().target_key, "a1");
    EXPECT_EQ(store.count_edges(relations::kSameAs), 1u);
    EXPECT_EQ(store.count_edges(relations::kWithinDivision), 0u);

    const auto match = linker.resolve_address(location("p2", 0.0, 0.0));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->division_count, 0u);
}

TEST_F(SpatialLinkerTest, AddressBeyondTwentyMetresIsIgnored)
{
    source.add(address("a1", 0.0003, 0.0, "12", "Main St"));
    SpatialLinker linker = make_linker(source);

    EXPECT_FALSE(linker.resolve_address(location("p1", 0.0, 0.0)).has_value());
    EXPECT_EQ(store.count_edges(relations::kSameAs), 0u);
}

TEST_F(SpatialLinkerTest, PlaceAddressUsesHasAddressWithoutDivisions)
{
    source.add(address("a1", 0.0, 0.0001, "", "Market Sq"));
    source.add(division("town", "locality", "Springfield", square(-1.0, -1.0, 1.0, 1.0)));
    SpatialLinker linker = make_linker(source);

    const auto match = linker.resolve_place_address(place_input("shop", 0.0, 0.0));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->address, "Corner Bakery");
    EXPECT_EQ(match->division_count, 0u);

    EXPECT_EQ(store.find_node("shop")->label, labels::kPlace);
    EXPECT_EQ(store.edge_targets("shop", relations::kHasAddress).size(), 1u);
    EXPECT_EQ(store.count_edges(relations::kWithinDivision), 0u);
}

TEST_F(SpatialLinkerTest, ProviderFailureDoesNotBlockOtherResolutions)
{
    FlakyFeatureSource flaky({FeatureKind::building});
    flaky.add(segment("s-1", {"c1", "c2"}, 0.0, -0.01, 0.0, 0.01));
    SpatialLinker linker(flaky, store, config);

    const LinkReport report = linker.link(location("p1", 0.0, 0.0), {Resolution::building, Resolution::street});
    ASSERT_EQ(report.records.size(), 2u);
    EXPECT_EQ(report.records[0].outcome, Outcome::failed);
    EXPECT_NE(report.records[0].detail.find("timed out"), std::string::npos);
    EXPECT_EQ(report.records[1].outcome, Outcome::linked);
    EXPECT_EQ(report.records[1].target_key, "s-1");
}

TEST_F(SpatialLinkerTest, MissingCoordinatesAreReportedPerResolution)
{
    SpatialLinker linker = make_linker(source);
    InputPoint point;
    point.id = "nowhere";
    point.address = "1 Unknown Rd";

    const LinkReport report = linker.link(point, {Resolution::building, Resolution::address});
    EXPECT_EQ(report.count(Outcome::missing_coordinates), 2u);
    EXPECT_TRUE(store.find_node("nowhere").has_value());
}

TEST_F(SpatialLinkerTest, NoCandidateIsNotAFailure)
{
    SpatialLinker linker = make_linker(source);
    const LinkReport report = linker.link(location("p1", 0.0, 0.0), {Resolution::street});
    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.records.front().outcome, Outcome::no_candidate);
    EXPECT_EQ(to_string(report.records.front().outcome), "no_candidate");
}

TEST_F(SpatialLinkerTest, NearbyPlacesSortedAndFilteredByCategory)
{
    source.add(place("cafe-2", 0.0, 0.003, "Second Cup", "coffee_shop"));
    source.add(place("diner", 0.0, 0.002, "Diner", "restaurant"));
    source.add(place("cafe-1", 0.0, 0.001, "First Cup", "Coffee_Shop"));
    SpatialLinker linker = make_linker(source);

    const auto all = linker.find_nearby_places({location("p1", 0.0, 0.0)}, PlaceSearch{});
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].gers_id, "cafe-1");
    EXPECT_EQ(all[1].gers_id, "diner");
    EXPECT_EQ(all[2].gers_id, "cafe-2");
    EXPECT_EQ(store.count_edges(relations::kHasNearbyPlace), 3u);

    PlaceSearch coffee;
    coffee.categories = {"coffee"};
    coffee.limit = 1;
    const auto filtered = linker.find_nearby_places({location("p2", 0.0, 0.0)}, coffee);
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered.front().gers_id, "cafe-1");
    EXPECT_EQ(filtered.front().linked_from, "p2");
}

TEST_F(SpatialLinkerTest, NearbyPlacesLinkFromClosestInputAndDeduplicate)
{
    source.add(place("west", 0.0, 0.0005, "West Deli", "deli"));
    source.add(place("east", 0.0, 0.0095, "East Deli", "deli"));
    SpatialLinker linker = make_linker(source);

    PlaceSearch wide;
    wide.radius_km = 2.0;
    const auto matches = linker.find_nearby_places({location("a", 0.0, 0.0), location("b", 0.0, 0.01)}, wide);
    ASSERT_EQ(matches.size(), 2u);

    for (const auto &match : matches)
    {
        EXPECT_EQ(match.linked_from, match.gers_id == "west" ? "a" : "b");
    }
    EXPECT_EQ(store.count_edges(relations::kHasNearbyPlace), 2u);
}

TEST_F(SpatialLinkerTest, NearbyPlaceOutageSkipsOnlyThatInput)
{
    RegionalOutageSource regional;
    regional.add(place("home-cafe", 0.0, 0.001, "Home Cafe", "cafe"));
    regional.add(place("far-cafe", 0.0, 10.001, "Far Cafe", "cafe"));
    SpatialLinker linker(regional, store, config);

    std::vector<PlaceMatch> matches;
    ASSERT_NO_THROW(matches = linker.find_nearby_places({location("west", 0.0, 0.0), location("east", 0.0, 10.0)},
                                                        PlaceSearch{}));
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches.front().gers_id, "home-cafe");
    EXPECT_EQ(matches.front().linked_from, "west");
    EXPECT_EQ(store.count_edges(relations::kHasNearbyPlace), 1u);
    EXPECT_FALSE(store.find_node("far-cafe").has_value());
}

TEST_F(SpatialLinkerTest, CancelledPlaceSearchLinksNothing)
{
    source.add(place("kiosk", 0.0, 0.001, "Kiosk", "retail"));
    SpatialLinker linker = make_linker(source);
    CancellationToken cancel;
    cancel.cancel();

    EXPECT_TRUE(linker.find_nearby_places({location("p1", 0.0, 0.0)}, PlaceSearch{}, &cancel).empty());
    EXPECT_EQ(store.count_edges(relations::kHasNearbyPlace), 0u);
}

TEST_F(SpatialLinkerTest, IpInputsGeolocateNear)
{
    source.add(place("kiosk", 0.0, 0.001, "Kiosk", "retail"));
    SpatialLinker linker = make_linker(source);

    InputPoint without_position;
    without_position.id = "ip-unknown";
    without_position.kind = InputKind::ip_address;

    const auto matches = linker.find_nearby_places({ip_input("ip-1", 0.0, 0.0), without_position}, PlaceSearch{});
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(store.count_edges(relations::kGeolocatesNear), 1u);
    EXPECT_EQ(store.find_node("ip-1")->label, labels::kIpAddress);
}

TEST_F(SpatialLinkerTest, LinkBatchCoversEveryPoint)
{
    source.add(segment("s-1", {"c1", "c2"}, 0.0, -0.01, 0.0, 0.01));
    SpatialLinker linker = make_linker(source);

    const std::vector<InputPoint> points = {location("p1", 0.0, 0.0), location("p2", 0.0001, 0.0), location("p3", -0.0001, 0.0)};
    const LinkReport report = linker.link_batch(points, {Resolution::street});
    EXPECT_EQ(report.records.size(), 3u);
    EXPECT_EQ(report.count(Outcome::linked), 3u);
    EXPECT_EQ(store.count_edges(relations::kLocatedOn), 3u);
}

TEST_F(SpatialLinkerTest, CancelledBatchSchedulesNothing)
{
    SpatialLinker linker = make_linker(source);
    CancellationToken cancel;
    cancel.cancel();

    const LinkReport report = linker.link_batch({location("p1", 0.0, 0.0)}, {Resolution::street}, &cancel);
    EXPECT_TRUE(report.records.empty());
    EXPECT_FALSE(store.find_node("p1").has_value());
}
