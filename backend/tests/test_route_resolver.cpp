#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "geolink/errors.hpp"
#include "geolink/graph_store.hpp"
#include "geolink/road_network.hpp"
#include "geolink/route_resolver.hpp"
#include "test_support.hpp"

using namespace geolink;
using namespace geolink::fixtures;

namespace
{

class RouteResolverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config = test_config();
        source.add(connector("A", 0.0, 0.0));
        source.add(connector("B", 0.0, 0.01));
        source.add(segment("s1", {"A", "B"}, 0.0, 0.0, 0.0, 0.01));

        source.add(connector("C", 0.5, 0.5));
        source.add(connector("D", 0.5, 0.51));
        source.add(segment("s2", {"C", "D"}, 0.5, 0.5, 0.5, 0.51));
    }

    void load(const std::vector<InputPoint> &points)
    {
        RoadNetworkBuilder builder(source, store, config);
        builder.load(points, 2.0, {});
    }

    EngineConfig config;
    StaticFeatureSource source;
    MemoryGraphStore store;
};

} // namespace

TEST_F(RouteResolverTest, RoutesBetweenLinkedPoints)
{
    load({location("P", 0.001, 0.0005, "north"), location("Q", -0.001, 0.0095, "south")});
    RouteResolver resolver(store);

    const auto endpoints = resolver.resolve_endpoints("P", "Q");
    EXPECT_EQ(endpoints.first, "A");
    EXPECT_EQ(endpoints.second, "B");

    const RouteResponse response = resolver.query({"P", "Q", PathAlgorithm::uniform_cost});
    ASSERT_TRUE(response.found);
    EXPECT_EQ(response.intersection_count, 2u);
    EXPECT_NEAR(response.distance_m, 1111.95, 0.5);
    ASSERT_EQ(response.route.size(), 2u);
    EXPECT_DOUBLE_EQ(response.route.back().lon, 0.01);
    EXPECT_EQ(response.message, "Route found with 2 intersections");

    const RouteResponse astar = resolver.query({"Q", "P", PathAlgorithm::heuristic});
    ASSERT_TRUE(astar.found);
    EXPECT_NEAR(astar.distance_m, response.distance_m, 1e-9);
}

TEST_F(RouteResolverTest, SharedEntryIntersectionGivesTrivialRoute)
{
    load({location("P", 0.001, 0.0005), location("P2", -0.001, 0.0)});
    RouteResolver resolver(store);

    const RouteResponse response = resolver.query({"P", "P2", PathAlgorithm::uniform_cost});
    ASSERT_TRUE(response.found);
    EXPECT_EQ(response.intersection_count, 1u);
    EXPECT_DOUBLE_EQ(response.distance_m, 0.0);
}

TEST_F(RouteResolverTest, DisconnectedNetworkReportsNoPath)
{
    load({location("P", 0.001, 0.0005), location("far", 0.5, 0.5095)});
    RouteResolver resolver(store);

    const RouteResponse response = resolver.query({"P", "far", PathAlgorithm::uniform_cost});
    EXPECT_FALSE(response.found);
    EXPECT_TRUE(response.route.empty());
    EXPECT_EQ(response.message, "No path found between the specified locations. The road network may be incomplete.");
}

TEST_F(RouteResolverTest, UnknownAndUnlinkedEndpoints)
{
    load({location("P", 0.001, 0.0005)});
    upsert_input(store, location("loose", 3.0, 3.0));
    RouteResolver resolver(store);

    EXPECT_THROW(resolver.resolve_endpoints("P", "ghost"), NodeNotFound);
    EXPECT_THROW(resolver.resolve_endpoints("loose", "P"), UnlinkedEndpoint);

    try
    {
        resolver.route("P", "loose", PathAlgorithm::uniform_cost);
        FAIL() << "expected UnlinkedEndpoint";
    }
    catch (const UnlinkedEndpoint &ex)
    {
        EXPECT_NE(std::string(ex.what()).find("load the road network"), std::string::npos);
    }
}

TEST_F(RouteResolverTest, NetworkStatusFiltersLinkedPointsByRegion)
{
    RouteResolver resolver(store);
    const NetworkStatus empty = resolver.network_status("");
    EXPECT_FALSE(empty.has_network);
    EXPECT_EQ(empty.intersection_count, 0u);

    load({location("P", 0.001, 0.0005, "north"), location("Q", -0.001, 0.0095, "south"), location("R", 0.5, 0.5, "north")});

    const NetworkStatus all = resolver.network_status("");
    EXPECT_TRUE(all.has_network);
    EXPECT_EQ(all.intersection_count, 4u);
    EXPECT_EQ(all.segment_count, 2u);
    EXPECT_EQ(all.linked_point_count, 3u);

    EXPECT_EQ(resolver.network_status("north").linked_point_count, 2u);
    EXPECT_EQ(resolver.network_status("south").linked_point_count, 1u);
    EXPECT_EQ(resolver.network_status("east").linked_point_count, 0u);
}
