#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "geolink/kdtree.hpp"

using namespace geolink;

TEST(IntersectionIndexTest, FindsNearestPoint)
{
    std::vector<IndexedPoint> points = {
        {"a", {0.0, 0.0}}, {"b", {0.0, 0.01}}, {"c", {0.01, 0.0}}, {"d", {-0.02, -0.02}}, {"e", {0.03, 0.03}}};
    IntersectionIndex index(std::move(points));
    EXPECT_EQ(index.size(), 5u);

    EXPECT_EQ(index.nearest({0.0009, 0.0004})->id, "a");
    EXPECT_EQ(index.nearest({-0.001, 0.0095})->id, "b");
    EXPECT_EQ(index.nearest({0.02, 0.025})->id, "e");
}

TEST(IntersectionIndexTest, TiesResolveToSmallerId)
{
    std::vector<IndexedPoint> points = {{"zeta", {0.0, 0.01}}, {"alpha", {0.0, -0.01}}, {"mid", {0.05, 0.0}}};
    IntersectionIndex index(std::move(points));
    EXPECT_EQ(index.nearest({0.0, 0.0})->id, "alpha");
}

TEST(IntersectionIndexTest, EmptyIndexReturnsNothing)
{
    IntersectionIndex index(std::vector<IndexedPoint>{});
    EXPECT_TRUE(index.empty());
    EXPECT_FALSE(index.nearest({0.0, 0.0}).has_value());
}
