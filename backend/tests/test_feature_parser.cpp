#include <gtest/gtest.h>

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "geolink/errors.hpp"
#include "geolink/feature_parser.hpp"

using namespace geolink;
using json = nlohmann::json;

namespace
{

json point_feature(const std::string &id, double lon, double lat, json properties = json::object())
{
    return {
        {"type", "Feature"},
        {"id", id},
        {"geometry", {{"type", "Point"}, {"coordinates", {lon, lat}}}},
        {"properties", properties},
    };
}

} // namespace

TEST(FeatureParserTest, ParsesBuildingPolygonAndAttributes)
{
    const json feature = {
        {"type", "Feature"},
        {"id", "bldg-1"},
        {"geometry", {{"type", "Polygon"}, {"coordinates", {{{0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 0}}}}}},
        {"properties", {{"height", 12.5}, {"num_floors", 4}, {"class", "office"}, {"names", {{"primary", "Tower"}}}}},
    };

    const Feature parsed = parse_feature(FeatureKind::building, feature);
    EXPECT_EQ(parsed.id, "bldg-1");
    EXPECT_EQ(parsed.geometry.type, GeometryType::polygon);

    const auto &attributes = std::get<BuildingAttributes>(parsed.attributes);
    EXPECT_DOUBLE_EQ(*attributes.height, 12.5);
    EXPECT_EQ(*attributes.num_floors, 4);
    EXPECT_EQ(*attributes.building_class, "office");
    EXPECT_EQ(*attributes.name, "Tower");
}

TEST(FeatureParserTest, RejectsUnrepresentableFloorCount)
{
    json feature = {
        {"type", "Feature"},
        {"id", "bldg-2"},
        {"geometry", {{"type", "Polygon"}, {"coordinates", {{{0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 0}}}}}},
        {"properties", {{"num_floors", 1e12}}},
    };
    EXPECT_THROW(parse_feature(FeatureKind::building, feature), GeometryParseError);

    feature["properties"]["num_floors"] = -2;
    EXPECT_THROW(parse_feature(FeatureKind::building, feature), GeometryParseError);

    feature["properties"]["num_floors"] = 3.0;
    EXPECT_EQ(*std::get<BuildingAttributes>(parse_feature(FeatureKind::building, feature).attributes).num_floors, 3);
}

TEST(FeatureParserTest, IdFallsBackToProperties)
{
    json feature = point_feature("", 1.0, 2.0, {{"id", "addr-7"}, {"number", "12"}, {"street", "High St"}});
    feature.erase("id");

    const Feature parsed = parse_feature(FeatureKind::address, feature);
    EXPECT_EQ(parsed.id, "addr-7");
    const auto &attributes = std::get<AddressAttributes>(parsed.attributes);
    EXPECT_EQ(*attributes.number, "12");
    EXPECT_EQ(*attributes.street, "High St");
    EXPECT_FALSE(attributes.postcode.has_value());
}

TEST(FeatureParserTest, DivisionRequiresSubtype)
{
    const json missing = point_feature("div-1", 0.0, 0.0, {{"names", {{"primary", "Somewhere"}}}});
    EXPECT_THROW(parse_feature(FeatureKind::division, missing), GeometryParseError);

    const json present = point_feature("div-2", 0.0, 0.0,
                                       {{"subtype", "locality"},
                                        {"names", {{"primary", "Springfield"}, {"common", {{"en", "Springfield"}}}}},
                                        {"country", "US"}});
    const Feature parsed = parse_feature(FeatureKind::division, present);
    const auto &attributes = std::get<DivisionAttributes>(parsed.attributes);
    EXPECT_EQ(attributes.subtype, "locality");
    EXPECT_EQ(*attributes.primary_name, "Springfield");
    EXPECT_EQ(*attributes.common_name, "Springfield");
    EXPECT_EQ(*attributes.country_iso, "US");
}

TEST(FeatureParserTest, SegmentAcceptsBothConnectorShapes)
{
    const json feature = {
        {"type", "Feature"},
        {"id", "seg-1"},
        {"geometry", {{"type", "LineString"}, {"coordinates", {{0, 0}, {0.01, 0}}}}},
        {"properties",
         {{"connectors", {"c1", {{"connector_id", "c2"}, {"at", 1.0}}}},
          {"class", "residential"},
          {"names", {{"primary", "Elm St"}}},
          {"length_m", 1112.0}}},
    };

    const Feature parsed = parse_feature(FeatureKind::road_segment, feature);
    const auto &attributes = std::get<RoadSegmentAttributes>(parsed.attributes);
    ASSERT_EQ(attributes.connector_ids.size(), 2u);
    EXPECT_EQ(attributes.connector_ids[0], "c1");
    EXPECT_EQ(attributes.connector_ids[1], "c2");
    EXPECT_EQ(attributes.road_class, "residential");
    EXPECT_EQ(*attributes.name, "Elm St");
    EXPECT_DOUBLE_EQ(*attributes.length_m, 1112.0);
}

TEST(FeatureParserTest, SegmentMustBeLineString)
{
    EXPECT_THROW(parse_feature(FeatureKind::road_segment, point_feature("seg-2", 0.0, 0.0)), GeometryParseError);
    EXPECT_NO_THROW(parse_feature(FeatureKind::road_connector, point_feature("con-1", 0.0, 0.0)));
}

TEST(FeatureParserTest, PlaceCollectsContactDetails)
{
    const json feature = point_feature(
        "place-1", 2.35, 48.85,
        {{"names", {{"primary", "Cafe Lumiere"}}},
         {"categories", {{"primary", "coffee_shop"}}},
         {"confidence", 0.92},
         {"addresses", {{{"freeform", "1 Rue de Rivoli"}, {"locality", "Paris"}, {"country", "FR"}}}},
         {"brand", {{"names", {{"primary", "Lumiere"}}}}},
         {"websites", {"https://lumiere.example"}},
         {"phones", {"+33 1 23 45 67 89"}},
         {"sources", {{{"dataset", "meta"}}}}});

    const Feature parsed = parse_feature(FeatureKind::place, feature);
    const auto &attributes = std::get<PlaceAttributes>(parsed.attributes);
    EXPECT_EQ(attributes.name, "Cafe Lumiere");
    EXPECT_EQ(attributes.category, "coffee_shop");
    EXPECT_DOUBLE_EQ(*attributes.confidence, 0.92);
    EXPECT_EQ(*attributes.address, "1 Rue de Rivoli, Paris, FR");
    EXPECT_EQ(*attributes.brand, "Lumiere");
    ASSERT_EQ(attributes.websites.size(), 1u);
    ASSERT_EQ(attributes.phones.size(), 1u);
    EXPECT_TRUE(attributes.socials.empty());
    EXPECT_EQ(*attributes.source, "meta");
}

TEST(FeatureParserTest, PlaceRejectsOutOfRangeConfidence)
{
    const json feature = point_feature("place-2", 0.0, 0.0, {{"names", {{"primary", "X"}}}, {"confidence", 1.5}});
    EXPECT_THROW(parse_feature(FeatureKind::place, feature), GeometryParseError);
}

TEST(FeatureParserTest, RejectsCoordinatesOutOfRange)
{
    EXPECT_THROW(parse_feature(FeatureKind::road_connector, point_feature("con-2", 0.0, 95.0)), GeometryParseError);
    EXPECT_THROW(parse_geometry({{"type", "Circle"}, {"coordinates", {0, 0}}}), GeometryParseError);
}

TEST(FeatureParserTest, CollectionSkipsMalformedFeatures)
{
    const json collection = {
        {"type", "FeatureCollection"},
        {"features",
         {point_feature("c1", 0.0, 0.0),
          {{"type", "Feature"}, {"id", "broken"}},
          point_feature("c2", 0.1, 0.0),
          point_feature("c3", 0.2, 0.0)}},
    };

    std::size_t skipped = 0;
    const auto all = parse_feature_collection(FeatureKind::road_connector, collection, 10, &skipped);
    EXPECT_EQ(all.size(), 3u);
    EXPECT_EQ(skipped, 1u);

    const auto limited = parse_feature_collection(FeatureKind::road_connector, collection, 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[1].id, "c2");
}

TEST(FeatureParserTest, CollectionMustBeFeatureCollection)
{
    EXPECT_THROW(parse_feature_collection(FeatureKind::place, json::array(), 10), GeometryParseError);
}
