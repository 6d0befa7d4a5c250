#include "geolink/feature_parser.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "geolink/errors.hpp"

namespace geolink
{
namespace
{

using json = nlohmann::json;

Coord parse_coord(const json &value)
{
    if (!value.is_array() || value.size() < 2 || !value[0].is_number() || !value[1].is_number())
    {
        throw GeometryParseError("coordinate must be [lon, lat]");
    }

    const double x = value[0].get<double>();
    const double y = value[1].get<double>();
    if (!std::isfinite(x) || !std::isfinite(y) || y < -90.0 || y > 90.0 || x < -180.0 || x > 180.0)
    {
        throw GeometryParseError("coordinate out of range");
    }
    return {x, y};
}

std::vector<Coord> parse_coord_list(const json &value, size_t min_points)
{
    if (!value.is_array() || value.size() < min_points)
    {
        throw GeometryParseError("expected at least " + std::to_string(min_points) + " coordinates");
    }

    std::vector<Coord> coords;
    coords.reserve(value.size());
    for (const auto &item : value)
    {
        coords.push_back(parse_coord(item));
    }
    return coords;
}

Polygon parse_polygon_rings(const json &value)
{
    if (!value.is_array() || value.empty())
    {
        throw GeometryParseError("polygon needs an outer ring");
    }

    Polygon polygon;
    for (const auto &ring : value)
    {
        polygon.rings.push_back(Ring{parse_coord_list(ring, 3)});
    }
    return polygon;
}

std::optional<std::string> optional_string(const json &props, const char *key)
{
    const auto it = props.find(key);
    if (it == props.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_string())
    {
        throw GeometryParseError(std::string("property '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<double> optional_number(const json &props, const char *key)
{
    const auto it = props.find(key);
    if (it == props.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_number())
    {
        throw GeometryParseError(std::string("property '") + key + "' must be a number");
    }
    return it->get<double>();
}

std::vector<std::string> string_list(const json &props, const char *key)
{
    std::vector<std::string> values;
    const auto it = props.find(key);
    if (it == props.end() || it->is_null())
    {
        return values;
    }
    if (!it->is_array())
    {
        throw GeometryParseError(std::string("property '") + key + "' must be an array");
    }
    for (const auto &item : *it)
    {
        if (!item.is_string())
        {
            throw GeometryParseError(std::string("property '") + key + "' must contain strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

const json &object_or_empty(const json &props, const char *key)
{
    static const json empty = json::object();
    const auto it = props.find(key);
    if (it == props.end() || it->is_null())
    {
        return empty;
    }
    if (!it->is_object())
    {
        throw GeometryParseError(std::string("property '") + key + "' must be an object");
    }
    return *it;
}

std::optional<std::string> common_name(const json &names)
{
    const auto it = names.find("common");
    if (it == names.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (it->is_string())
    {
        return it->get<std::string>();
    }
    if (it->is_array() && !it->empty() && it->front().is_object())
    {
        return optional_string(it->front(), "value");
    }
    if (it->is_object() && !it->empty() && it->begin()->is_string())
    {
        return it->begin()->get<std::string>();
    }
    throw GeometryParseError("names.common has an unsupported shape");
}

BuildingAttributes parse_building(const json &props)
{
    BuildingAttributes attributes;
    attributes.height = optional_number(props, "height");
    if (const auto floors = optional_number(props, "num_floors"))
    {
        if (!std::isfinite(*floors) || *floors < 0.0 || *floors > std::numeric_limits<int>::max())
        {
            throw GeometryParseError("num_floors out of range");
        }
        attributes.num_floors = static_cast<int>(*floors);
    }
    attributes.building_class = optional_string(props, "class");
    attributes.name = optional_string(object_or_empty(props, "names"), "primary");
    return attributes;
}

DivisionAttributes parse_division(const json &props)
{
    DivisionAttributes attributes;
    const auto subtype = optional_string(props, "subtype");
    if (!subtype || subtype->empty())
    {
        throw GeometryParseError("division is missing its subtype");
    }
    attributes.subtype = *subtype;

    const json &names = object_or_empty(props, "names");
    attributes.primary_name = optional_string(names, "primary");
    attributes.common_name = common_name(names);

    attributes.country_iso = optional_string(props, "country_iso");
    if (!attributes.country_iso)
    {
        attributes.country_iso = optional_string(props, "country");
    }
    return attributes;
}

AddressAttributes parse_address(const json &props)
{
    AddressAttributes attributes;
    attributes.number = optional_string(props, "number");
    attributes.street = optional_string(props, "street");
    attributes.postcode = optional_string(props, "postcode");
    return attributes;
}

RoadSegmentAttributes parse_segment(const json &props)
{
    RoadSegmentAttributes attributes;

    const auto it = props.find("connectors");
    if (it != props.end() && !it->is_null())
    {
        if (!it->is_array())
        {
            throw GeometryParseError("segment connectors must be an array");
        }
        for (const auto &connector : *it)
        {
            if (connector.is_string())
            {
                attributes.connector_ids.push_back(connector.get<std::string>());
            }
            else if (connector.is_object() && connector.contains("connector_id") && connector["connector_id"].is_string())
            {
                attributes.connector_ids.push_back(connector["connector_id"].get<std::string>());
            }
            else
            {
                throw GeometryParseError("segment connector reference is malformed");
            }
        }
    }

    if (const auto road_class = optional_string(props, "class"))
    {
        attributes.road_class = *road_class;
    }
    attributes.name = optional_string(object_or_empty(props, "names"), "primary");
    attributes.length_m = optional_number(props, "length_m");
    return attributes;
}

PlaceAttributes parse_place(const json &props)
{
    PlaceAttributes attributes;

    const json &names = object_or_empty(props, "names");
    auto name = optional_string(names, "primary");
    if (!name)
    {
        name = common_name(names);
    }
    if (!name || name->empty())
    {
        throw GeometryParseError("place has no primary name");
    }
    attributes.name = *name;

    if (const auto category = optional_string(object_or_empty(props, "categories"), "primary"))
    {
        attributes.category = *category;
    }

    attributes.confidence = optional_number(props, "confidence");
    if (attributes.confidence && (*attributes.confidence < 0.0 || *attributes.confidence > 1.0))
    {
        throw GeometryParseError("place confidence must be within [0, 1]");
    }

    const auto addresses = props.find("addresses");
    if (addresses != props.end() && addresses->is_array() && !addresses->empty() && addresses->front().is_object())
    {
        const json &first = addresses->front();
        std::string joined;
        for (const char *part : {"freeform", "locality", "region", "country"})
        {
            const auto value = optional_string(first, part);
            if (value && !value->empty())
            {
                if (!joined.empty())
                {
                    joined += ", ";
                }
                joined += *value;
            }
        }
        if (!joined.empty())
        {
            attributes.address = joined;
        }
    }

    attributes.brand = optional_string(object_or_empty(object_or_empty(props, "brand"), "names"), "primary");
    attributes.websites = string_list(props, "websites");
    attributes.phones = string_list(props, "phones");
    attributes.socials = string_list(props, "socials");

    const auto sources = props.find("sources");
    if (sources != props.end() && sources->is_array() && !sources->empty() && sources->front().is_object())
    {
        attributes.source = optional_string(sources->front(), "dataset");
    }
    return attributes;
}

void require_geometry(FeatureKind kind, const Geometry &geometry)
{
    const bool ok = [&]()
    {
        switch (kind)
        {
        case FeatureKind::road_segment:
            return geometry.type == GeometryType::line_string;
        case FeatureKind::road_connector:
            return geometry.type == GeometryType::point;
        case FeatureKind::building:
        case FeatureKind::division:
            return geometry.is_areal() || geometry.type == GeometryType::point;
        case FeatureKind::address:
        case FeatureKind::place:
            return geometry.type != GeometryType::empty;
        }
        return false;
    }();

    if (!ok)
    {
        throw GeometryParseError(to_string(kind) + " has an unexpected geometry type");
    }
}

} // namespace

Geometry parse_geometry(const json &geometry)
{
    if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string())
    {
        throw GeometryParseError("geometry has no type");
    }
    if (!geometry.contains("coordinates"))
    {
        throw GeometryParseError("geometry has no coordinates");
    }

    const std::string type = geometry["type"].get<std::string>();
    const json &coordinates = geometry["coordinates"];

    Geometry parsed;
    if (type == "Point")
    {
        parsed.type = GeometryType::point;
        parsed.coords.push_back(parse_coord(coordinates));
    }
    else if (type == "LineString")
    {
        parsed.type = GeometryType::line_string;
        parsed.coords = parse_coord_list(coordinates, 2);
    }
    else if (type == "Polygon")
    {
        parsed.type = GeometryType::polygon;
        parsed.polygons.push_back(parse_polygon_rings(coordinates));
    }
    else if (type == "MultiPolygon")
    {
        if (!coordinates.is_array() || coordinates.empty())
        {
            throw GeometryParseError("multipolygon has no members");
        }
        parsed.type = GeometryType::multi_polygon;
        for (const auto &member : coordinates)
        {
            parsed.polygons.push_back(parse_polygon_rings(member));
        }
    }
    else
    {
        throw GeometryParseError("unsupported geometry type '" + type + "'");
    }
    return parsed;
}

Feature parse_feature(FeatureKind kind, const json &feature)
{
    if (!feature.is_object())
    {
        throw GeometryParseError("feature must be an object");
    }

    const json &props = object_or_empty(feature, "properties");

    Feature parsed;
    parsed.kind = kind;

    const json *id = nullptr;
    if (feature.contains("id") && !feature["id"].is_null())
    {
        id = &feature["id"];
    }
    else if (props.contains("id") && !props["id"].is_null())
    {
        id = &props["id"];
    }
    if (!id || !id->is_string() || id->get<std::string>().empty())
    {
        throw GeometryParseError("feature has no string id");
    }
    parsed.id = id->get<std::string>();

    if (!feature.contains("geometry") || feature["geometry"].is_null())
    {
        throw GeometryParseError("feature '" + parsed.id + "' has no geometry");
    }
    parsed.geometry = parse_geometry(feature["geometry"]);
    require_geometry(kind, parsed.geometry);

    switch (kind)
    {
    case FeatureKind::building:
        parsed.attributes = parse_building(props);
        break;
    case FeatureKind::division:
        parsed.attributes = parse_division(props);
        break;
    case FeatureKind::address:
        parsed.attributes = parse_address(props);
        break;
    case FeatureKind::road_segment:
        parsed.attributes = parse_segment(props);
        break;
    case FeatureKind::road_connector:
        parsed.attributes = ConnectorAttributes{};
        break;
    case FeatureKind::place:
        parsed.attributes = parse_place(props);
        break;
    }
    return parsed;
}

std::vector<Feature> parse_feature_collection(FeatureKind kind, const json &collection, std::size_t limit, std::size_t *skipped)
{
    std::vector<Feature> features;
    size_t skipped_count = 0;

    if (!collection.is_object() || !collection.contains("features") || !collection["features"].is_array())
    {
        throw GeometryParseError("response is not a FeatureCollection");
    }

    for (const auto &item : collection["features"])
    {
        if (features.size() >= limit)
        {
            break;
        }

        try
        {
            features.push_back(parse_feature(kind, item));
        }
        catch (const GeometryParseError &ex)
        {
            skipped_count++;
            std::cerr << "Skipping malformed " << to_string(kind) << " feature: " << ex.what() << std::endl;
        }
    }

    if (skipped)
    {
        *skipped = skipped_count;
    }
    return features;
}

} // namespace geolink
