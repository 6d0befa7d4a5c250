#pragma once

#include <string>
#include <vector>

namespace geolink
{

// Planar coordinate: x = longitude, y = latitude (degrees).
struct Coord
{
    double x{};
    double y{};
};

struct Ring
{
    std::vector<Coord> points;
};

struct Polygon
{
    // rings[0] = outer, rings[1..] = holes
    std::vector<Ring> rings;
};

enum class GeometryType
{
    empty,
    point,
    line_string,
    polygon,
    multi_polygon
};

struct Geometry
{
    GeometryType type{GeometryType::empty};
    // point: one coordinate; line_string: the vertices
    std::vector<Coord> coords;
    std::vector<Polygon> polygons;

    bool is_areal() const
    {
        return type == GeometryType::polygon || type == GeometryType::multi_polygon;
    }
};

constexpr double kMetresPerDegree = 111000.0;

double haversine(double lat1, double lon1, double lat2, double lon2);
double polyline_length_metres(const std::vector<Coord> &coords);
double metres_to_degrees(double metres);

double planar_distance(const Coord &a, const Coord &b);
double point_segment_distance(const Coord &p, const Coord &a, const Coord &b);

bool point_in_ring(const Ring &ring, const Coord &point);
bool point_in_polygon(const Polygon &polygon, const Coord &point);
bool contains(const Geometry &geometry, const Coord &point);
double distance(const Geometry &geometry, const Coord &point);
Coord centroid(const Geometry &geometry);
std::string to_wkt(const Geometry &geometry);

Geometry make_point(double lon, double lat);
Geometry make_line(const std::vector<Coord> &coords);
Geometry make_polygon(const std::vector<Coord> &outer);

} // namespace geolink
