#include "geolink/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

//for building with x64 mingw
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geolink
{
namespace
{

struct RingBounds
{
    double min_x{std::numeric_limits<double>::max()};
    double min_y{std::numeric_limits<double>::max()};
    double max_x{std::numeric_limits<double>::lowest()};
    double max_y{std::numeric_limits<double>::lowest()};
};

RingBounds ring_bounds(const Ring &ring)
{
    RingBounds bounds;
    for (const auto &point : ring.points)
    {
        bounds.min_x = std::min(bounds.min_x, point.x);
        bounds.min_y = std::min(bounds.min_y, point.y);
        bounds.max_x = std::max(bounds.max_x, point.x);
        bounds.max_y = std::max(bounds.max_y, point.y);
    }
    return bounds;
}

double signed_ring_area(const Ring &ring, double &cx, double &cy)
{
    double area = 0.0;
    cx = 0.0;
    cy = 0.0;

    const auto &points = ring.points;
    const size_t n = points.size();
    if (n < 3)
    {
        return 0.0;
    }

    for (size_t i = 0, j = n - 1; i < n; j = i++)
    {
        const double cross = points[j].x * points[i].y - points[i].x * points[j].y;
        area += cross;
        cx += (points[j].x + points[i].x) * cross;
        cy += (points[j].y + points[i].y) * cross;
    }

    area *= 0.5;
    return area;
}

double ring_distance(const Ring &ring, const Coord &point)
{
    double best = std::numeric_limits<double>::infinity();
    const auto &points = ring.points;
    const size_t n = points.size();
    if (n == 1)
    {
        return planar_distance(points[0], point);
    }

    for (size_t i = 0, j = n - 1; i < n; j = i++)
    {
        best = std::min(best, point_segment_distance(point, points[j], points[i]));
    }
    return best;
}

void write_coords(std::ostringstream &out, const std::vector<Coord> &coords)
{
    out << "(";
    for (size_t i = 0; i < coords.size(); i++)
    {
        if (i > 0)
        {
            out << ", ";
        }
        out << coords[i].x << " " << coords[i].y;
    }
    out << ")";
}

void write_polygon(std::ostringstream &out, const Polygon &polygon)
{
    out << "(";
    for (size_t i = 0; i < polygon.rings.size(); i++)
    {
        if (i > 0)
        {
            out << ", ";
        }
        std::vector<Coord> closed = polygon.rings[i].points;
        if (!closed.empty() &&
            (closed.front().x != closed.back().x || closed.front().y != closed.back().y))
        {
            closed.push_back(closed.front());
        }
        write_coords(out, closed);
    }
    out << ")";
}

} // namespace

double haversine(double lat1, double lon1, double lat2, double lon2)
{
    const double R = 6371000.0;
    double phi1 = lat1 * M_PI / 180.0;
    double phi2 = lat2 * M_PI / 180.0;
    double delta_phi = (lat2 - lat1) * M_PI / 180.0;
    double delta_lambda = (lon2 - lon1) * M_PI / 180.0;

    double a = std::sin(delta_phi / 2.0) * std::sin(delta_phi / 2.0) +
               std::cos(phi1) * std::cos(phi2) * std::sin(delta_lambda / 2.0) * std::sin(delta_lambda / 2.0);
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return R * c;
}

double polyline_length_metres(const std::vector<Coord> &coords)
{
    double total = 0.0;
    for (size_t i = 0; i + 1 < coords.size(); i++)
    {
        total += haversine(coords[i].y, coords[i].x, coords[i + 1].y, coords[i + 1].x);
    }
    return total;
}

double metres_to_degrees(double metres)
{
    return metres / kMetresPerDegree;
}

double planar_distance(const Coord &a, const Coord &b)
{
    return std::hypot(a.x - b.x, a.y - b.y);
}

double point_segment_distance(const Coord &p, const Coord &a, const Coord &b)
{
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double length_sq = dx * dx + dy * dy;
    if (length_sq == 0.0)
    {
        return planar_distance(p, a);
    }

    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / length_sq;
    t = std::max(0.0, std::min(1.0, t));
    return planar_distance(p, {a.x + t * dx, a.y + t * dy});
}

// Ray casting; points exactly on an edge are not reliably classified.
bool point_in_ring(const Ring &ring, const Coord &point)
{
    bool inside = false;
    const auto &points = ring.points;
    const size_t n = points.size();
    if (n < 3)
    {
        return false;
    }

    for (size_t i = 0, j = n - 1; i < n; j = i++)
    {
        const Coord &a = points[j];
        const Coord &b = points[i];
        const bool crosses = (a.y > point.y) != (b.y > point.y);
        if (crosses && point.x < (b.x - a.x) * (point.y - a.y) / (b.y - a.y) + a.x)
        {
            inside = !inside;
        }
    }
    return inside;
}

bool point_in_polygon(const Polygon &polygon, const Coord &point)
{
    if (polygon.rings.empty())
    {
        return false;
    }

    const RingBounds bounds = ring_bounds(polygon.rings.front());
    if (point.x < bounds.min_x || point.x > bounds.max_x ||
        point.y < bounds.min_y || point.y > bounds.max_y)
    {
        return false;
    }

    if (!point_in_ring(polygon.rings.front(), point))
    {
        return false;
    }

    for (size_t i = 1; i < polygon.rings.size(); i++)
    {
        if (point_in_ring(polygon.rings[i], point))
        {
            return false;
        }
    }
    return true;
}

bool contains(const Geometry &geometry, const Coord &point)
{
    if (!geometry.is_areal())
    {
        return false;
    }

    return std::any_of(geometry.polygons.begin(), geometry.polygons.end(),
                       [&point](const Polygon &polygon)
                       { return point_in_polygon(polygon, point); });
}

double distance(const Geometry &geometry, const Coord &point)
{
    switch (geometry.type)
    {
    case GeometryType::point:
        return planar_distance(geometry.coords.front(), point);
    case GeometryType::line_string:
    {
        if (geometry.coords.size() == 1)
        {
            return planar_distance(geometry.coords.front(), point);
        }
        double best = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i + 1 < geometry.coords.size(); i++)
        {
            best = std::min(best, point_segment_distance(point, geometry.coords[i], geometry.coords[i + 1]));
        }
        return best;
    }
    case GeometryType::polygon:
    case GeometryType::multi_polygon:
    {
        if (contains(geometry, point))
        {
            return 0.0;
        }
        double best = std::numeric_limits<double>::infinity();
        for (const auto &polygon : geometry.polygons)
        {
            for (const auto &ring : polygon.rings)
            {
                best = std::min(best, ring_distance(ring, point));
            }
        }
        return best;
    }
    case GeometryType::empty:
        break;
    }
    return std::numeric_limits<double>::infinity();
}

Coord centroid(const Geometry &geometry)
{
    switch (geometry.type)
    {
    case GeometryType::point:
        return geometry.coords.front();
    case GeometryType::line_string:
    {
        double total = 0.0;
        double cx = 0.0;
        double cy = 0.0;
        for (size_t i = 0; i + 1 < geometry.coords.size(); i++)
        {
            const Coord &a = geometry.coords[i];
            const Coord &b = geometry.coords[i + 1];
            const double length = planar_distance(a, b);
            total += length;
            cx += (a.x + b.x) * 0.5 * length;
            cy += (a.y + b.y) * 0.5 * length;
        }
        if (total == 0.0)
        {
            return geometry.coords.front();
        }
        return {cx / total, cy / total};
    }
    case GeometryType::polygon:
    case GeometryType::multi_polygon:
    {
        double total_area = 0.0;
        double cx = 0.0;
        double cy = 0.0;
        for (const auto &polygon : geometry.polygons)
        {
            for (size_t i = 0; i < polygon.rings.size(); i++)
            {
                double ring_cx = 0.0;
                double ring_cy = 0.0;
                const double signed_area = signed_ring_area(polygon.rings[i], ring_cx, ring_cy);
                // holes subtract regardless of winding
                const double weight = (i == 0) ? std::abs(signed_area) : -std::abs(signed_area);
                if (signed_area == 0.0)
                {
                    continue;
                }
                const double scale = weight / (6.0 * signed_area);
                cx += ring_cx * scale;
                cy += ring_cy * scale;
                total_area += weight;
            }
        }

        if (total_area == 0.0)
        {
            double sx = 0.0;
            double sy = 0.0;
            size_t count = 0;
            for (const auto &polygon : geometry.polygons)
            {
                if (polygon.rings.empty())
                {
                    continue;
                }
                for (const auto &point : polygon.rings.front().points)
                {
                    sx += point.x;
                    sy += point.y;
                    count++;
                }
            }
            return count > 0 ? Coord{sx / count, sy / count} : Coord{};
        }
        return {cx / total_area, cy / total_area};
    }
    case GeometryType::empty:
        break;
    }
    return {};
}

std::string to_wkt(const Geometry &geometry)
{
    std::ostringstream out;
    out << std::setprecision(12);

    switch (geometry.type)
    {
    case GeometryType::point:
        out << "POINT (" << geometry.coords.front().x << " " << geometry.coords.front().y << ")";
        break;
    case GeometryType::line_string:
        out << "LINESTRING ";
        write_coords(out, geometry.coords);
        break;
    case GeometryType::polygon:
        out << "POLYGON ";
        write_polygon(out, geometry.polygons.front());
        break;
    case GeometryType::multi_polygon:
        out << "MULTIPOLYGON (";
        for (size_t i = 0; i < geometry.polygons.size(); i++)
        {
            if (i > 0)
            {
                out << ", ";
            }
            write_polygon(out, geometry.polygons[i]);
        }
        out << ")";
        break;
    case GeometryType::empty:
        out << "GEOMETRYCOLLECTION EMPTY";
        break;
    }
    return out.str();
}

Geometry make_point(double lon, double lat)
{
    Geometry geometry;
    geometry.type = GeometryType::point;
    geometry.coords.push_back({lon, lat});
    return geometry;
}

Geometry make_line(const std::vector<Coord> &coords)
{
    Geometry geometry;
    geometry.type = GeometryType::line_string;
    geometry.coords = coords;
    return geometry;
}

Geometry make_polygon(const std::vector<Coord> &outer)
{
    Geometry geometry;
    geometry.type = GeometryType::polygon;
    geometry.polygons.push_back(Polygon{{Ring{outer}}});
    return geometry;
}

} // namespace geolink
