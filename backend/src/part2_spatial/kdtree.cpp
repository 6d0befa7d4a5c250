#include "geolink/kdtree.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace geolink
{

struct IntersectionIndex::Node
{
    IndexedPoint point;
    int axis{};
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
};

IntersectionIndex::IntersectionIndex(std::vector<IndexedPoint> points)
    : size_(points.size())
{
    root_ = build(points, 0, points.size(), 0);
}

IntersectionIndex::~IntersectionIndex() = default;
IntersectionIndex::IntersectionIndex(IntersectionIndex &&) noexcept = default;
IntersectionIndex &IntersectionIndex::operator=(IntersectionIndex &&) noexcept = default;

std::unique_ptr<IntersectionIndex::Node> IntersectionIndex::build(std::vector<IndexedPoint> &points, size_t begin, size_t end, int depth)
{
    if (begin >= end)
    {
        return nullptr;
    }

    const int axis = depth % 2;

    std::sort(points.begin() + begin, points.begin() + end,
              [axis](const IndexedPoint &a, const IndexedPoint &b)
              {
                  return (axis == 0) ? a.position.lat < b.position.lat : a.position.lon < b.position.lon;
              });

    const size_t median_idx = begin + (end - begin) / 2;

    auto node = std::make_unique<Node>();
    node->point = points[median_idx];
    node->axis = axis;
    node->left = build(points, begin, median_idx, depth + 1);
    node->right = build(points, median_idx + 1, end, depth + 1);
    return node;
}

void IntersectionIndex::nearest_helper(const Node *node, const GeoPoint &target, const IndexedPoint *&best, double &best_dist)
{
    if (!node)
    {
        return;
    }

    const double dist = std::hypot(target.lat - node->point.position.lat, target.lon - node->point.position.lon);

    if (dist < best_dist || (dist == best_dist && best && node->point.id < best->id))
    {
        best_dist = dist;
        best = &node->point;
    }

    const double diff = (node->axis == 0) ? (target.lat - node->point.position.lat) : (target.lon - node->point.position.lon);
    const Node *near_side = (diff < 0) ? node->left.get() : node->right.get();
    const Node *far_side = (diff < 0) ? node->right.get() : node->left.get();

    nearest_helper(near_side, target, best, best_dist);

    // <= so that equidistant points across the split still compete on id
    if (std::abs(diff) <= best_dist)
    {
        nearest_helper(far_side, target, best, best_dist);
    }
}

std::optional<IndexedPoint> IntersectionIndex::nearest(const GeoPoint &target) const
{
    if (!root_)
    {
        return std::nullopt;
    }

    const IndexedPoint *best = nullptr;
    double best_dist = std::numeric_limits<double>::max();
    nearest_helper(root_.get(), target, best, best_dist);

    if (!best)
    {
        return std::nullopt;
    }
    return *best;
}

} // namespace geolink
