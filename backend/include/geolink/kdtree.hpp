#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geolink/types.hpp"

namespace geolink
{

struct IndexedPoint
{
    std::string id;
    GeoPoint position;
};

// Nearest-neighbour lookup by planar distance in degrees.
class IntersectionIndex
{
public:
    explicit IntersectionIndex(std::vector<IndexedPoint> points);
    ~IntersectionIndex();

    IntersectionIndex(IntersectionIndex &&) noexcept;
    IntersectionIndex &operator=(IntersectionIndex &&) noexcept;

    bool empty() const { return root_ == nullptr; }
    std::size_t size() const { return size_; }

    // Ties resolve to the smaller id.
    std::optional<IndexedPoint> nearest(const GeoPoint &target) const;

private:
    struct Node;

    static std::unique_ptr<Node> build(std::vector<IndexedPoint> &points, size_t begin, size_t end, int depth);
    static void nearest_helper(const Node *node, const GeoPoint &target, const IndexedPoint *&best, double &best_dist);

    std::unique_ptr<Node> root_;
    std::size_t size_{0};
};

} // namespace geolink
