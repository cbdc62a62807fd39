#pragma once

#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace visits::domain {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

/**
 * @brief Read-only 2-D point index for rectangular range queries
 *
 * Wraps a Boost.Geometry R*-tree bulk-loaded once from a point sequence.
 * PointT must provide `coordinates()` returning a pair convertible to
 * (double x, double y). Returned values are indices into the sequence passed
 * to the constructor.
 */
template <typename PointT>
class SpatialIndex {
public:
    using Point = bg::model::point<double, 2, bg::cs::cartesian>;
    using Box = bg::model::box<Point>;
    using Value = std::pair<Point, std::size_t>;

    static constexpr std::size_t DEFAULT_NODE_SIZE = 64;
    static constexpr std::size_t MIN_NODE_SIZE = 4;

    /**
     * @param points Sequence to index; only its coordinates are copied
     * @param nodeSize Maximum entries per tree node, raised to MIN_NODE_SIZE if smaller
     */
    explicit SpatialIndex(const std::vector<PointT>& points, std::size_t nodeSize = DEFAULT_NODE_SIZE)
        : tree_(toValues(points), bgi::dynamic_rstar(std::max(nodeSize, MIN_NODE_SIZE))) {
    }

    std::size_t size() const { return tree_.size(); }

    // All indices with minX <= x <= maxX and minY <= y <= maxY, in no particular order.
    std::vector<std::size_t> range(double minX, double minY, double maxX, double maxY) const {
        std::vector<Value> hits;
        tree_.query(bgi::covered_by(Box(Point(minX, minY), Point(maxX, maxY))), std::back_inserter(hits));

        std::vector<std::size_t> result;
        result.reserve(hits.size());
        for (const auto& hit : hits) {
            result.push_back(hit.second);
        }
        return result;
    }

private:
    static std::vector<Value> toValues(const std::vector<PointT>& points) {
        std::vector<Value> values;
        values.reserve(points.size());
        for (std::size_t i = 0; i < points.size(); ++i) {
            const auto xy = points[i].coordinates();
            values.emplace_back(Point(xy.first, xy.second), i);
        }
        return values;
    }

    bgi::rtree<Value, bgi::dynamic_rstar> tree_;
};

} // namespace visits::domain
