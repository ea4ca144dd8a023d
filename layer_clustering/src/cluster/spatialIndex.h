#ifndef SPATIAL_INDEX_H
#define SPATIAL_INDEX_H

#include <cstddef>
#include <memory>
#include <vector>
#include <Eigen/Core>

typedef Eigen::VectorXd Point;
typedef std::vector<Point> Layer;

// one list of matched indices per query point
typedef std::vector<std::vector<int>> Neighbors;

enum class IndexType
{
    KD_TREE,      // balanced k-d tree, any dimensionality
    PCL_KD_TREE   // pcl::KdTreeFLANN, up to 3 dimensions
};

/**
 * Radius-search capability over one layer's points.
 * Indices returned by queries are local to the searched index.
 */
class SpatialIndex
{
public:
    typedef std::shared_ptr<SpatialIndex> Ptr;
    typedef std::shared_ptr<const SpatialIndex> ConstPtr;

    virtual ~SpatialIndex() {}

    virtual std::size_t size() const = 0;
    virtual int dimension() const = 0;
    virtual const Layer& points() const = 0;

    // ids of indexed points with distance(target, point) <= radius, ascending
    virtual std::vector<int> radiusSearch(const Point& target, double radius) const = 0;

    /**
     * For every point of this index, the local ids of points of this same
     * index within radius. Each point matches itself.
     */
    Neighbors queryWithin(double radius) const
    {
        return queryAgainst(*this, radius);
    }

    /**
     * For every point of this index, the local ids of points in other
     * within radius.
     */
    Neighbors queryAgainst(const SpatialIndex& other, double radius) const
    {
        Neighbors matches;
        matches.reserve(size());
        for (const Point& p : points())
            matches.push_back(other.radiusSearch(p, radius));
        return matches;
    }
};

/**
 * Builds the requested index over points. An empty layer has no index and
 * yields a null pointer.
 * @throws ClusterConfigException if the variant cannot hold the dimensionality.
 */
SpatialIndex::Ptr createSpatialIndex(IndexType type, const Layer& points);

const char* indexTypeName(IndexType type);

#endif  // SPATIAL_INDEX_H
