#ifndef PCL_KDTREE_H
#define PCL_KDTREE_H

#include <vector>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>
#include <pcl/kdtree/kdtree_flann.h>
#include "spatialIndex.h"

/**
 * SpatialIndex backed by FLANN through PCL. Holds points of up to three
 * dimensions; missing coordinates are stored as zero. FLANN only narrows
 * the candidates, matches are decided on the double coordinates with
 * distance <= radius, same as KdTree.
 */
class PclKdTree : public SpatialIndex
{
public:
    static constexpr int MAX_DIMENSION = 3;

    // @throws ClusterConfigException if points have more than MAX_DIMENSION coordinates
    explicit PclKdTree(const Layer& points);

    std::size_t size() const override { return points_.size(); }
    int dimension() const override { return dim_; }
    const Layer& points() const override { return points_; }

    std::vector<int> radiusSearch(const Point& target, double radius) const override;

    static pcl::PointXYZ toPointXYZ(const Point& p);

private:
    Layer points_;
    int dim_;
    double maxAbs_;   // largest |coordinate|, scales the float search padding
    pcl::PointCloud<pcl::PointXYZ>::Ptr cloud_;
    pcl::KdTreeFLANN<pcl::PointXYZ> tree_;
};

#endif // PCL_KDTREE_H
