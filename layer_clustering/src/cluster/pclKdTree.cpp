#include "pclKdTree.h"
#include "../clusterExceptions.h"
#include <algorithm>

PclKdTree::PclKdTree(const Layer& points)
: points_(points), dim_(points.empty() ? 0 : static_cast<int>(points.front().size())),
  maxAbs_(0.0), cloud_(new pcl::PointCloud<pcl::PointXYZ>)
{
    if (dim_ > MAX_DIMENSION)
        PCL_THROW_EXCEPTION(ClusterConfigException,
            "pcl kd-tree holds at most " << MAX_DIMENSION << " dimensions, got " << dim_);

    cloud_->points.reserve(points_.size());
    for (const Point& p : points_)
    {
        cloud_->points.push_back(toPointXYZ(p));
        maxAbs_ = std::max(maxAbs_, p.lpNorm<Eigen::Infinity>());
    }
    cloud_->width = cloud_->points.size();
    cloud_->height = 1;
    cloud_->is_dense = true;

    tree_.setSortedResults(false);
    tree_.setInputCloud(cloud_);
}

std::vector<int> PclKdTree::radiusSearch(const Point& target, double radius) const
{
    // FLANN keeps dist < r^2 on float coordinates; search a padded radius that covers
    // float rounding, then apply the inclusive test on the double coordinates
    double pad = 1e-6 * (1.0 + radius + maxAbs_ + target.lpNorm<Eigen::Infinity>());
    pcl::Indices found;
    std::vector<float> sqrDistances;
    tree_.radiusSearch(toPointXYZ(target), radius + pad, found, sqrDistances);

    double radiusSq = radius * radius;
    std::vector<int> ids;
    ids.reserve(found.size());
    for (pcl::index_t id : found)
        if ((points_[id] - target).squaredNorm() <= radiusSq)
            ids.push_back(static_cast<int>(id));
    std::sort(ids.begin(), ids.end());
    return ids;
}

pcl::PointXYZ PclKdTree::toPointXYZ(const Point& p)
{
    float xyz[3] = {0.0f, 0.0f, 0.0f};
    for (int d = 0; d < p.size() && d < MAX_DIMENSION; d++)
        xyz[d] = static_cast<float>(p[d]);
    return pcl::PointXYZ(xyz[0], xyz[1], xyz[2]);
}
