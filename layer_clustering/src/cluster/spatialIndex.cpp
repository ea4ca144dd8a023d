#include "spatialIndex.h"
#include "kdtree.h"
#include "pclKdTree.h"
#include "../clusterExceptions.h"

SpatialIndex::Ptr createSpatialIndex(IndexType type, const Layer& points)
{
    // KdTree and KdTreeFLANN both reject empty input, so an empty layer stays absent
    if (points.empty())
        return SpatialIndex::Ptr();

    switch (type)
    {
    case IndexType::PCL_KD_TREE:
        return SpatialIndex::Ptr(new PclKdTree(points));
    case IndexType::KD_TREE:
        return SpatialIndex::Ptr(new KdTree(points));
    }

    PCL_THROW_EXCEPTION(ClusterConfigException,
        "unknown index type " << static_cast<int>(type));
}

const char* indexTypeName(IndexType type)
{
    switch (type)
    {
    case IndexType::PCL_KD_TREE:
        return "pcl_kd_tree";
    case IndexType::KD_TREE:
        return "kd_tree";
    }
    return "unknown";
}
