#include "multiLayerCluster.h"
#include "clusterExceptions.h"

#include <pcl/console/print.h>

MultiLayerCluster::MultiLayerCluster(const std::vector<Layer>& layers, IndexType indexType)
: layers_(layers, indexType), matched_(false)
{}

const AdjacencyList& MultiLayerCluster::clusterAllLayers(double selfRadius, double otherRadius)
{
    matches_ = buildProximityGraph(layers_, selfRadius, otherRadius);
    matched_ = true;
    return matches_;
}

ClusterMap MultiLayerCluster::compressMatch() const
{
    if (!matched_)
    {
        if (layers_.numPoints() == 0)
            return ClusterMap();

        PCL_ERROR("[MultiLayerCluster::compressMatch] called before clusterAllLayers\n");
        PCL_THROW_EXCEPTION(ClusterStateException,
            "compressMatch needs clusterAllLayers first, " << layers_.numPoints() << " points unmatched");
    }
    return compressMatches(matches_);
}

std::vector<std::vector<int>> MultiLayerCluster::extractClusters(int minSize, int maxSize) const
{
    return ::extractClusters(compressMatch(), minSize, maxSize);
}
