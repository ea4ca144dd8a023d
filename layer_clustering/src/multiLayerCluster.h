#ifndef MULTI_LAYER_CLUSTER_H
#define MULTI_LAYER_CLUSTER_H

#include <vector>
#include "layerSet.h"
#include "cluster/cluster_utils.h"

/**
 * Clusters points from several layers. Points closer than selfRadius inside
 * one layer, or closer than otherRadius across two layers, end up in the
 * same cluster, transitively.
 *
 *   MultiLayerCluster mlc(layers);
 *   mlc.clusterAllLayers(0.2, 0.2);
 *   ClusterMap clusters = mlc.compressMatch();
 */
class MultiLayerCluster
{
public:
    // @throws ClusterConfigException on inconsistent points
    explicit MultiLayerCluster(const std::vector<Layer>& layers, IndexType indexType = IndexType::KD_TREE);

    /**
     * Matches every point against its own layer and all later layers.
     * Replaces the matches of any previous call.
     * @return one neighbor list per global point.
     * @throws ClusterConfigException on a negative radius.
     */
    const AdjacencyList& clusterAllLayers(double selfRadius, double otherRadius);

    /**
     * Partition of all global ids from the last clusterAllLayers() call.
     * @throws ClusterStateException if points exist but were never matched.
     */
    ClusterMap compressMatch() const;

    // compressMatch() filtered to sizes in [minSize, maxSize]
    std::vector<std::vector<int>> extractClusters(int minSize, int maxSize) const;

    const LayerSet& layerSet() const { return layers_; }
    const AdjacencyList& matches() const { return matches_; }
    bool matched() const { return matched_; }

private:
    LayerSet layers_;
    AdjacencyList matches_;
    bool matched_;
};

#endif // MULTI_LAYER_CLUSTER_H
