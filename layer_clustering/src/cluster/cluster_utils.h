#ifndef CLUSTER_UTILS_H
#define CLUSTER_UTILS_H

#include <vector>
#include "union_find.h"

// Forward declaration so we don't pull index internals here.
class LayerSet;

// matched global ids per global point, each list ascending
typedef std::vector<std::vector<int>> AdjacencyList;

/**
 * Multi-layer proximity matching.
 * Layer i is matched against itself with selfRadius and against every
 * later layer j > i with otherRadius. A cross-layer match is recorded only
 * under the point of the earlier layer.
 * @param layers       indexed layers.
 * @param selfRadius   distance threshold inside one layer, >= 0.
 * @param otherRadius  distance threshold between two layers, >= 0.
 * @return one neighbor list per global point.
 * @throws ClusterConfigException on a negative or NaN radius.
 */
AdjacencyList buildProximityGraph(
        const LayerSet& layers,
        double selfRadius,
        double otherRadius);

// Union of every (i, j) edge; returns root -> members.
ClusterMap compressMatches(const AdjacencyList& matches);

/**
 * Clusters whose size lies in [minSize, maxSize], ordered by their
 * smallest member.
 */
std::vector<std::vector<int>> extractClusters(
        const ClusterMap& clusters,
        int minSize,
        int maxSize);

// @throws ClusterConfigException unless radius >= 0
void checkRadius(double radius, const char* name);

#endif  // CLUSTER_UTILS_H
