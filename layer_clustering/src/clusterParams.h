#ifndef CLUSTER_PARAMS_H
#define CLUSTER_PARAMS_H

#include <limits>
#include "cluster/spatialIndex.h"

// Tuning for one multi-layer clustering run.
struct ClusterParams
{
    double selfRadius = 0.5;    // same-layer match distance
    double otherRadius = 0.5;   // cross-layer match distance
    IndexType indexType = IndexType::KD_TREE;
    int minClusterSize = 1;
    int maxClusterSize = std::numeric_limits<int>::max();

    // @throws ClusterConfigException
    void validate() const;
};

#endif // CLUSTER_PARAMS_H
