#include "clusterParams.h"
#include "clusterExceptions.h"
#include "cluster/cluster_utils.h"

void ClusterParams::validate() const
{
    checkRadius(selfRadius, "self radius");
    checkRadius(otherRadius, "other radius");

    if (minClusterSize < 1)
        PCL_THROW_EXCEPTION(ClusterConfigException,
            "minimum cluster size must be at least 1, got " << minClusterSize);

    if (maxClusterSize < minClusterSize)
        PCL_THROW_EXCEPTION(ClusterConfigException,
            "maximum cluster size " << maxClusterSize << " is below minimum " << minClusterSize);
}
