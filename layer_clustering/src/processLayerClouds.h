// PCL front end for multi-layer clustering

#ifndef PROCESS_LAYER_CLOUDS_H
#define PROCESS_LAYER_CLOUDS_H

#include <vector>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>
#include "clusterParams.h"
#include "multiLayerCluster.h"

template<typename PointT>
class ProcessLayerClouds {
public:

    typedef typename pcl::PointCloud<PointT>::Ptr CloudPtr;

    //constructor
    ProcessLayerClouds();
    //deconstructor
    ~ProcessLayerClouds();

    void numPoints(const std::vector<CloudPtr>& clouds);

    // one xyz layer per cloud, a null cloud gives an empty layer
    std::vector<Layer> CloudsToLayers(const std::vector<CloudPtr>& clouds);

    // one cloud per cluster whose size lies in [minClusterSize, maxClusterSize]
    std::vector<CloudPtr> Clustering(const std::vector<CloudPtr>& clouds, const ClusterParams& params);

};
#endif /* PROCESS_LAYER_CLOUDS_H */
