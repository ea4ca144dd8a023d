// PCL lib Functions for clustering layered point clouds
#include <chrono>
#include <iostream>
#include <pcl/console/print.h>
#include "processLayerClouds.h"


//constructor:
template<typename PointT>
ProcessLayerClouds<PointT>::ProcessLayerClouds() {}


//de-constructor:
template<typename PointT>
ProcessLayerClouds<PointT>::~ProcessLayerClouds() {}


template<typename PointT>
void ProcessLayerClouds<PointT>::numPoints(const std::vector<CloudPtr>& clouds)
{
    std::size_t total = 0;
    for (const CloudPtr& cloud : clouds)
        if (cloud)
            total += cloud->points.size();
    std::cout << total << " points in " << clouds.size() << " layers" << std::endl;
}


template<typename PointT>
std::vector<Layer> ProcessLayerClouds<PointT>::CloudsToLayers(const std::vector<CloudPtr>& clouds)
{
    std::vector<Layer> layers;
    layers.reserve(clouds.size());

    for (const CloudPtr& cloud : clouds)
    {
        Layer layer;
        if (cloud)
        {
            layer.reserve(cloud->points.size());
            for (const PointT& p : cloud->points)
                layer.push_back(Eigen::Vector3d(p.x, p.y, p.z));
        }
        layers.push_back(layer);
    }
    return layers;
}


// Multi-layer Euclidean clustering
template<typename PointT>
std::vector<typename ProcessLayerClouds<PointT>::CloudPtr> ProcessLayerClouds<PointT>::Clustering(const std::vector<CloudPtr>& clouds, const ClusterParams& params)
{
    params.validate();

    // Time clustering process
    auto startTime = std::chrono::steady_clock::now();

    MultiLayerCluster mlc(CloudsToLayers(clouds), params.indexType);
    mlc.clusterAllLayers(params.selfRadius, params.otherRadius);
    std::vector<std::vector<int>> cluster_indices = mlc.extractClusters(params.minClusterSize, params.maxClusterSize);

    // global ids back to the source cloud points
    const LayerSet& layerSet = mlc.layerSet();
    std::vector<CloudPtr> clusters;
    for (const std::vector<int>& cluster : cluster_indices)
    {
        CloudPtr cloud_cluster(new pcl::PointCloud<PointT>);

        for (int index : cluster)
        {
            std::pair<std::size_t, int> source = layerSet.locate(index);
            cloud_cluster->points.push_back(clouds[source.first]->points[source.second]);
        }

        cloud_cluster->width = cloud_cluster->size();
        cloud_cluster->height = 1;
        cloud_cluster->is_dense = true;

        clusters.push_back(cloud_cluster);
    }

    auto endTime = std::chrono::steady_clock::now();
    auto elapsedTime = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);
    PCL_DEBUG("[ProcessLayerClouds::Clustering] took %lld ms and found %zu clusters\n",
              static_cast<long long>(elapsedTime.count()), clusters.size());

    return clusters;
}
