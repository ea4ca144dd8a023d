#include "layerSet.h"
#include "clusterExceptions.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <pcl/console/print.h>


LayerSet::LayerSet(const std::vector<Layer>& layers, IndexType indexType)
: dim_(0), indexType_(indexType)
{
    validate(layers);

    starts_.reserve(layers.size());
    sizes_.reserve(layers.size());
    indexes_.reserve(layers.size());

    for (const Layer& layer : layers)
    {
        starts_.push_back(static_cast<int>(points_.size()));
        sizes_.push_back(layer.size());
        indexes_.push_back(createSpatialIndex(indexType_, layer));
        points_.insert(points_.end(), layer.begin(), layer.end());
    }

    PCL_DEBUG("[LayerSet::LayerSet] %zu layers, %zu points, %d dimensions, index %s\n",
              numLayers(), numPoints(), dim_, indexTypeName(indexType_));
}


void LayerSet::validate(const std::vector<Layer>& layers)
{
    for (std::size_t l = 0; l < layers.size(); l++)
    {
        for (std::size_t i = 0; i < layers[l].size(); i++)
        {
            const Point& p = layers[l][i];
            int pointDim = static_cast<int>(p.size());

            if (pointDim == 0)
                PCL_THROW_EXCEPTION(ClusterConfigException,
                    "point " << i << " of layer " << l << " has no coordinates");

            if (dim_ == 0)
                dim_ = pointDim;
            else if (pointDim != dim_)
                PCL_THROW_EXCEPTION(ClusterConfigException,
                    "point " << i << " of layer " << l << " has " << pointDim
                    << " coordinates, expected " << dim_);

            if (!p.allFinite())
                PCL_THROW_EXCEPTION(ClusterConfigException,
                    "point " << i << " of layer " << l << " has a non-finite coordinate");
        }
    }
}


std::size_t LayerSet::layerSize(std::size_t layer) const
{
    return sizes_.at(layer);
}


int LayerSet::startIndex(std::size_t layer) const
{
    return starts_.at(layer);
}


SpatialIndex::ConstPtr LayerSet::index(std::size_t layer) const
{
    return indexes_.at(layer);
}


const Point& LayerSet::point(int globalIndex) const
{
    if (globalIndex < 0 || static_cast<std::size_t>(globalIndex) >= points_.size())
        throw std::out_of_range("LayerSet: global index " + std::to_string(globalIndex) + " out of range");
    return points_[globalIndex];
}


std::pair<std::size_t, int> LayerSet::locate(int globalIndex) const
{
    if (globalIndex < 0 || static_cast<std::size_t>(globalIndex) >= points_.size())
        throw std::out_of_range("LayerSet: global index " + std::to_string(globalIndex) + " out of range");

    // last layer starting at or before globalIndex; the next start lies above it, so the layer is non-empty
    std::vector<int>::const_iterator it = std::upper_bound(starts_.begin(), starts_.end(), globalIndex);
    std::size_t layer = static_cast<std::size_t>(it - starts_.begin()) - 1;

    return std::make_pair(layer, globalIndex - starts_[layer]);
}
