#ifndef LAYER_SET_H
#define LAYER_SET_H

#include <cstddef>
#include <utility>
#include <vector>
#include "cluster/spatialIndex.h"

/**
 * Ordered layers of k-dimensional points flattened into one global index
 * space. Layer i owns global ids [startIndex(i), startIndex(i) + layerSize(i)).
 * Every non-empty layer gets its own SpatialIndex; empty layers have none.
 * Immutable after construction.
 */
class LayerSet
{
public:
    /**
     * Validates all points, then builds one index per non-empty layer.
     * @throws ClusterConfigException on mixed dimensionality or a non-finite coordinate.
     */
    explicit LayerSet(const std::vector<Layer>& layers, IndexType indexType = IndexType::KD_TREE);

    std::size_t numLayers() const { return starts_.size(); }
    std::size_t numPoints() const { return points_.size(); }

    // coordinates per point, 0 if every layer is empty
    int dimension() const { return dim_; }
    IndexType indexType() const { return indexType_; }

    std::size_t layerSize(std::size_t layer) const;
    int startIndex(std::size_t layer) const;

    // null when the layer is empty
    SpatialIndex::ConstPtr index(std::size_t layer) const;

    // concatenation of all layers in order
    const Layer& combined() const { return points_; }

    const Point& point(int globalIndex) const;

    // (layer, local index) of a global id; empty layers are never returned
    std::pair<std::size_t, int> locate(int globalIndex) const;

private:
    void validate(const std::vector<Layer>& layers);

    Layer points_;
    std::vector<int> starts_;
    std::vector<std::size_t> sizes_;
    std::vector<SpatialIndex::ConstPtr> indexes_;
    int dim_;
    IndexType indexType_;
};

#endif // LAYER_SET_H
