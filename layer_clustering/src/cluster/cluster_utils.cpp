#include "cluster_utils.h"
#include "../layerSet.h"
#include "../clusterExceptions.h"

#include <algorithm>
#include <chrono>
#include <utility>
#include <pcl/console/print.h>

// ───────────────────────── helpers ──────────────────────────
static void shiftIndices(Neighbors& matches, int offset)
{
    for (std::vector<int>& match : matches)
        for (int& id : match)
            id += offset;
}

// Matches of every point of layer i in layer j; an absent index on either
// side gives one empty list per point of layer i.
static Neighbors matchLayers(const LayerSet& layers, std::size_t i, std::size_t j, double radius)
{
    SpatialIndex::ConstPtr from = layers.index(i);
    SpatialIndex::ConstPtr to = layers.index(j);

    if (!from || !to)
        return Neighbors(layers.layerSize(i));

    Neighbors matches = (i == j) ? from->queryWithin(radius) : from->queryAgainst(*to, radius);
    shiftIndices(matches, layers.startIndex(j));
    return matches;
}

void checkRadius(double radius, const char* name)
{
    // also rejects NaN
    if (!(radius >= 0.0))
        PCL_THROW_EXCEPTION(ClusterConfigException,
            name << " must be non-negative, got " << radius);
}

// ─────────────────── exported clustering api ─────────────────
AdjacencyList buildProximityGraph(
        const LayerSet& layers,
        double selfRadius,
        double otherRadius)
{
    checkRadius(selfRadius, "self radius");
    checkRadius(otherRadius, "other radius");

    auto startTime = std::chrono::steady_clock::now();

    AdjacencyList matches;
    matches.reserve(layers.numPoints());

    for (std::size_t i = 0; i < layers.numLayers(); ++i)
    {
        if (!layers.index(i))
            continue;   // empty layer, no points to contribute

        Neighbors layerMatches = matchLayers(layers, i, i, selfRadius);
        for (std::size_t j = i + 1; j < layers.numLayers(); ++j)
        {
            Neighbors cross = matchLayers(layers, i, j, otherRadius);
            for (std::size_t k = 0; k < layerMatches.size(); ++k)
                layerMatches[k].insert(layerMatches[k].end(), cross[k].begin(), cross[k].end());
        }

        for (std::vector<int>& match : layerMatches)
            matches.push_back(std::move(match));
    }

    auto endTime = std::chrono::steady_clock::now();
    auto elapsedTime = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
    PCL_DEBUG("[buildProximityGraph] matched %zu points in %lld us\n",
              matches.size(), static_cast<long long>(elapsedTime.count()));

    return matches;
}

ClusterMap compressMatches(const AdjacencyList& matches)
{
    UnionFind uf(matches.size());
    for (std::size_t i = 0; i < matches.size(); ++i)
        for (int j : matches[i])
            uf.unite(static_cast<int>(i), j);

    PCL_DEBUG("[compressMatches] %zu points in %zu clusters\n", uf.size(), uf.count());
    return uf.listUnions();
}

std::vector<std::vector<int>> extractClusters(
        const ClusterMap& clusters,
        int minSize,
        int maxSize)
{
    std::vector<std::vector<int>> kept;
    for (const auto& entry : clusters)
    {
        int clusterSize = static_cast<int>(entry.second.size());
        if (clusterSize >= minSize && clusterSize <= maxSize)
            kept.push_back(entry.second);
    }

    std::sort(kept.begin(), kept.end(), [](const std::vector<int>& a, const std::vector<int>& b) {
        return a.front() < b.front();
    });
    return kept;
}
