#include <gtest/gtest.h>
#include <algorithm>
#include "cluster/kdtree.h"
#include "cluster/pclKdTree.h"
#include "clusterExceptions.h"
#include "test_helpers.h"

TEST(KdTreeTest, SearchIsInclusiveAtRadius) {
    Layer points = {makePoint(0, 0), makePoint(1, 0), makePoint(0, 2)};
    KdTree tree(points);

    EXPECT_EQ(tree.radiusSearch(makePoint(0, 0), 1.0), std::vector<int>({0, 1}));
    EXPECT_EQ(tree.radiusSearch(makePoint(0, 0), 0.999), std::vector<int>({0}));
    EXPECT_EQ(tree.radiusSearch(makePoint(0, 0), 2.0), std::vector<int>({0, 1, 2}));
}

TEST(KdTreeTest, ZeroRadiusFindsCoincidentPointsOnly) {
    Layer points = {makePoint(1, 1), makePoint(1, 1), makePoint(1, 1.0001)};
    KdTree tree(points);

    EXPECT_EQ(tree.radiusSearch(makePoint(1, 1), 0.0), std::vector<int>({0, 1}));
}

TEST(KdTreeTest, QueryWithinAlwaysMatchesSelf) {
    std::mt19937 rng(7);
    Layer points = randomLayer(rng, 50, 2, 100.0);
    KdTree tree(points);

    Neighbors matches = tree.queryWithin(0.0);
    ASSERT_EQ(matches.size(), points.size());
    for (int i = 0; i < static_cast<int>(matches.size()); ++i)
        EXPECT_NE(std::find(matches[i].begin(), matches[i].end(), i), matches[i].end());
}

TEST(KdTreeTest, DuplicateKeysOnSplitAxis) {
    // many equal x values force equal keys onto both sides of the median
    Layer points;
    for (int i = 0; i < 20; ++i)
        points.push_back(makePoint(5.0, static_cast<double>(i)));
    KdTree tree(points);

    EXPECT_EQ(tree.radiusSearch(makePoint(5.0, 10.0), 1.0), std::vector<int>({9, 10, 11}));
    EXPECT_EQ(tree.radiusSearch(makePoint(4.0, 3.0), 1.0), std::vector<int>({3}));
}

TEST(KdTreeTest, TreeIsBalanced) {
    std::mt19937 rng(11);
    Layer points = randomLayer(rng, 1000, 3, 10.0);
    KdTree tree(points);

    // 1000 points fit in 10 levels when every split is at the median
    EXPECT_EQ(tree.depth(), 10);
    EXPECT_EQ(tree.size(), 1000u);
    EXPECT_EQ(tree.dimension(), 3);
}

TEST(KdTreeTest, MatchesBruteForceInFiveDimensions) {
    std::mt19937 rng(3);
    Layer points = randomLayer(rng, 300, 5, 10.0);
    Layer queries = randomLayer(rng, 40, 5, 10.0);
    KdTree tree(points);

    for (const Point& q : queries)
        for (double radius : {0.5, 2.0, 4.0, 8.0})
            EXPECT_EQ(tree.radiusSearch(q, radius), bruteForceSearch(points, q, radius));
}

TEST(KdTreeTest, QueryAgainstUsesOtherIndexIds) {
    Layer first = {makePoint(0, 0), makePoint(10, 10)};
    Layer second = {makePoint(10.1, 10), makePoint(0.1, 0), makePoint(50, 50)};
    KdTree a(first);
    KdTree b(second);

    Neighbors matches = a.queryAgainst(b, 0.2);
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0], std::vector<int>({1}));
    EXPECT_EQ(matches[1], std::vector<int>({0}));

    Neighbors reverse = b.queryAgainst(a, 0.2);
    ASSERT_EQ(reverse.size(), 3u);
    EXPECT_EQ(reverse[0], std::vector<int>({1}));
    EXPECT_EQ(reverse[1], std::vector<int>({0}));
    EXPECT_TRUE(reverse[2].empty());
}

TEST(SpatialIndexFactoryTest, EmptyLayerIsAbsent) {
    EXPECT_FALSE(createSpatialIndex(IndexType::KD_TREE, Layer()));
    EXPECT_FALSE(createSpatialIndex(IndexType::PCL_KD_TREE, Layer()));
}

TEST(SpatialIndexFactoryTest, BuildsRequestedVariant) {
    Layer points = {makePoint(1, 2)};
    SpatialIndex::Ptr kd = createSpatialIndex(IndexType::KD_TREE, points);
    SpatialIndex::Ptr flann = createSpatialIndex(IndexType::PCL_KD_TREE, points);

    EXPECT_NE(dynamic_cast<KdTree*>(kd.get()), nullptr);
    EXPECT_NE(dynamic_cast<PclKdTree*>(flann.get()), nullptr);
    EXPECT_STREQ(indexTypeName(IndexType::PCL_KD_TREE), "pcl_kd_tree");
}

TEST(PclKdTreeTest, RejectsMoreThanThreeDimensions) {
    Layer points = {Eigen::VectorXd::Zero(4)};
    EXPECT_THROW(PclKdTree tree(points), ClusterConfigException);
}

TEST(PclKdTreeTest, PadsLowDimensionalPoints) {
    pcl::PointXYZ p = PclKdTree::toPointXYZ(makePoint(1.5, -2.0));
    EXPECT_FLOAT_EQ(p.x, 1.5f);
    EXPECT_FLOAT_EQ(p.y, -2.0f);
    EXPECT_FLOAT_EQ(p.z, 0.0f);
}

TEST(PclKdTreeTest, AgreesWithKdTree) {
    std::mt19937 rng(5);
    Layer points = randomLayer(rng, 200, 3, 20.0);
    Layer queries = randomLayer(rng, 30, 3, 20.0);
    KdTree kd(points);
    PclKdTree flann(points);

    for (const Point& q : queries)
        for (double radius : {1.0, 3.0})
            EXPECT_EQ(flann.radiusSearch(q, radius), kd.radiusSearch(q, radius));
}

TEST(PclKdTreeTest, ZeroRadiusFindsSelfAndDuplicates) {
    Layer points = {makePoint(1, 1), makePoint(1, 1), makePoint(1, 1.0001)};
    PclKdTree flann(points);

    EXPECT_EQ(flann.radiusSearch(makePoint(1, 1), 0.0), std::vector<int>({0, 1}));
    EXPECT_EQ(flann.radiusSearch(makePoint(1, 1.0001), 0.0), std::vector<int>({2}));
}

TEST(PclKdTreeTest, SearchIsInclusiveAtRadius) {
    Layer points = {makePoint(0, 0), makePoint(1, 0), makePoint(0, 2)};
    PclKdTree flann(points);

    EXPECT_EQ(flann.radiusSearch(makePoint(0, 0), 1.0), std::vector<int>({0, 1}));
    EXPECT_EQ(flann.radiusSearch(makePoint(0, 0), 2.0), std::vector<int>({0, 1, 2}));
}

TEST(PclKdTreeTest, MatchesBruteForceOnTieGrid) {
    // coordinates on multiples of 0.1 put many points exactly at the radius
    Layer points;
    for (int x = 0; x < 8; ++x)
        for (int y = 0; y < 8; ++y)
            for (int z = 0; z < 3; ++z)
                points.push_back(makePoint(0.1 * x, 0.1 * y, 0.1 * z));
    points.push_back(makePoint(0.3, 0.3, 0.1));
    PclKdTree flann(points);
    KdTree kd(points);

    for (const Point& q : points) {
        for (double radius : {0.0, 0.1, 0.2}) {
            std::vector<int> expected = bruteForceSearch(points, q, radius);
            EXPECT_EQ(flann.radiusSearch(q, radius), expected);
            EXPECT_EQ(kd.radiusSearch(q, radius), expected);
        }
    }
}

TEST(PclKdTreeTest, LargeCoordinatesKeepInclusiveMatches) {
    Layer points = {makePoint(1000.0, 1000.0), makePoint(1000.25, 1000.0), makePoint(1000.0, 1000.5)};
    PclKdTree flann(points);

    EXPECT_EQ(flann.radiusSearch(makePoint(1000.0, 1000.0), 0.25), std::vector<int>({0, 1}));
    EXPECT_EQ(flann.radiusSearch(makePoint(1000.0, 1000.0), 0.0), std::vector<int>({0}));
}

TEST(SpatialIndexFactoryTest, RejectsUnknownIndexType) {
    Layer points = {makePoint(1, 2)};
    EXPECT_THROW(createSpatialIndex(static_cast<IndexType>(42), points), ClusterConfigException);
    EXPECT_STREQ(indexTypeName(static_cast<IndexType>(42)), "unknown");
}
