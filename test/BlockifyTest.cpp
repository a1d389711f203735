#include "alg/Blockify.hpp"
#include "struct/RecommendError.hpp"
#include "TestData.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace TopkRecommend;

TEST(BlockifyTest, PreservesIDsAndBoundsBlockSize) {
    const int rank = 4;
    const PartitionedFeatures features = RandomFeatures(rank, 103, 1000, 3, 7);
    const int block_size = 10;
    const std::vector<FeatureBlock> block_l = Blockify(rank, features, block_size);

    std::vector<int> block_ID_l;
    for (const FeatureBlock &block: block_l) {
        EXPECT_GT(block.size(), 0);
        EXPECT_LE(block.size(), block_size);
        EXPECT_EQ(block.rank(), rank);
        EXPECT_EQ(block.matrix().cols(), block.size());
        block_ID_l.insert(block_ID_l.end(), block.ids().begin(), block.ids().end());
    }

    std::vector<int> input_ID_l;
    for (const FeatureVector &vecs: Flatten(features)) {
        input_ID_l.push_back(vecs.ID_);
    }
    EXPECT_EQ(block_ID_l, input_ID_l);
}

TEST(BlockifyTest, BlocksNeverSpanPartitions) {
    const int rank = 2;
    // partition sizes 4, 3, 3
    const PartitionedFeatures features = RandomFeatures(rank, 10, 0, 3, 11);
    const std::vector<FeatureBlock> block_l = Blockify(rank, features, 3);

    std::vector<int> size_l;
    for (const FeatureBlock &block: block_l) {
        size_l.push_back(block.size());
    }
    EXPECT_EQ(size_l, (std::vector<int>{3, 1, 3, 3}));
}

TEST(BlockifyTest, ColumnsHoldFeatureVectors) {
    const int rank = 3;
    const PartitionedFeatures features = MakeFeatures(rank, {FeatureVector(4, {1, 2, 3}),
                                                             FeatureVector(8, {4, 5, 6}),
                                                             FeatureVector(6, {7, 8, 9})});
    const std::vector<FeatureBlock> block_l = Blockify(rank, features, 2);
    ASSERT_EQ(block_l.size(), 2u);
    EXPECT_EQ(block_l[0].ids(), (std::vector<int>{4, 8}));
    EXPECT_EQ(block_l[1].ids(), (std::vector<int>{6}));
    EXPECT_DOUBLE_EQ(block_l[0].matrix()(0, 1), 4);
    EXPECT_DOUBLE_EQ(block_l[0].matrix()(2, 1), 6);
    EXPECT_DOUBLE_EQ(block_l[1].matrix()(1, 0), 8);
}

TEST(BlockifyTest, DefaultBlockSize) {
    const int rank = 2;
    const PartitionedFeatures features = RandomFeatures(rank, kDefaultBlockSize + 1, 0, 1, 3);
    const std::vector<FeatureBlock> block_l = Blockify(rank, features);
    ASSERT_EQ(block_l.size(), 2u);
    EXPECT_EQ(block_l[0].size(), kDefaultBlockSize);
    EXPECT_EQ(block_l[1].size(), 1);
}

TEST(BlockifyTest, EmptyFeatureSetGivesNoBlock) {
    const PartitionedFeatures features(5);
    EXPECT_TRUE(Blockify(5, features, 4).empty());
}

TEST(BlockifyTest, RejectsDimensionMismatch) {
    const PartitionedFeatures features = MakeFeatures(3, {FeatureVector(1, {1, 2, 3}),
                                                          FeatureVector(2, {1, 2})});
    EXPECT_THROW(Blockify(3, features, 10), DimensionMismatch);

    const PartitionedFeatures rank_two = RandomFeatures(2, 5, 0, 1, 1);
    EXPECT_THROW(Blockify(3, rank_two, 10), DimensionMismatch);
}

TEST(BlockifyTest, RejectsNonPositiveBlockSize) {
    const PartitionedFeatures features = RandomFeatures(2, 5, 0, 1, 1);
    EXPECT_THROW(Blockify(2, features, 0), InvalidArgument);
    EXPECT_THROW(Blockify(2, features, -1), InvalidArgument);
}

TEST(BlockifyTest, SameBlocksForEveryThreadCount) {
    const int rank = 3;
    const PartitionedFeatures features = RandomFeatures(rank, 57, 200, 5, 13);
    const std::vector<FeatureBlock> single_l = Blockify(rank, features, 4, 1);

    for (const int n_thread: {2, 7, 0}) {
        const std::vector<FeatureBlock> block_l = Blockify(rank, features, 4, n_thread);
        ASSERT_EQ(block_l.size(), single_l.size()) << "n_thread " << n_thread;
        for (size_t blockID = 0; blockID < block_l.size(); blockID++) {
            EXPECT_EQ(block_l[blockID].ids(), single_l[blockID].ids());
            EXPECT_TRUE(block_l[blockID].matrix() == single_l[blockID].matrix());
        }
    }
}

TEST(BlockifyTest, ResolveNumThread) {
    EXPECT_EQ(ResolveNumThread(3), 3);
    EXPECT_EQ(ResolveNumThread(0), omp_get_max_threads());
    EXPECT_EQ(ResolveNumThread(-2), omp_get_max_threads());
}
