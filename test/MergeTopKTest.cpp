#include "alg/Blockify.hpp"
#include "alg/ExpandTopK.hpp"
#include "alg/MergeTopK.hpp"
#include "score_computation/BlockScore.hpp"
#include "struct/PartialTopK.hpp"
#include "struct/RecommendError.hpp"
#include "TestData.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace TopkRecommend;

namespace {

    // every row given in descending order, padded with sentinels up to topk
    PartialTopK MakePartial(const std::vector<int> &src_ID_l, const std::vector<RecommendList> &row_l,
                            const int &topk) {
        const int n_row = (int) src_ID_l.size();
        std::vector<int> dst_ID_l((size_t) n_row * topk, PartialTopK::kSentinelID);
        PartialTopK::ScoreMatrix score_m = PartialTopK::ScoreMatrix::Constant(n_row, topk,
                                                                              PartialTopK::kSentinelScore);
        for (int row = 0; row < n_row; row++) {
            for (int col = 0; col < (int) row_l[row].size(); col++) {
                dst_ID_l[(size_t) row * topk + col] = row_l[row][col].ID_;
                score_m(row, col) = row_l[row][col].score_;
            }
        }
        return {src_ID_l, std::move(dst_ID_l), std::move(score_m), topk};
    }

    void ExpectSameTopk(const PartialTopK &a, const PartialTopK &b) {
        ASSERT_EQ(a.n_row(), b.n_row());
        ASSERT_EQ(a.topk(), b.topk());
        EXPECT_EQ(a.src_ids(), b.src_ids());
        for (int row = 0; row < a.n_row(); row++) {
            for (int col = 0; col < a.topk(); col++) {
                EXPECT_EQ(a.Score(row, col), b.Score(row, col)) << "row " << row << " col " << col;
                if (a.Score(row, col) != PartialTopK::kSentinelScore) {
                    EXPECT_EQ(a.DstID(row, col), b.DstID(row, col)) << "row " << row << " col " << col;
                }
            }
        }
    }

}

TEST(MergeTopKTest, EmptyIsIdentity) {
    const PartialTopK x = MakePartial({1, 2}, {{{10, 3.0}, {11, 1.0}}, {{12, 2.0}}}, 2);
    ExpectSameTopk(MergeTopK(PartialTopK(), x, 2), x);
    ExpectSameTopk(MergeTopK(x, PartialTopK(), 2), x);
    EXPECT_TRUE(MergeTopK(PartialTopK(), PartialTopK(), 2).IsEmpty());
}

TEST(MergeTopKTest, KeepsLargestOfBothSides) {
    const PartialTopK a = MakePartial({1}, {{{10, 9.0}, {11, 4.0}, {12, 1.0}}}, 3);
    const PartialTopK b = MakePartial({1}, {{{20, 5.0}, {21, 3.0}, {22, 2.0}}}, 3);
    const PartialTopK merged = MergeTopK(a, b, 3);

    const RecommendResult result = ExpandTopK(merged);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].first, 1);
    EXPECT_EQ(result[0].second, (RecommendList{{10, 9.0}, {20, 5.0}, {11, 4.0}}));
}

TEST(MergeTopKTest, EqualScoresAcrossBlocksDoNotStall) {
    const PartialTopK a = MakePartial({1, 2}, {{{1, 5.0}, {2, 3.0}},
                                               {{3, 1.0}, {4, 1.0}}}, 3);
    const PartialTopK b = MakePartial({1, 2}, {{{7, 5.0}, {8, 3.0}},
                                               {{5, 1.0}, {6, 1.0}}}, 3);
    const RecommendResult result = ExpandTopK(MergeTopK(a, b, 3));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].second, (RecommendList{{1, 5.0}, {7, 5.0}, {2, 3.0}}));
    EXPECT_EQ(result[1].second, (RecommendList{{3, 1.0}, {4, 1.0}, {5, 1.0}}));

    const RecommendResult swap_result = ExpandTopK(MergeTopK(b, a, 3));
    EXPECT_EQ(swap_result, result);
}

TEST(MergeTopKTest, SentinelPaddingStaysAtTheEnd) {
    const PartialTopK a = MakePartial({1}, {{{10, -2.0}}}, 4);
    const PartialTopK b = MakePartial({1}, {{{20, -1.0}}}, 4);
    const PartialTopK merged = MergeTopK(a, b, 4);

    EXPECT_EQ(merged.DstID(0, 0), 20);
    EXPECT_EQ(merged.DstID(0, 1), 10);
    EXPECT_EQ(merged.Score(0, 2), PartialTopK::kSentinelScore);
    EXPECT_EQ(merged.Score(0, 3), PartialTopK::kSentinelScore);

    const RecommendResult result = ExpandTopK(merged);
    EXPECT_EQ(result[0].second, (RecommendList{{20, -1.0}, {10, -2.0}}));
}

TEST(MergeTopKTest, AssociativeAndCommutative) {
    const int rank = 4;
    const int topk = 5;
    const FeatureBlock src_block = Blockify(rank, RandomFeatures(rank, 12, 0, 1, 41), 100)[0];
    const std::vector<FeatureBlock> dst_block_l = Blockify(rank, RandomFeatures(rank, 21, 100, 1, 42), 7);
    ASSERT_EQ(dst_block_l.size(), 3u);

    const PartialTopK x = ComputeBlockPairTopk(src_block, dst_block_l[0], topk);
    const PartialTopK y = ComputeBlockPairTopk(src_block, dst_block_l[1], topk);
    const PartialTopK z = ComputeBlockPairTopk(src_block, dst_block_l[2], topk);

    const PartialTopK left = MergeTopK(MergeTopK(x, y, topk), z, topk);
    const PartialTopK right = MergeTopK(x, MergeTopK(y, z, topk), topk);
    const PartialTopK swapped = MergeTopK(z, MergeTopK(y, x, topk), topk);
    ExpectSameTopk(left, right);
    ExpectSameTopk(left, swapped);
}

TEST(MergeTopKTest, RejectsDifferentShape) {
    const PartialTopK a = MakePartial({1, 2}, {{{10, 1.0}}, {{11, 1.0}}}, 2);
    const PartialTopK b = MakePartial({1}, {{{12, 1.0}}}, 2);
    EXPECT_THROW(MergeTopK(a, b, 2), DimensionMismatch);
}

TEST(ExpandTopKTest, CutoffAtFirstSentinel) {
    const PartialTopK merged = MakePartial({4, 5, 6}, {{{10, 2.0}, {11, 1.0}, {12, 0.5}},
                                                        {{13, 0.1}},
                                                        {}}, 3);
    const RecommendResult result = ExpandTopK(merged);

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].first, 4);
    EXPECT_EQ(result[0].second.size(), 3u);
    EXPECT_EQ(result[1].first, 5);
    EXPECT_EQ(result[1].second, (RecommendList{{13, 0.1}}));
    EXPECT_EQ(result[2].first, 6);
    EXPECT_TRUE(result[2].second.empty());
}
