#include "alg/TopkMinHeap.hpp"
#include "struct/RecommendError.hpp"
#include "TestData.hpp"

#include <gtest/gtest.h>

using namespace TopkRecommend;

TEST(TopkMinHeapTest, KeepsLargestScores) {
    TopkMinHeap heap(3);
    const double score_l[] = {0.5, 3.0, -1.0, 2.0, 4.0, 1.0};
    for (int i = 0; i < 6; i++) {
        heap.Update(ScorePair(i, score_l[i]));
    }
    ASSERT_EQ(heap.Size(), 3);
    EXPECT_EQ(heap.Capacity(), 3);
    EXPECT_EQ(heap.Front(), ScorePair(3, 2.0));

    // drains from the worst retained pair
    EXPECT_EQ(heap.Poll(), ScorePair(3, 2.0));
    EXPECT_EQ(heap.Poll(), ScorePair(1, 3.0));
    EXPECT_EQ(heap.Poll(), ScorePair(4, 4.0));
    EXPECT_EQ(heap.Size(), 0);
}

TEST(TopkMinHeapTest, FewerElementsThanCapacity) {
    TopkMinHeap heap(5);
    heap.Update(ScorePair(7, 1.5));
    heap.Update(ScorePair(8, -0.5));
    ASSERT_EQ(heap.Size(), 2);
    EXPECT_EQ(heap.Poll(), ScorePair(8, -0.5));
    EXPECT_EQ(heap.Poll(), ScorePair(7, 1.5));
}

TEST(TopkMinHeapTest, EqualScoreKeepsLowerID) {
    TopkMinHeap heap(2);
    heap.Update(ScorePair(5, 1.0));
    heap.Update(ScorePair(9, 1.0));
    // ranks ahead of ID 9, evicts it
    heap.Update(ScorePair(2, 1.0));
    // ranks behind everything retained
    heap.Update(ScorePair(11, 1.0));
    ASSERT_EQ(heap.Size(), 2);
    EXPECT_EQ(heap.Poll(), ScorePair(5, 1.0));
    EXPECT_EQ(heap.Poll(), ScorePair(2, 1.0));
}

TEST(TopkMinHeapTest, ResetEmptiesTheHeap) {
    TopkMinHeap heap(2);
    heap.Update(ScorePair(1, 1.0));
    heap.Update(ScorePair(2, 2.0));
    heap.Reset();
    EXPECT_EQ(heap.Size(), 0);
    heap.Update(ScorePair(3, -3.0));
    EXPECT_EQ(heap.Size(), 1);
    EXPECT_EQ(heap.Front(), ScorePair(3, -3.0));
}

TEST(TopkMinHeapTest, RejectsNonPositiveCapacity) {
    EXPECT_THROW(TopkMinHeap(0), InvalidArgument);
    EXPECT_THROW(TopkMinHeap(-2), InvalidArgument);
}
