#ifndef TOPK_RECOMMEND_BLOCKSCORE_HPP
#define TOPK_RECOMMEND_BLOCKSCORE_HPP

#include "alg/TopkMinHeap.hpp"
#include "struct/FeatureBlock.hpp"
#include "struct/PartialTopK.hpp"
#include "struct/RecommendError.hpp"
#include "struct/ScorePair.hpp"

#include <Eigen/Dense>
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace TopkRecommend {

    // m x n matrix, entry (i, k) is the inner product of source column i and destination column k
    inline Eigen::MatrixXd ScoreBlockPair(const FeatureBlock &src_block, const FeatureBlock &dst_block) {
        if (src_block.rank() != dst_block.rank()) {
            ThrowError<DimensionMismatch>(
                    fmt::format("source block rank {} does not match destination block rank {}",
                                src_block.rank(), dst_block.rank()));
        }
        return src_block.matrix().transpose() * dst_block.matrix();
    }

    inline PartialTopK SelectTopkPerRow(const Eigen::MatrixXd &score_m, const std::vector<int> &src_ID_l,
                                        const std::vector<int> &dst_ID_l, const int &topk) {
        const int n_src = (int) score_m.rows();
        const int n_dst = (int) score_m.cols();
        if (n_src != (int) src_ID_l.size() || n_dst != (int) dst_ID_l.size()) {
            ThrowError<DimensionMismatch>(
                    fmt::format("score matrix {}x{} does not match {} source IDs and {} destination IDs",
                                n_src, n_dst, src_ID_l.size(), dst_ID_l.size()));
        }

        std::vector<int> topk_dst_ID_l((size_t) n_src * topk, PartialTopK::kSentinelID);
        PartialTopK::ScoreMatrix topk_score_m = PartialTopK::ScoreMatrix::Constant(n_src, topk,
                                                                                   PartialTopK::kSentinelScore);
        TopkMinHeap heap(topk);
        for (int srcID = 0; srcID < n_src; srcID++) {
            heap.Reset();
            for (int dstID = 0; dstID < n_dst; dstID++) {
                heap.Update(ScorePair(dst_ID_l[dstID], score_m(srcID, dstID)));
            }
            // drain from the worst, fill the row from its last retained slot backward
            int size = heap.Size();
            while (size > 0) {
                size--;
                const ScorePair pair = heap.Poll();
                topk_dst_ID_l[(size_t) srcID * topk + size] = pair.ID_;
                topk_score_m(srcID, size) = pair.score_;
            }
        }
        return {src_ID_l, std::move(topk_dst_ID_l), std::move(topk_score_m), topk};
    }

    inline PartialTopK ComputeBlockPairTopk(const FeatureBlock &src_block, const FeatureBlock &dst_block,
                                            const int &topk) {
        const Eigen::MatrixXd score_m = ScoreBlockPair(src_block, dst_block);
        return SelectTopkPerRow(score_m, src_block.ids(), dst_block.ids(), topk);
    }

}
#endif //TOPK_RECOMMEND_BLOCKSCORE_HPP
