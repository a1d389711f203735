#ifndef TOPK_RECOMMEND_MERGETOPK_HPP
#define TOPK_RECOMMEND_MERGETOPK_HPP

#include "struct/PartialTopK.hpp"
#include "struct/RecommendError.hpp"
#include "struct/ScorePair.hpp"

#include <spdlog/fmt/fmt.h>
#include <vector>

namespace TopkRecommend {

    /*
     * Merge two top-k of the same source block (same rows, same row order) into one.
     * Per row, a two pointer merge of two descending, sentinel padded rows keeps the topk best
     * of the 2 * topk candidates. Candidates are compared in ScorePair order, so equal scores
     * fall back to the lower destination ID; a candidate equal on both score and ID is taken
     * from partial. Either pointer advances on every step.
     * An empty operand is the identity.
     */
    inline PartialTopK MergeTopK(PartialTopK acc, PartialTopK partial, const int &topk) {
        if (acc.IsEmpty()) {
            return partial;
        }
        if (partial.IsEmpty()) {
            return acc;
        }
        if (acc.n_row() != partial.n_row() || acc.topk() != topk || partial.topk() != topk) {
            ThrowError<DimensionMismatch>(
                    fmt::format("cannot merge top-k of {} rows, width {} with {} rows, width {} at topk {}",
                                acc.n_row(), acc.topk(), partial.n_row(), partial.topk(), topk));
        }

        const int n_row = acc.n_row();
        std::vector<int> merge_dst_ID_l((size_t) n_row * topk);
        PartialTopK::ScoreMatrix merge_score_m(n_row, topk);
        for (int row = 0; row < n_row; row++) {
            int acc_idx = 0;
            int partial_idx = 0;
            for (int col = 0; col < topk; col++) {
                const ScorePair acc_cand(acc.DstID(row, acc_idx), acc.Score(row, acc_idx));
                const ScorePair partial_cand(partial.DstID(row, partial_idx), partial.Score(row, partial_idx));
                if (acc_cand > partial_cand) {
                    merge_dst_ID_l[(size_t) row * topk + col] = acc_cand.ID_;
                    merge_score_m(row, col) = acc_cand.score_;
                    acc_idx++;
                } else {
                    merge_dst_ID_l[(size_t) row * topk + col] = partial_cand.ID_;
                    merge_score_m(row, col) = partial_cand.score_;
                    partial_idx++;
                }
            }
        }
        return {acc.src_ids(), std::move(merge_dst_ID_l), std::move(merge_score_m), topk};
    }

}
#endif //TOPK_RECOMMEND_MERGETOPK_HPP
