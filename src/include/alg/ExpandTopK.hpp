#ifndef TOPK_RECOMMEND_EXPANDTOPK_HPP
#define TOPK_RECOMMEND_EXPANDTOPK_HPP

#include "struct/PartialTopK.hpp"
#include "struct/ScorePair.hpp"

#include <vector>

namespace TopkRecommend {

    // rows are sorted descending, so the first sentinel of a row marks its cutoff
    inline void ExpandTopK(const PartialTopK &merged, RecommendResult &result) {
        const int n_row = merged.n_row();
        const int topk = merged.topk();
        for (int row = 0; row < n_row; row++) {
            int cutoff = 0;
            while (cutoff < topk && merged.Score(row, cutoff) != PartialTopK::kSentinelScore) {
                cutoff++;
            }
            RecommendList recommend_l;
            recommend_l.reserve(cutoff);
            for (int col = 0; col < cutoff; col++) {
                recommend_l.emplace_back(merged.DstID(row, col), merged.Score(row, col));
            }
            result.emplace_back(merged.src_ids()[row], std::move(recommend_l));
        }
    }

    inline RecommendResult ExpandTopK(const PartialTopK &merged) {
        RecommendResult result;
        result.reserve(merged.n_row());
        ExpandTopK(merged, result);
        return result;
    }

}
#endif //TOPK_RECOMMEND_EXPANDTOPK_HPP
