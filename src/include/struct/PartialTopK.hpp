#ifndef TOPK_RECOMMEND_PARTIALTOPK_HPP
#define TOPK_RECOMMEND_PARTIALTOPK_HPP

#include <Eigen/Dense>
#include <limits>
#include <vector>

namespace TopkRecommend {

    /*
     * Fixed width top-k of every row of one source block.
     * Each row is sorted by score descending, unfilled trailing slots hold kSentinelScore
     * and an undefined destination ID.
     * A default constructed object is the identity of the merge reduction.
     */
    class PartialTopK {
    public:
        using ScoreMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

        static constexpr double kSentinelScore = std::numeric_limits<double>::lowest();
        static constexpr int kSentinelID = -1;

    private:
        std::vector<int> src_ID_l_;
        // n_row * topk, row major
        std::vector<int> dst_ID_l_;
        ScoreMatrix score_m_;
        int topk_;

    public:
        PartialTopK() {
            this->topk_ = 0;
        }

        PartialTopK(std::vector<int> src_ID_l, std::vector<int> &&dst_ID_l, ScoreMatrix &&score_m,
                    const int &topk)
                : src_ID_l_(std::move(src_ID_l)), dst_ID_l_(std::move(dst_ID_l)), score_m_(std::move(score_m)) {
            this->topk_ = topk;
        }

        [[nodiscard]] bool IsEmpty() const {
            return src_ID_l_.empty();
        }

        [[nodiscard]] int n_row() const {
            return (int) src_ID_l_.size();
        }

        [[nodiscard]] int topk() const {
            return topk_;
        }

        [[nodiscard]] const std::vector<int> &src_ids() const {
            return src_ID_l_;
        }

        [[nodiscard]] int DstID(const int &row, const int &col) const {
            return dst_ID_l_[(size_t) row * topk_ + col];
        }

        [[nodiscard]] double Score(const int &row, const int &col) const {
            return score_m_(row, col);
        }

        [[nodiscard]] const ScoreMatrix &scores() const {
            return score_m_;
        }
    };
}

#endif //TOPK_RECOMMEND_PARTIALTOPK_HPP
