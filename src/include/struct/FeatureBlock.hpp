#ifndef TOPK_RECOMMEND_FEATUREBLOCK_HPP
#define TOPK_RECOMMEND_FEATUREBLOCK_HPP

#include <Eigen/Dense>
#include <vector>

namespace TopkRecommend {

    // up to block_size feature vectors stored as the columns of a rank x n matrix
    class FeatureBlock {
        std::vector<int> ID_l_;
        Eigen::MatrixXd matrix_;
    public:
        FeatureBlock() = default;

        FeatureBlock(std::vector<int> &&ID_l, Eigen::MatrixXd &&matrix)
                : ID_l_(std::move(ID_l)), matrix_(std::move(matrix)) {}

        [[nodiscard]] const std::vector<int> &ids() const {
            return ID_l_;
        }

        // column i holds the feature vector of ids()[i]
        [[nodiscard]] const Eigen::MatrixXd &matrix() const {
            return matrix_;
        }

        [[nodiscard]] int size() const {
            return (int) ID_l_.size();
        }

        [[nodiscard]] int rank() const {
            return (int) matrix_.rows();
        }
    };
}

#endif //TOPK_RECOMMEND_FEATUREBLOCK_HPP
