#ifndef TOPK_RECOMMEND_FEATUREVECTOR_HPP
#define TOPK_RECOMMEND_FEATUREVECTOR_HPP

#include <utility>
#include <vector>

namespace TopkRecommend {
    class FeatureVector {
    public:
        int ID_;
        std::vector<double> features_;

        FeatureVector() {
            this->ID_ = -1;
        }

        FeatureVector(const int &ID, std::vector<double> features)
                : ID_(ID), features_(std::move(features)) {}

        ~FeatureVector() = default;

        [[nodiscard]] int dim() const {
            return (int) features_.size();
        }

        [[nodiscard]] const double *data() const {
            return features_.data();
        }
    };
}

#endif //TOPK_RECOMMEND_FEATUREVECTOR_HPP
