#ifndef TOPK_RECOMMEND_FACTORMODEL_HPP
#define TOPK_RECOMMEND_FACTORMODEL_HPP

#include "impl/RecommendForAll.hpp"

#include "alg/SpaceInnerProduct.hpp"
#include "struct/FeatureVector.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/Rating.hpp"
#include "struct/RecommendError.hpp"
#include "struct/RecommendObserver.hpp"
#include "struct/ScorePair.hpp"

#include <spdlog/fmt/fmt.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace TopkRecommend {

    // user and product feature vectors of a rank-dimensional matrix factorization
    class FactorModel {
        int rank_;
        PartitionedFeatures user_features_, product_features_;
        RecommendObserver *observer_;

        void ValidateFeatures(const std::string &name, const PartitionedFeatures &features) const {
            if (features.Empty()) {
                ThrowError<InvalidArgument>(fmt::format("{} feature set is empty", name));
            }
            if (features.rank_ != rank_) {
                ThrowError<DimensionMismatch>(
                        fmt::format("{} feature dimension {} does not match the rank {}", name, features.rank_, rank_));
            }
            features.Validate(name);
            if (observer_ != nullptr && features.NumPartition() == 1) {
                observer_->OnWarning(fmt::format(
                        "{} feature is held in a single partition, blockify runs on one thread", name));
            }
        }

        static std::unordered_map<int, const FeatureVector *> IndexByID(const PartitionedFeatures &features) {
            std::unordered_map<int, const FeatureVector *> index;
            index.reserve(features.NumVector());
            for (int partID = 0; partID < features.NumPartition(); partID++) {
                for (const FeatureVector &vecs: features.GetPartition(partID)) {
                    index.emplace(vecs.ID_, &vecs);
                }
            }
            return index;
        }

        static std::vector<std::pair<int, std::vector<Rating>>>
        ToRating(RecommendResult &&result, const bool &src_is_user) {
            std::vector<std::pair<int, std::vector<Rating>>> rating_l;
            rating_l.reserve(result.size());
            for (std::pair<int, RecommendList> &src_result: result) {
                const int srcID = src_result.first;
                std::vector<Rating> src_rating_l;
                src_rating_l.reserve(src_result.second.size());
                for (const ScorePair &pair: src_result.second) {
                    if (src_is_user) {
                        src_rating_l.emplace_back(srcID, pair.ID_, pair.score_);
                    } else {
                        src_rating_l.emplace_back(pair.ID_, srcID, pair.score_);
                    }
                }
                rating_l.emplace_back(srcID, std::move(src_rating_l));
            }
            return rating_l;
        }

    public:
        RecommendOption option_;

        FactorModel(const int &rank, PartitionedFeatures user_features, PartitionedFeatures product_features,
                    RecommendObserver *observer = nullptr)
                : user_features_(std::move(user_features)), product_features_(std::move(product_features)) {
            if (rank <= 0) {
                ThrowError<InvalidArgument>(fmt::format("rank should be positive, got {}", rank));
            }
            this->rank_ = rank;
            this->observer_ = observer;
            this->option_ = RecommendOption(kDefaultBlockSize, 0, observer);
            ValidateFeatures("User", user_features_);
            ValidateFeatures("Product", product_features_);
        }

        [[nodiscard]] int rank() const {
            return rank_;
        }

        [[nodiscard]] const PartitionedFeatures &user_features() const {
            return user_features_;
        }

        [[nodiscard]] const PartitionedFeatures &product_features() const {
            return product_features_;
        }

        double Predict(const int &user, const int &product) const {
            const FeatureVector &user_vecs = user_features_.Lookup(user);
            const FeatureVector &product_vecs = product_features_.Lookup(product);
            return InnerProduct(user_vecs.data(), product_vecs.data(), rank_);
        }

        // one rating per (user, product) pair whose both IDs are known, in the input order
        std::vector<Rating> Predict(const std::vector<std::pair<int, int>> &user_product_l) const {
            const std::unordered_map<int, const FeatureVector *> user_index = IndexByID(user_features_);
            const std::unordered_map<int, const FeatureVector *> product_index = IndexByID(product_features_);

            std::vector<Rating> rating_l;
            rating_l.reserve(user_product_l.size());
            for (const std::pair<int, int> &user_product: user_product_l) {
                auto user_iter = user_index.find(user_product.first);
                auto product_iter = product_index.find(user_product.second);
                if (user_iter == user_index.end() || product_iter == product_index.end()) {
                    continue;
                }
                const double score = InnerProduct(user_iter->second->data(), product_iter->second->data(), rank_);
                rating_l.emplace_back(user_product.first, user_product.second, score);
            }
            return rating_l;
        }

        std::vector<Rating> RecommendProducts(const int &user, const int &num) const {
            const RecommendList recommend_l = RecommendOne(user, user_features_, product_features_, num,
                                                           option_.n_thread_);
            std::vector<Rating> rating_l;
            rating_l.reserve(recommend_l.size());
            for (const ScorePair &pair: recommend_l) {
                rating_l.emplace_back(user, pair.ID_, pair.score_);
            }
            return rating_l;
        }

        std::vector<Rating> RecommendUsers(const int &product, const int &num) const {
            const RecommendList recommend_l = RecommendOne(product, product_features_, user_features_, num,
                                                           option_.n_thread_);
            std::vector<Rating> rating_l;
            rating_l.reserve(recommend_l.size());
            for (const ScorePair &pair: recommend_l) {
                rating_l.emplace_back(pair.ID_, product, pair.score_);
            }
            return rating_l;
        }

        std::vector<std::pair<int, std::vector<Rating>>> RecommendProductsForUsers(const int &num) const {
            return ToRating(RecommendForAll(rank_, user_features_, product_features_, num, option_), true);
        }

        std::vector<std::pair<int, std::vector<Rating>>> RecommendUsersForProducts(const int &num) const {
            return ToRating(RecommendForAll(rank_, product_features_, user_features_, num, option_), false);
        }
    };

}
#endif //TOPK_RECOMMEND_FACTORMODEL_HPP
