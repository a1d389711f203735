#ifndef TOPK_RECOMMEND_TESTDATA_HPP
#define TOPK_RECOMMEND_TESTDATA_HPP

#include "alg/SpaceInnerProduct.hpp"
#include "struct/FeatureVector.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/Rating.hpp"
#include "struct/ScorePair.hpp"

#include <algorithm>
#include <ostream>
#include <random>
#include <vector>

namespace TopkRecommend {

    // readable gtest failure messages
    inline void PrintTo(const ScorePair &pair, std::ostream *os) {
        *os << "(" << pair.ToString() << ")";
    }

    inline void PrintTo(const Rating &rating, std::ostream *os) {
        *os << "(" << rating.ToString() << ")";
    }

    inline PartitionedFeatures MakeFeatures(const int &rank, std::vector<FeatureVector> vector_l,
                                            const int &n_partition = 1) {
        return PartitionedFeatures::Partition(rank, std::move(vector_l), n_partition);
    }

    // IDs start_ID, start_ID + 1, ..., components uniform in [-1, 1]
    inline PartitionedFeatures RandomFeatures(const int &rank, const int &n_vector, const int &start_ID,
                                              const int &n_partition, const unsigned &seed) {
        std::mt19937 gen(seed);
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        std::vector<FeatureVector> vector_l;
        vector_l.reserve(n_vector);
        for (int i = 0; i < n_vector; i++) {
            std::vector<double> vecs(rank);
            for (int dim = 0; dim < rank; dim++) {
                vecs[dim] = dist(gen);
            }
            vector_l.emplace_back(start_ID + i, std::move(vecs));
        }
        return PartitionedFeatures::Partition(rank, std::move(vector_l), n_partition);
    }

    inline std::vector<FeatureVector> Flatten(const PartitionedFeatures &features) {
        std::vector<FeatureVector> vector_l;
        for (int partID = 0; partID < features.NumPartition(); partID++) {
            const std::vector<FeatureVector> &partition = features.GetPartition(partID);
            vector_l.insert(vector_l.end(), partition.begin(), partition.end());
        }
        return vector_l;
    }

    // full sort of every destination score, higher score then lower ID first
    inline RecommendList BruteForceTopk(const FeatureVector &src, const PartitionedFeatures &dst_features,
                                        const int &topk) {
        RecommendList all_l;
        for (const FeatureVector &dst: Flatten(dst_features)) {
            all_l.emplace_back(dst.ID_, InnerProduct(src.data(), dst.data(), src.dim()));
        }
        std::sort(all_l.begin(), all_l.end(), std::greater<>());
        if ((int) all_l.size() > topk) {
            all_l.resize(topk);
        }
        return all_l;
    }

}
#endif //TOPK_RECOMMEND_TESTDATA_HPP
