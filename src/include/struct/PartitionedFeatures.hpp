#ifndef TOPK_RECOMMEND_PARTITIONEDFEATURES_HPP
#define TOPK_RECOMMEND_PARTITIONEDFEATURES_HPP

#include "struct/FeatureVector.hpp"
#include "struct/RecommendError.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <string>
#include <vector>

namespace TopkRecommend {

    /*
     * (id, feature vector) entries of one side of the model, split into partitions.
     * A partition is the unit of blockification, a block never spans two partitions.
     * IDs are expected to be unique across all partitions, duplicates are not detected.
     */
    class PartitionedFeatures {
        std::vector<std::vector<FeatureVector>> partition_l_;
    public:
        int rank_;

        PartitionedFeatures() {
            this->rank_ = 0;
        }

        explicit PartitionedFeatures(const int &rank) {
            this->rank_ = rank;
        }

        PartitionedFeatures(const int &rank, std::vector<std::vector<FeatureVector>> partition_l)
                : partition_l_(std::move(partition_l)) {
            this->rank_ = rank;
        }

        // split vector_l into n_partition partitions of nearly equal size, keeping the order
        static PartitionedFeatures
        Partition(const int &rank, std::vector<FeatureVector> &&vector_l, const int &n_partition) {
            if (n_partition <= 0) {
                ThrowError<InvalidArgument>(fmt::format("n_partition should be positive, got {}", n_partition));
            }
            const size_t n_vector = vector_l.size();
            const size_t n_part = std::max<size_t>(1, std::min<size_t>(n_partition, n_vector));
            const size_t base_size = n_vector / n_part;
            const size_t remainder = n_vector % n_part;

            std::vector<std::vector<FeatureVector>> partition_l(n_part);
            size_t vecsID = 0;
            for (size_t partID = 0; partID < n_part; partID++) {
                const size_t part_size = base_size + (partID < remainder ? 1 : 0);
                partition_l[partID].reserve(part_size);
                for (size_t i = 0; i < part_size; i++) {
                    partition_l[partID].push_back(std::move(vector_l[vecsID]));
                    vecsID++;
                }
            }
            return {rank, std::move(partition_l)};
        }

        void AddPartition(std::vector<FeatureVector> partition) {
            partition_l_.push_back(std::move(partition));
        }

        [[nodiscard]] int NumPartition() const {
            return (int) partition_l_.size();
        }

        [[nodiscard]] size_t NumVector() const {
            size_t n_vector = 0;
            for (const std::vector<FeatureVector> &partition: partition_l_) {
                n_vector += partition.size();
            }
            return n_vector;
        }

        [[nodiscard]] bool Empty() const {
            return NumVector() == 0;
        }

        [[nodiscard]] const std::vector<FeatureVector> &GetPartition(const int &partitionID) const {
            return partition_l_[partitionID];
        }

        [[nodiscard]] const FeatureVector *Find(const int &ID) const {
            for (const std::vector<FeatureVector> &partition: partition_l_) {
                for (const FeatureVector &vecs: partition) {
                    if (vecs.ID_ == ID) {
                        return &vecs;
                    }
                }
            }
            return nullptr;
        }

        [[nodiscard]] const FeatureVector &Lookup(const int &ID) const {
            const FeatureVector *vecs = Find(ID);
            if (vecs == nullptr) {
                ThrowError<NotFound>(fmt::format("ID {} not found in the feature set", ID));
            }
            return *vecs;
        }

        // every vector must have exactly rank_ components
        void Validate(const std::string &name) const {
            for (const std::vector<FeatureVector> &partition: partition_l_) {
                for (const FeatureVector &vecs: partition) {
                    if (vecs.dim() != rank_) {
                        ThrowError<DimensionMismatch>(
                                fmt::format("{} feature of ID {} has dimension {}, does not match the rank {}",
                                            name, vecs.ID_, vecs.dim(), rank_));
                    }
                }
            }
        }
    };
}

#endif //TOPK_RECOMMEND_PARTITIONEDFEATURES_HPP
