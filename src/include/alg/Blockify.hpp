#ifndef TOPK_RECOMMEND_BLOCKIFY_HPP
#define TOPK_RECOMMEND_BLOCKIFY_HPP

#include "struct/FeatureBlock.hpp"
#include "struct/FeatureVector.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/RecommendError.hpp"
#include "util/ThreadNum.hpp"

#include <Eigen/Dense>
#include <spdlog/fmt/fmt.h>
#include <omp.h>
#include <algorithm>
#include <vector>

namespace TopkRecommend {

    constexpr int kDefaultBlockSize = 2000;

    // consecutive runs of up to block_size vectors of one partition, in the partition order
    inline std::vector<FeatureBlock>
    BlockifyPartition(const int &rank, const std::vector<FeatureVector> &partition, const int &block_size) {
        const int n_vector = (int) partition.size();
        const int n_block = n_vector / block_size + (n_vector % block_size == 0 ? 0 : 1);

        std::vector<FeatureBlock> block_l;
        block_l.reserve(n_block);
        for (int blockID = 0; blockID < n_block; blockID++) {
            const int start_vecsID = blockID * block_size;
            const int n_block_vector = std::min(block_size, n_vector - start_vecsID);

            std::vector<int> ID_l(n_block_vector);
            Eigen::MatrixXd matrix(rank, n_block_vector);
            for (int i = 0; i < n_block_vector; i++) {
                const FeatureVector &vecs = partition[start_vecsID + i];
                ID_l[i] = vecs.ID_;
                matrix.col(i) = Eigen::Map<const Eigen::VectorXd>(vecs.data(), rank);
            }
            block_l.emplace_back(std::move(ID_l), std::move(matrix));
        }
        return block_l;
    }

    // partitions are blockified in parallel on n_thread workers, 0 uses the OpenMP default
    inline std::vector<FeatureBlock>
    Blockify(const int &rank, const PartitionedFeatures &features, const int &block_size = kDefaultBlockSize,
             const int &n_thread = 0) {
        if (block_size <= 0) {
            ThrowError<InvalidArgument>(fmt::format("block size should be positive, got {}", block_size));
        }
        if (rank != features.rank_) {
            ThrowError<DimensionMismatch>(
                    fmt::format("feature set has rank {}, does not match the rank {}", features.rank_, rank));
        }
        features.Validate("blockify");

        const int n_partition = features.NumPartition();
        const int n_worker = ResolveNumThread(n_thread);
        std::vector<std::vector<FeatureBlock>> partition_block_l(n_partition);
#pragma omp parallel for default(none) shared(n_partition, partition_block_l, features, rank, block_size) schedule(dynamic) num_threads(n_worker)
        for (int partID = 0; partID < n_partition; partID++) {
            partition_block_l[partID] = BlockifyPartition(rank, features.GetPartition(partID), block_size);
        }

        std::vector<FeatureBlock> block_l;
        for (std::vector<FeatureBlock> &partition_block: partition_block_l) {
            for (FeatureBlock &block: partition_block) {
                block_l.push_back(std::move(block));
            }
        }
        return block_l;
    }

}
#endif //TOPK_RECOMMEND_BLOCKIFY_HPP
