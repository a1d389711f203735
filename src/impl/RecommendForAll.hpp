#ifndef TOPK_RECOMMEND_RECOMMENDFORALL_HPP
#define TOPK_RECOMMEND_RECOMMENDFORALL_HPP

#include "alg/Blockify.hpp"
#include "alg/BlockPairAggregate.hpp"
#include "alg/ExpandTopK.hpp"
#include "alg/MergeTopK.hpp"
#include "alg/SpaceInnerProduct.hpp"
#include "alg/TopkMinHeap.hpp"
#include "util/ThreadNum.hpp"
#include "score_computation/BlockScore.hpp"

#include "struct/FeatureBlock.hpp"
#include "struct/PartialTopK.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/RecommendError.hpp"
#include "struct/RecommendObserver.hpp"
#include "struct/ScorePair.hpp"

#include <spdlog/fmt/fmt.h>
#include <omp.h>
#include <algorithm>
#include <string>
#include <vector>

namespace TopkRecommend {

    class RecommendOption {
    public:
        int block_size_;
        // 0 uses the OpenMP default
        int n_thread_;
        RecommendObserver *observer_;

        RecommendOption() {
            this->block_size_ = kDefaultBlockSize;
            this->n_thread_ = 0;
            this->observer_ = nullptr;
        }

        RecommendOption(const int &block_size, const int &n_thread, RecommendObserver *observer) {
            this->block_size_ = block_size;
            this->n_thread_ = n_thread;
            this->observer_ = observer;
        }
    };

    /*
     * For every source ID, the topk destination IDs with the largest inner product, sorted by
     * score descending. Source IDs come out in block order, a source with fewer than topk
     * destinations gets all of them, and an empty destination set gives every source an empty list.
     * Equal scores rank the lower destination ID ahead, so the result does not depend on the
     * partitioning, the block size or the thread schedule.
     */
    inline RecommendResult RecommendForAll(const int &rank,
                                           const PartitionedFeatures &src_features,
                                           const PartitionedFeatures &dst_features,
                                           const int &topk,
                                           const RecommendOption &option = RecommendOption()) {
        if (rank <= 0) {
            ThrowError<InvalidArgument>(fmt::format("rank should be positive, got {}", rank));
        }
        if (topk <= 0) {
            ThrowError<InvalidArgument>(fmt::format("topk should be positive, got {}", topk));
        }
        if (option.block_size_ <= 0) {
            ThrowError<InvalidArgument>(fmt::format("block size should be positive, got {}", option.block_size_));
        }

        const std::vector<FeatureBlock> src_block_l = Blockify(rank, src_features, option.block_size_, option.n_thread_);
        const std::vector<FeatureBlock> dst_block_l = Blockify(rank, dst_features, option.block_size_, option.n_thread_);
        if (option.observer_ != nullptr) {
            option.observer_->OnBlockify("source", (int) src_features.NumVector(), (int) src_block_l.size());
            option.observer_->OnBlockify("destination", (int) dst_features.NumVector(), (int) dst_block_l.size());
        }

        const int n_src_block = (int) src_block_l.size();
        const int n_dst_block = (int) dst_block_l.size();

        auto compute = [&src_block_l, &dst_block_l, &topk](const int &srcBlockID, const int &dstBlockID) {
            return ComputeBlockPairTopk(src_block_l[srcBlockID], dst_block_l[dstBlockID], topk);
        };
        auto merge = [&topk](PartialTopK &acc, PartialTopK &&partial) {
            acc = MergeTopK(std::move(acc), std::move(partial), topk);
        };
        const std::vector<PartialTopK> merged_l = BlockPairAggregate<PartialTopK>(
                n_src_block, n_dst_block, compute, merge, merge, option.n_thread_, option.observer_);

        RecommendResult result;
        result.reserve(src_features.NumVector());
        for (int srcBlockID = 0; srcBlockID < n_src_block; srcBlockID++) {
            const PartialTopK &merged = merged_l[srcBlockID];
            if (merged.IsEmpty()) {
                for (const int &srcID: src_block_l[srcBlockID].ids()) {
                    result.emplace_back(srcID, RecommendList());
                }
            } else {
                ExpandTopK(merged, result);
            }
        }
        return result;
    }

    /*
     * The num candidates with the largest inner product against query_vecs, sorted by score
     * descending. Fewer than num are returned when there are fewer candidates.
     */
    inline RecommendList RecommendOne(const std::vector<double> &query_vecs,
                                      const PartitionedFeatures &candidate_features,
                                      const int &num, const int &n_thread = 0) {
        if (num <= 0) {
            ThrowError<InvalidArgument>(fmt::format("number of recommendation should be positive, got {}", num));
        }
        const int rank = candidate_features.rank_;
        if ((int) query_vecs.size() != rank) {
            ThrowError<DimensionMismatch>(
                    fmt::format("query dimension {} does not match the rank {}", query_vecs.size(), rank));
        }
        candidate_features.Validate("candidate");

        const int n_partition = candidate_features.NumPartition();
        const int n_worker = ResolveNumThread(n_thread);
        std::vector<RecommendList> partition_topk_l(n_partition);
#pragma omp parallel for default(none) shared(n_partition, partition_topk_l, candidate_features, query_vecs, num, rank) schedule(dynamic) num_threads(n_worker)
        for (int partID = 0; partID < n_partition; partID++) {
            TopkMinHeap heap(num);
            for (const FeatureVector &vecs: candidate_features.GetPartition(partID)) {
                heap.Update(ScorePair(vecs.ID_, InnerProduct(query_vecs.data(), vecs.data(), rank)));
            }
            RecommendList &topk_l = partition_topk_l[partID];
            topk_l.resize(heap.Size());
            int size = heap.Size();
            while (size > 0) {
                size--;
                topk_l[size] = heap.Poll();
            }
        }

        TopkMinHeap heap(num);
        for (const RecommendList &topk_l: partition_topk_l) {
            for (const ScorePair &pair: topk_l) {
                heap.Update(pair);
            }
        }
        RecommendList result_l(heap.Size());
        int size = heap.Size();
        while (size > 0) {
            size--;
            result_l[size] = heap.Poll();
        }
        return result_l;
    }

    // query_ID is looked up in query_features, NotFound if absent
    inline RecommendList RecommendOne(const int &query_ID, const PartitionedFeatures &query_features,
                                      const PartitionedFeatures &candidate_features,
                                      const int &num, const int &n_thread = 0) {
        if (num <= 0) {
            ThrowError<InvalidArgument>(fmt::format("number of recommendation should be positive, got {}", num));
        }
        const FeatureVector &query_vecs = query_features.Lookup(query_ID);
        return RecommendOne(query_vecs.features_, candidate_features, num, n_thread);
    }

}
#endif //TOPK_RECOMMEND_RECOMMENDFORALL_HPP
