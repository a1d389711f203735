#ifndef TOPK_RECOMMEND_BLOCKPAIRAGGREGATE_HPP
#define TOPK_RECOMMEND_BLOCKPAIRAGGREGATE_HPP

#include "struct/RecommendObserver.hpp"
#include "util/ThreadNum.hpp"

#include <omp.h>
#include <algorithm>
#include <cstdint>
#include <exception>
#include <utility>
#include <vector>

namespace TopkRecommend {

    /*
     * Number of destination chunks per source block. A source block gets a single owner when
     * there are at least as many source blocks as workers, otherwise its destinations are split
     * so that every worker has a task.
     */
    inline int NumDstChunk(const int &n_src_block, const int &n_dst_block, const int &n_worker) {
        if (n_src_block <= 0 || n_dst_block <= 0 || n_src_block >= n_worker) {
            return 1;
        }
        return std::min(n_dst_block, (n_worker + n_src_block - 1) / n_src_block);
    }

    /*
     * Evaluates compute(srcBlockID, dstBlockID) for every block pair exactly once and reduces
     * the values by source block. A task owns one source block and a contiguous chunk of the
     * destination blocks, and folds the chunk into its own accumulator with seq_op. The
     * accumulators of the chunks of a source block are folded with comb_op.
     * At most max(n_src_block, n_worker) accumulators are live, whatever the number of workers.
     * A default constructed Accumulator is the identity of both operations.
     * The first exception thrown by a block pair or by the observer is rethrown once all workers stop.
     */
    template<typename Accumulator, typename ComputeFunc, typename SeqOp, typename CombOp>
    std::vector<Accumulator>
    BlockPairAggregate(const int &n_src_block, const int &n_dst_block,
                       ComputeFunc compute, SeqOp seq_op, CombOp comb_op,
                       const int &n_thread, RecommendObserver *observer) {
        const int n_worker = ResolveNumThread(n_thread);
        const int n_dst_chunk = NumDstChunk(n_src_block, n_dst_block, n_worker);
        const int64_t n_task = (int64_t) n_src_block * n_dst_chunk;
        const uint64_t n_pair = (uint64_t) n_src_block * (uint64_t) n_dst_block;

        std::vector<Accumulator> task_acc_l(n_task);
        std::exception_ptr error = nullptr;
        uint64_t n_finish = 0;

#pragma omp parallel for schedule(dynamic) num_threads(n_worker)
        for (int64_t taskID = 0; taskID < n_task; taskID++) {
            const int srcBlockID = (int) (taskID / n_dst_chunk);
            const int chunkID = (int) (taskID % n_dst_chunk);
            const int dst_begin = (int) ((int64_t) chunkID * n_dst_block / n_dst_chunk);
            const int dst_end = (int) ((int64_t) (chunkID + 1) * n_dst_block / n_dst_chunk);
            Accumulator &acc = task_acc_l[taskID];

            for (int dstBlockID = dst_begin; dstBlockID < dst_end; dstBlockID++) {
                bool stop;
#pragma omp critical(block_pair_error)
                stop = error != nullptr;
                if (stop) {
                    break;
                }

                std::exception_ptr pair_error = nullptr;
                try {
                    seq_op(acc, compute(srcBlockID, dstBlockID));
                } catch (...) {
                    pair_error = std::current_exception();
                }
                if (pair_error == nullptr && observer != nullptr) {
#pragma omp critical(block_pair_observer)
                    {
                        n_finish++;
                        try {
                            observer->OnBlockPairFinish(n_finish, n_pair);
                        } catch (...) {
                            pair_error = std::current_exception();
                        }
                    }
                }
                if (pair_error != nullptr) {
#pragma omp critical(block_pair_error)
                    {
                        if (error == nullptr) {
                            error = pair_error;
                        }
                    }
                    break;
                }
            }
        }
        if (error != nullptr) {
            std::rethrow_exception(error);
        }

        std::vector<Accumulator> result_l(n_src_block);
#pragma omp parallel for schedule(dynamic) num_threads(n_worker)
        for (int srcBlockID = 0; srcBlockID < n_src_block; srcBlockID++) {
            try {
                for (int chunkID = 0; chunkID < n_dst_chunk; chunkID++) {
                    comb_op(result_l[srcBlockID], std::move(task_acc_l[(int64_t) srcBlockID * n_dst_chunk + chunkID]));
                }
            } catch (...) {
#pragma omp critical(block_pair_error)
                {
                    if (error == nullptr) {
                        error = std::current_exception();
                    }
                }
            }
        }
        if (error != nullptr) {
            std::rethrow_exception(error);
        }
        return result_l;
    }

}
#endif //TOPK_RECOMMEND_BLOCKPAIRAGGREGATE_HPP
