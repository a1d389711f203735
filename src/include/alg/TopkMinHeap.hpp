#ifndef TOPK_RECOMMEND_TOPKMINHEAP_HPP
#define TOPK_RECOMMEND_TOPKMINHEAP_HPP

#include "struct/ScorePair.hpp"
#include "struct/RecommendError.hpp"

#include <spdlog/fmt/fmt.h>
#include <vector>
#include <cassert>
#include <algorithm>
#include <functional>

namespace TopkRecommend {

    /*
     * Keeps the topk best ScorePair seen so far, the front is the worst retained one.
     * Once full, a new pair evicts the front only if it ranks strictly ahead of it.
     */
    class TopkMinHeap {
        int topk_;
        std::vector<ScorePair> topk_heap_;
    public:
        TopkMinHeap() {
            this->topk_ = 0;
        }

        explicit TopkMinHeap(const int &topk) {
            if (topk <= 0) {
                ThrowError<InvalidArgument>(fmt::format("topk should be positive, got {}", topk));
            }
            this->topk_ = topk;
            this->topk_heap_.reserve(topk);
        }

        void Update(const ScorePair &pair) {
            if ((int) topk_heap_.size() < topk_) {
                topk_heap_.push_back(pair);
                std::push_heap(topk_heap_.begin(), topk_heap_.end(), std::greater<>());
            } else if (topk_ > 0 && pair > topk_heap_.front()) {
                std::pop_heap(topk_heap_.begin(), topk_heap_.end(), std::greater<>());
                topk_heap_.back() = pair;
                std::push_heap(topk_heap_.begin(), topk_heap_.end(), std::greater<>());
            }
            assert((int) topk_heap_.size() <= topk_);
        }

        [[nodiscard]] int Size() const {
            return (int) topk_heap_.size();
        }

        [[nodiscard]] int Capacity() const {
            return topk_;
        }

        [[nodiscard]] const ScorePair &Front() const {
            assert(!topk_heap_.empty());
            return topk_heap_.front();
        }

        // removes and returns the worst retained pair
        ScorePair Poll() {
            assert(!topk_heap_.empty());
            std::pop_heap(topk_heap_.begin(), topk_heap_.end(), std::greater<>());
            const ScorePair pair = topk_heap_.back();
            topk_heap_.pop_back();
            return pair;
        }

        void Reset() {
            topk_heap_.clear();
        }
    };
}
#endif //TOPK_RECOMMEND_TOPKMINHEAP_HPP
