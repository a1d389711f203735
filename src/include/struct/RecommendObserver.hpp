#ifndef TOPK_RECOMMEND_RECOMMENDOBSERVER_HPP
#define TOPK_RECOMMEND_RECOMMENDOBSERVER_HPP

#include <spdlog/spdlog.h>
#include <cstdint>
#include <string>

namespace TopkRecommend {

    /*
     * Notification hooks of the recommendation core, the algorithms run the same without one.
     * OnBlockPairFinish is called from worker threads, one call at a time.
     */
    class RecommendObserver {
    public:
        virtual void OnWarning(const std::string &msg) = 0;

        virtual void OnBlockify(const std::string &name, const int &n_vector, const int &n_block) = 0;

        virtual void OnBlockPairFinish(const uint64_t &n_finish, const uint64_t &n_total) = 0;

        virtual ~RecommendObserver() = default;
    };

    class SpdlogObserver : public RecommendObserver {
        uint64_t report_every_;
    public:
        explicit SpdlogObserver(const uint64_t &report_every = 100) {
            this->report_every_ = report_every == 0 ? 1 : report_every;
        }

        void OnWarning(const std::string &msg) override {
            spdlog::warn("{}", msg);
        }

        void OnBlockify(const std::string &name, const int &n_vector, const int &n_block) override {
            spdlog::info("blockify {}: n_vector {}, n_block {}", name, n_vector, n_block);
        }

        void OnBlockPairFinish(const uint64_t &n_finish, const uint64_t &n_total) override {
            if (n_finish % report_every_ == 0 || n_finish == n_total) {
                spdlog::info("scored block pair {}/{}, {:.1f}%", n_finish, n_total,
                             n_total == 0 ? 100.0 : n_finish / (0.01 * n_total));
            }
        }
    };
}

#endif //TOPK_RECOMMEND_RECOMMENDOBSERVER_HPP
