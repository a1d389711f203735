#ifndef TOPK_RECOMMEND_SCOREPAIR_HPP
#define TOPK_RECOMMEND_SCOREPAIR_HPP

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace TopkRecommend {
    class ScorePair {
    public:
        int ID_;
        double score_;

        ScorePair(int ID, double score) {
            this->ID_ = ID;
            this->score_ = score;
        }

        ScorePair() {
            ID_ = 0;
            score_ = 0;
        }

        ~ScorePair() = default;

        std::string ToString() const {
            char arr[256];
            sprintf(arr, "%d %.3f", ID_, score_);
            std::string str(arr);
            return str;
        }

        inline bool operator==(const ScorePair &other) const {
            if (this == &other)
                return true;
            return score_ == other.score_ && ID_ == other.ID_;
        };

        inline bool operator!=(const ScorePair &other) const {
            if (this == &other)
                return false;
            return score_ != other.score_ || ID_ != other.ID_;
        };

        // ranking order: a higher score ranks ahead, equal scores rank the lower ID ahead
        inline bool operator<(const ScorePair &other) const {
            if (score_ != other.score_) {
                return score_ < other.score_;
            }
            return ID_ > other.ID_;
        }

        inline bool operator>(const ScorePair &other) const {
            if (score_ != other.score_) {
                return score_ > other.score_;
            }
            return ID_ < other.ID_;
        }

        inline bool operator<=(const ScorePair &other) const {
            return !(*this > other);
        }

        inline bool operator>=(const ScorePair &other) const {
            return !(*this < other);
        }
    };

    // (destination ID, score) sorted by score descending
    using RecommendList = std::vector<ScorePair>;

    // one entry per source ID
    using RecommendResult = std::vector<std::pair<int, RecommendList>>;
}

#endif //TOPK_RECOMMEND_SCOREPAIR_HPP
