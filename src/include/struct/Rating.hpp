#ifndef TOPK_RECOMMEND_RATING_HPP
#define TOPK_RECOMMEND_RATING_HPP

#include <cstdio>
#include <string>

namespace TopkRecommend {
    class Rating {
    public:
        int srcID_, dstID_;
        double score_;

        Rating(const int &srcID, const int &dstID, const double &score) {
            this->srcID_ = srcID;
            this->dstID_ = dstID;
            this->score_ = score;
        }

        Rating() {
            srcID_ = -1;
            dstID_ = -1;
            score_ = 0;
        }

        std::string ToString() const {
            char arr[256];
            sprintf(arr, "srcID %d, dstID %d, score %.3f", srcID_, dstID_, score_);
            std::string str(arr);
            return str;
        }

        inline bool operator==(const Rating &other) const {
            return srcID_ == other.srcID_ && dstID_ == other.dstID_ && score_ == other.score_;
        }

        inline bool operator!=(const Rating &other) const {
            return !(*this == other);
        }
    };
}

#endif //TOPK_RECOMMEND_RATING_HPP
