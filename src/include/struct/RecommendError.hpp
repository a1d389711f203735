#ifndef TOPK_RECOMMEND_RECOMMENDERROR_HPP
#define TOPK_RECOMMEND_RECOMMENDERROR_HPP

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace TopkRecommend {

    class RecommendError : public std::runtime_error {
    public:
        explicit RecommendError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // vector length differs from the rank, or two blocks of different rank are scored together
    class DimensionMismatch : public RecommendError {
    public:
        explicit DimensionMismatch(const std::string &msg) : RecommendError(msg) {}
    };

    class InvalidArgument : public RecommendError {
    public:
        explicit InvalidArgument(const std::string &msg) : RecommendError(msg) {}
    };

    class NotFound : public RecommendError {
    public:
        explicit NotFound(const std::string &msg) : RecommendError(msg) {}
    };

    class IOError : public RecommendError {
    public:
        explicit IOError(const std::string &msg) : RecommendError(msg) {}
    };

    template<typename Error>
    [[noreturn]] void ThrowError(const std::string &msg) {
        spdlog::error("{}", msg);
        throw Error(msg);
    }

}
#endif //TOPK_RECOMMEND_RECOMMENDERROR_HPP
