#ifndef TOPK_RECOMMEND_THREADNUM_HPP
#define TOPK_RECOMMEND_THREADNUM_HPP

#include <omp.h>

namespace TopkRecommend {

    // 0 or a negative count uses the OpenMP default
    inline int ResolveNumThread(const int &n_thread) {
        return n_thread > 0 ? n_thread : omp_get_max_threads();
    }

}
#endif //TOPK_RECOMMEND_THREADNUM_HPP
