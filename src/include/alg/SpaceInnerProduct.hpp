#pragma once

#include <algorithm>

namespace TopkRecommend {

    inline double InnerProduct(const double *pVect1, const double *pVect2, const int &dim) {
        double res = 0;
        for (int i = 0; i < dim; i++) {
            res += pVect1[i] * pVect2[i];
        }
        return res;
    }

}
