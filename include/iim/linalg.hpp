#pragma once
#include <string>
#include "iim/types.hpp"

namespace iim {

    Mat identity(int n);
    Mat transpose(const Mat& m);
    Mat matmul(const Mat& a, const Mat& b);
    Vec matvec(const Mat& m, const Vec& v);

    // order 0 yields the identity.
    Mat matrix_power(const Mat& m, int order);

    void check_square(const Mat& m, int n, const std::string& what);

}
