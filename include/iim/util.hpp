#pragma once
#include <string>
#include "iim/constants.hpp"
#include "iim/types.hpp"

namespace iim {

    double ratio_or_zero(double num, double den);
    double clamp_max(double x, double hi);
    bool is_finite(double x);
    bool all_finite(const Mat& m);
    std::string trim(const std::string& s);

    [[noreturn]] void die(const std::string& msg);

}
