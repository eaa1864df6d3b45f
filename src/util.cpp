#include "iim/util.hpp"
#include <cmath>
#include <iostream>
#include <cstdlib>

namespace iim {

    double ratio_or_zero(double num, double den) {
    if (den == 0.0) return 0.0;
    return num / den;
    }

    double clamp_max(double x, double hi) {
    return (x > hi) ? hi : x;
    }

    bool is_finite(double x) {
    return std::isfinite(x);
    }

    bool all_finite(const Mat& m) {
    for (const auto& row : m)
      for (auto x : row)
        if (!std::isfinite(x)) return false;
    return true;
    }

    std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
    }

    void die(const std::string& msg) {
    std::cerr << "Error: " << msg << "\n";
    std::exit(1);
    }

}
