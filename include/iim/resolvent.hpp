#pragma once
#include "iim/constants.hpp"
#include "iim/types.hpp"

namespace iim {

struct ResolventOptions {
  f64 rcond_tol = RCOND_TOL;
};

// S = (I - A*)^-1. Throws SingularOperatorError instead of approximating.
Mat resolvent_matrix(const Mat& astar, const ResolventOptions& opt = ResolventOptions{});

}
