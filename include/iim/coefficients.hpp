#pragma once
#include "iim/types.hpp"

namespace iim {

// A[i][j] = T[i][j] / x[j], zero where x[j] == 0.
Mat tech_coeff_matrix(const Mat& flows, const Vec& xoutput);

// Demand + IO: A*[i][j] = T[i][j] / x[i]; Supply + IO: A* = transpose(A).
// Form A passes the table through unchanged for either mode.
Mat interdependency_matrix(TableForm form, Mode mode, const Mat& table, const Vec& xoutput, const Mat& amat);

}
