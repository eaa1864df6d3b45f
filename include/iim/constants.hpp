#pragma once

namespace iim {

constexpr double INOPERABILITY_MAX = 1.0;
constexpr double NEG_TOL = 1e-12;
constexpr double RCOND_TOL = 1e-12;
constexpr int MAX_THREADS = 256;

}
