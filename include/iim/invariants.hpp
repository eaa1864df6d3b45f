#pragma once
#include <string>
#include <vector>
#include "iim/types.hpp"

namespace iim {

// Negative inoperability means A* is not economically sensible; it is
// reported, never clamped.
std::vector<std::string> check_inoperability(const Vec& q, const std::vector<std::string>& sectors);

}
