#pragma once 
#include <cstdint>
#include <vector>
#include "iim/scenario.hpp"

namespace iim {
    std::uint64_t hash_results_fingerprint(const std::vector<ScenarioResult>& results);
    std::uint64_t hash_vector_fingerprint(const Vec& v);
}
