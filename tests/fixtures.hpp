#pragma once
#include <string>
#include "iim/table.hpp"

namespace iim_test {

// Haimes & Jiang (2001) two-sector example.
inline iim::IoTable two_sector_astar() {
  return iim::IoTable{{"Sector1", "Sector2"}, {{0.0, 0.8}, {0.2, 0.0}}};
}

inline iim::IoTable three_sector_astar() {
  return iim::IoTable{{"SectorA", "SectorB", "SectorC"},
                      {{0.0, 0.2, 0.1}, {0.3, 0.0, 0.2}, {0.1, 0.1, 0.0}}};
}

// Xu et al. (2011) technical coefficients scaled by outputs that are powers of
// two, so A is recovered exactly.
inline iim::IoTable four_sector_io() {
  return iim::IoTable{{"Electric", "Water", "Telecom", "Transport"},
                      {{17.92, 43.52, 16.64, 71.68},
                       {14.08, 51.2, 20.48, 143.36},
                       {25.6, 25.6, 16.64, 71.68},
                       {17.92, 43.52, 6.4, 143.36},
                       {128.0, 256.0, 64.0, 512.0}}};
}

inline const double four_sector_tech_coeff[4][4] = {{0.14, 0.17, 0.26, 0.14},
                                                    {0.11, 0.20, 0.32, 0.28},
                                                    {0.20, 0.10, 0.26, 0.14},
                                                    {0.14, 0.17, 0.10, 0.28}};

inline std::string data_path(const std::string& name) {
  return std::string(IIM_TEST_DATA_DIR) + "/" + name;
}

}
