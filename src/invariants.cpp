#include "iim/invariants.hpp"
#include "iim/constants.hpp"
#include "iim/util.hpp"

namespace iim {

std::vector<std::string> check_inoperability(const Vec& q, const std::vector<std::string>& sectors) {
  std::vector<std::string> warnings;
  for (std::size_t i = 0; i < q.size(); ++i) {
    const std::string& name = i < sectors.size() ? sectors[i] : std::to_string(i);
    if (!is_finite(q[i])) {
      warnings.push_back("non-finite inoperability for sector " + name);
      continue;
    }
    if (q[i] < -NEG_TOL)
      warnings.push_back("negative inoperability for sector " + name + " value=" + std::to_string(q[i]) +
                         " (interdependency matrix may be invalid)");
  }
  return warnings;
}

}
