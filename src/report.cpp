#include "iim/report.hpp"
#include <iomanip>
#include <numeric>

namespace iim {

static const std::string RULE(90, '=');
static const std::string THIN(90, '-');

void print_header(std::ostream& os, Mode mode) {
  os << RULE << "\n"
     << to_string(mode) << "-Driven Inoperability Input-Output Model for Interdependent Infrastructure Sectors\n"
     << RULE << "\n";
}

void print_perturbed_sectors(std::ostream& os, const std::vector<std::string>& psector, const Vec& cvalue) {
  const auto flags = os.flags();
  os << std::fixed << std::setprecision(2);
  for (std::size_t k = 0; k < psector.size() && k < cvalue.size(); ++k)
    os << "Perturbed sector: " << psector[k] << " (" << cvalue[k] << ")\n";
  os.flags(flags);
}

void print_results(std::ostream& os, const Model& model) {
  const auto q = model.inoperability();
  const auto d = model.dependency();
  const auto od = model.overall_dependency();
  const auto r = model.influence();
  const auto orr = model.overall_influence();

  const auto flags = os.flags();
  os << "\nSector\t\tInoperability\tDependency\tD(overall)\tInfluence\tI(overall)\n" << THIN << "\n";
  os << std::fixed << std::setprecision(6);
  for (int i = 0; i < model.size(); ++i) {
    const auto k = (std::size_t)i;
    os << std::left << std::setw(8) << model.sectors()[k] << std::right << "\t"
       << std::setw(8) << q[k] << "\t" << std::setw(8) << d[k] << "\t" << std::setw(8) << od[k] << "\t"
       << std::setw(8) << r[k] << "\t" << std::setw(8) << orr[k] << "\n";
  }
  os << std::setprecision(3) << "q_tot = " << std::accumulate(q.begin(), q.end(), 0.0) << "\n";
  if (!model.indices_defined())
    os << "note: dependency and influence indices are only defined for the demand-driven model; reported as 0\n";
  os.flags(flags);
}

void print_nth_order(std::ostream& os, const std::vector<MaxDependency>& rows, int order) {
  const auto flags = os.flags();
  os << "\nMaximum " << order << "-order interdependency\n" << THIN << "\n";
  os << std::fixed << std::setprecision(6);
  for (const auto& row : rows)
    os << std::left << std::setw(8) << row.from << "\t" << std::setw(8) << row.to << std::right << "\t" << row.value << "\n";
  os.flags(flags);
}

void print_scenarios(std::ostream& os, const Model& model, const std::vector<ScenarioResult>& results) {
  const auto flags = os.flags();
  os << "\nScenario inoperability\n" << THIN << "\n";
  os << std::fixed << std::setprecision(3);
  for (const auto& res : results) {
    os << res.name << ":";
    for (std::size_t k = 0; k < res.q.size(); ++k) os << " q(" << model.sectors()[k] << ")=" << res.q[k];
    os << " q_tot=" << std::accumulate(res.q.begin(), res.q.end(), 0.0) << "\n";
  }
  os.flags(flags);
}

}
