#include "iim/csv.hpp"
#include "iim/errors.hpp"
#include <filesystem>
#include <iomanip>

namespace iim {

CsvWriter::CsvWriter(const std::string& path) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
  out.open(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) throw IoError("cannot open output csv: " + path);
  out.setf(std::ios::fixed);
  out << std::setprecision(10);
}

void CsvWriter::write_row(const std::string& label, const Vec& values) {
  out << label;
  for (auto v : values) out << "," << v;
  out << "\n";
}

void CsvWriter::write_report(const Model& model) {
  const auto q = model.inoperability();
  const auto d = model.dependency();
  const auto od = model.overall_dependency();
  const auto r = model.influence();
  const auto orr = model.overall_influence();

  out << "Sector,inoperability,dependency,dependency_overall,influence,influence_overall\n";
  for (int i = 0; i < model.size(); ++i) {
    const auto k = (std::size_t)i;
    write_row(model.sectors()[k], Vec{q[k], d[k], od[k], r[k], orr[k]});
  }
}

void CsvWriter::write_nth_order(const std::vector<MaxDependency>& rows, int order) {
  out << "i,j,max(aj^" << order << ")\n";
  for (const auto& row : rows) out << row.from << "," << row.to << "," << row.value << "\n";
}

void CsvWriter::write_batch(const Model& model, const std::vector<ScenarioResult>& results) {
  const auto d = model.dependency();
  const auto od = model.overall_dependency();
  const auto r = model.influence();
  const auto orr = model.overall_influence();

  out << "Sector,delta,delta_overall,rho,rho_overall";
  for (const auto& res : results) out << "," << res.name;
  out << "\n";

  for (int i = 0; i < model.size(); ++i) {
    const auto k = (std::size_t)i;
    Vec row{d[k], od[k], r[k], orr[k]};
    for (const auto& res : results) {
      if (res.q.size() != (std::size_t)model.size()) throw InputShapeError("scenario " + res.name + " has wrong length");
      row.push_back(res.q[k]);
    }
    write_row(model.sectors()[k], row);
  }
}

}
