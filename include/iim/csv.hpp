#pragma once
#include <fstream>
#include <string>
#include <vector>
#include "iim/model.hpp"
#include "iim/scenario.hpp"
#include "iim/types.hpp"

namespace iim {

struct CsvWriter {
  std::ofstream out;

  explicit CsvWriter(const std::string& path);

  void write_row(const std::string& label, const Vec& values);

  // Sector,inoperability,dependency,dependency_overall,influence,influence_overall
  void write_report(const Model& model);

  // i,j,max(aj^n)
  void write_nth_order(const std::vector<MaxDependency>& rows, int order);

  // Sector,delta,delta_overall,rho,rho_overall,<scenario names>
  void write_batch(const Model& model, const std::vector<ScenarioResult>& results);
};

}
