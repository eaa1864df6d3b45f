#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "iim/model.hpp"
#include "iim/scenario.hpp"

namespace iim {

void print_header(std::ostream& os, Mode mode);
void print_perturbed_sectors(std::ostream& os, const std::vector<std::string>& psector, const Vec& cvalue);
void print_results(std::ostream& os, const Model& model);
void print_nth_order(std::ostream& os, const std::vector<MaxDependency>& rows, int order);
void print_scenarios(std::ostream& os, const Model& model, const std::vector<ScenarioResult>& results);

}
