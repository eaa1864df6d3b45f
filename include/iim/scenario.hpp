#pragma once
#include <string>
#include <vector>
#include "iim/types.hpp"

namespace iim {

struct Scenario {
  std::string name;
  std::vector<std::string> psector;
  Vec cvalue;
};

struct ScenarioResult {
  std::string name;
  Vec q;
  std::vector<std::string> warnings;
};

}
