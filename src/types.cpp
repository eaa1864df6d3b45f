#include "iim/types.hpp"
#include "iim/errors.hpp"

namespace iim {

TableForm parse_table_form(const std::string& s) {
  if (s == "IO") return TableForm::IO;
  if (s == "A") return TableForm::A;
  throw ConfigError("table must be one of {IO, A}, got '" + s + "'");
}

Mode parse_mode(const std::string& s) {
  if (s == "Demand") return Mode::Demand;
  if (s == "Supply") return Mode::Supply;
  throw ConfigError("mode must be one of {Demand, Supply}, got '" + s + "'");
}

std::string to_string(TableForm form) {
  return form == TableForm::IO ? "IO" : "A";
}

std::string to_string(Mode mode) {
  return mode == Mode::Demand ? "Demand" : "Supply";
}

}
