#pragma once
#include <string>
#include <vector>
#include "iim/types.hpp"

namespace iim {

struct IoTable {
  std::vector<std::string> sectors;
  Mat values;
};

struct IoSplit {
  Mat flows;
  Vec xoutput;
};

// Header row holds the sector names, every other non-blank row is numeric.
IoTable read_table_csv(const std::string& path);
IoTable parse_table_csv(const std::string& text);

void validate_table(const IoTable& table, TableForm form);

// IO form only: first N rows are flows, last row is total output.
IoSplit split_io_table(const IoTable& table);

}
