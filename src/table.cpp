#include "iim/table.hpp"
#include "iim/errors.hpp"
#include "iim/util.hpp"
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace iim {

static std::string unquote(const std::string& cell) {
  std::string c = trim(cell);
  if (c.size() >= 2 && c.front() == '"' && c.back() == '"') c = trim(c.substr(1, c.size() - 2));
  return c;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cells;
  std::string cell;
  std::istringstream ss(line);
  while (std::getline(ss, cell, ',')) cells.push_back(unquote(cell));
  if (!line.empty() && line.back() == ',') cells.emplace_back();
  return cells;
}

static f64 parse_cell(const std::string& cell, std::size_t row, std::size_t col) {
  std::size_t used = 0;
  f64 v = 0.0;
  try {
    v = std::stod(cell, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (cell.empty() || used != cell.size())
    throw IoError("non-numeric cell at row " + std::to_string(row) + " col " + std::to_string(col) + ": '" + cell + "'");
  return v;
}

IoTable parse_table_csv(const std::string& text) {
  std::istringstream in(text);
  std::string line;

  IoTable t;
  bool header = true;
  std::size_t row = 0;
  while (std::getline(in, line)) {
    ++row;
    if (trim(line).empty()) continue;
    auto cells = split_csv_line(line);
    if (header) {
      t.sectors = cells;
      header = false;
      continue;
    }
    if (cells.size() != t.sectors.size())
      throw InputShapeError("row " + std::to_string(row) + " has " + std::to_string(cells.size()) +
                            " cells, header has " + std::to_string(t.sectors.size()));
    Vec r;
    r.reserve(cells.size());
    for (std::size_t j = 0; j < cells.size(); ++j) r.push_back(parse_cell(cells[j], row, j));
    t.values.push_back(std::move(r));
  }
  if (header) throw IoError("table has no header row");
  return t;
}

IoTable read_table_csv(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw IoError("cannot open table: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_table_csv(ss.str());
}

void validate_table(const IoTable& table, TableForm form) {
  const std::size_t n = table.sectors.size();
  if (n == 0) throw InputShapeError("sector list is empty");

  std::unordered_set<std::string> seen;
  for (const auto& s : table.sectors) {
    if (s.empty()) throw InputShapeError("empty sector name");
    if (!seen.insert(s).second) throw InputShapeError("duplicate sector name: " + s);
  }

  const std::size_t want_rows = (form == TableForm::IO) ? n + 1 : n;
  if (table.values.size() != want_rows)
    throw InputShapeError(to_string(form) + " table needs " + std::to_string(want_rows) + " rows for " +
                          std::to_string(n) + " sectors, got " + std::to_string(table.values.size()));
  for (const auto& r : table.values)
    if (r.size() != n) throw InputShapeError("table row has " + std::to_string(r.size()) + " columns, expected " + std::to_string(n));

  if (!all_finite(table.values)) throw InputShapeError("table has NaN/Inf");
}

IoSplit split_io_table(const IoTable& table) {
  validate_table(table, TableForm::IO);
  const std::size_t n = table.sectors.size();

  IoSplit out;
  out.flows.assign(table.values.begin(), table.values.begin() + (std::ptrdiff_t)n);
  out.xoutput = table.values[n];
  for (std::size_t j = 0; j < n; ++j)
    if (out.xoutput[j] < 0.0) throw InputShapeError("negative total output for sector " + table.sectors[j]);
  return out;
}

}
