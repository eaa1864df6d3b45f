#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace iim {

using f64 = double;
using i32 = std::int32_t;
using u64 = std::uint64_t;

using Vec = std::vector<f64>;
using Mat = std::vector<Vec>;

// IO: industry*industry table, last row holds total output per sector.
// A: interdependency matrix supplied directly.
enum class TableForm { IO, A };

enum class Mode { Demand, Supply };

TableForm parse_table_form(const std::string& s);
Mode parse_mode(const std::string& s);

std::string to_string(TableForm form);
std::string to_string(Mode mode);

}
