#include "iim/config.hpp"
#include "iim/errors.hpp"
#include "iim/perturbation.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace iim {

static nlohmann::json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw IoError("cannot open config: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  try {
    return nlohmann::json::parse(ss.str());
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

static std::string read_string(const nlohmann::json& j, const char* key, const std::string& fallback) {
  if (!j.contains(key)) return fallback;
  if (!j.at(key).is_string()) throw ConfigError(std::string("not a string: ") + key);
  return j.at(key).get<std::string>();
}

// Either [{"sector": "X", "cvalue": 0.1}, ...] or the parallel arrays
// "psector" / "cvalue".
static void read_perturbations(const nlohmann::json& j, std::vector<std::string>& psector, Vec& cvalue) {
  if (j.contains("perturbations")) {
    const auto& arr = j.at("perturbations");
    if (!arr.is_array()) throw ConfigError("missing/invalid array: perturbations");
    for (const auto& p : arr) {
      if (!p.is_object() || !p.contains("sector") || !p.contains("cvalue"))
        throw ConfigError("perturbation entries need 'sector' and 'cvalue'");
      psector.push_back(p.at("sector").get<std::string>());
      cvalue.push_back(p.at("cvalue").get<f64>());
    }
  }
  if (j.contains("psector")) {
    if (!j.at("psector").is_array()) throw ConfigError("missing/invalid array: psector");
    for (const auto& s : j.at("psector")) psector.push_back(s.get<std::string>());
  }
  if (j.contains("cvalue")) {
    if (!j.at("cvalue").is_array()) throw ConfigError("missing/invalid array: cvalue");
    for (const auto& c : j.at("cvalue")) cvalue.push_back(c.get<f64>());
  }
}

static RunConfig from_json(const nlohmann::json& j) {
  RunConfig cfg{};
  cfg.table_file = read_string(j, "table_file", "");
  cfg.table = parse_table_form(read_string(j, "table", "IO"));
  cfg.mode = parse_mode(read_string(j, "mode", "Demand"));

  read_perturbations(j, cfg.psector, cfg.cvalue);

  if (j.contains("scenarios")) {
    if (!j.at("scenarios").is_array()) throw ConfigError("missing/invalid array: scenarios");
    for (const auto& s : j.at("scenarios")) {
      Scenario sc;
      sc.name = read_string(s, "name", "");
      read_perturbations(s, sc.psector, sc.cvalue);
      cfg.scenarios.push_back(std::move(sc));
    }
  }

  cfg.nth_order = j.value("nth_order", 0);
  cfg.threads = j.value("threads", 1);
  cfg.rcond_tol = j.value("rcond_tol", RCOND_TOL);

  cfg.output_csv = read_string(j, "output_csv", "");
  cfg.nth_order_csv = read_string(j, "nth_order_csv", "");
  cfg.batch_csv = read_string(j, "batch_csv", "");
  return cfg;
}

RunConfig parse_config(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(e.what());
  }
  if (!j.is_object()) throw ConfigError("top level must be an object");
  try {
    return from_json(j);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(e.what());
  }
}

RunConfig load_config(const std::string& path) {
  auto j = read_json_file(path);
  if (!j.is_object()) throw ConfigError(path + ": top level must be an object");
  try {
    return from_json(j);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

static void validate_perturbations(const std::vector<std::string>& psector, const Vec& cvalue, const std::string& where) {
  if (psector.size() != cvalue.size())
    throw InvalidPerturbationError(where + ": psector and cvalue have different sizes (" + std::to_string(psector.size()) +
                                   " vs " + std::to_string(cvalue.size()) + ")");
  for (std::size_t k = 0; k < cvalue.size(); ++k) check_fraction(cvalue[k], psector[k]);
}

void validate_config(const RunConfig& cfg) {
  if (cfg.table_file.empty()) throw ConfigError("table_file must be set");
  if (cfg.threads <= 0) throw ConfigError("threads must be > 0");
  if (cfg.threads > MAX_THREADS) throw ConfigError("threads must be <= " + std::to_string(MAX_THREADS));
  if (cfg.nth_order < 0) throw ConfigError("nth_order must be >= 1 (or 0 to skip)");
  if (!cfg.nth_order_csv.empty() && cfg.nth_order < 1) throw ConfigError("nth_order_csv needs nth_order >= 1");
  if (!(cfg.rcond_tol >= 0.0)) throw ConfigError("rcond_tol must be >= 0");

  validate_perturbations(cfg.psector, cfg.cvalue, "perturbations");

  std::unordered_set<std::string> names;
  for (const auto& s : cfg.scenarios) {
    if (s.name.empty()) throw ConfigError("scenario without name");
    if (!names.insert(s.name).second) throw ConfigError("duplicate scenario name: " + s.name);
    validate_perturbations(s.psector, s.cvalue, "scenario " + s.name);
  }
  if (!cfg.batch_csv.empty() && cfg.scenarios.empty()) throw ConfigError("batch_csv needs at least one scenario");
}

}
