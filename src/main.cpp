#include <iostream>
#include <chrono>
#include <filesystem>
#include "iim/config.hpp"
#include "iim/csv.hpp"
#include "iim/engine.hpp"
#include "iim/errors.hpp"
#include "iim/fingerprint.hpp"
#include "iim/invariants.hpp"
#include "iim/model.hpp"
#include "iim/report.hpp"
#include "iim/table.hpp"
#include "iim/util.hpp"

static int run_main(const std::string& config_path) {
  auto cfg = iim::load_config(config_path);
  iim::validate_config(cfg);

  const auto table = iim::read_table_csv(cfg.table_file);
  iim::ResolventOptions opt;
  opt.rcond_tol = cfg.rcond_tol;
  const iim::Model model(table, cfg.psector, cfg.cvalue, cfg.table, cfg.mode, opt);
  iim::check_scenarios(model, cfg.scenarios);

  iim::print_header(std::cout, cfg.mode);

  iim::print_perturbed_sectors(std::cout, cfg.psector, cfg.cvalue);
  iim::print_results(std::cout, model);
  for (const auto& w : iim::check_inoperability(model.inoperability(), model.sectors()))
    std::cerr << "warning: " << w << "\n";

  if (!cfg.output_csv.empty()) {
    iim::CsvWriter writer(cfg.output_csv);
    writer.write_report(model);
  }

  if (cfg.nth_order >= 1) {
    const auto rows = model.max_nth_order_interdependency(cfg.nth_order);
    iim::print_nth_order(std::cout, rows, cfg.nth_order);
    if (!cfg.nth_order_csv.empty()) {
      iim::CsvWriter writer(cfg.nth_order_csv);
      writer.write_nth_order(rows, cfg.nth_order);
    }
  }

  const auto t0 = std::chrono::steady_clock::now();
  const auto results = iim::run(model, cfg.scenarios, cfg.threads);
  const auto t1 = std::chrono::steady_clock::now();

  if (!results.empty()) {
    iim::print_scenarios(std::cout, model, results);
    for (const auto& r : results)
      for (const auto& w : r.warnings) std::cerr << "warning: " << r.name << ": " << w << "\n";
    if (!cfg.batch_csv.empty()) {
      iim::CsvWriter writer(cfg.batch_csv);
      writer.write_batch(model, results);
    }
  }

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
  std::cout << "run_ok sectors=" << model.size() << " scenarios=" << results.size() << " threads=" << cfg.threads
            << " ms=" << ms << " hash=" << iim::hash_results_fingerprint(results) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/base.json";
  try {
    return run_main(config_path);
  } catch (const iim::Error& e) {
    iim::die(e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    iim::die(e.what());
  }
}
