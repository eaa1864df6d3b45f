#include "iim/engine.hpp"
#include "iim/errors.hpp"
#include "iim/invariants.hpp"
#include "iim/perturbation.hpp"
#include "iim/thread_pool.hpp"

namespace iim {

static ScenarioResult evaluate(const Model& model, const Scenario& sc) {
  ScenarioResult r;
  r.name = sc.name;
  r.q = model.inoperability_for(sc.psector, sc.cvalue);
  r.warnings = check_inoperability(r.q, model.sectors());
  return r;
}

void check_scenarios(const Model& model, const std::vector<Scenario>& scenarios) {
  for (const auto& sc : scenarios) {
    try {
      make_perturbation(model.index(), sc.psector, sc.cvalue);
    } catch (const UnknownSectorError& e) {
      throw UnknownSectorError(e.sector + " (scenario " + sc.name + ")");
    }
  }
}

std::vector<ScenarioResult> run_single_thread(const Model& model, const std::vector<Scenario>& scenarios) {
  std::vector<ScenarioResult> out;
  out.reserve(scenarios.size());
  for (const auto& sc : scenarios) out.push_back(evaluate(model, sc));
  return out;
}

std::vector<ScenarioResult> run_multi_thread(const Model& model, const std::vector<Scenario>& scenarios, int threads) {
  std::vector<ScenarioResult> out(scenarios.size());
  ThreadPool pool(threads);

  pool.parallel_for(0, (int)scenarios.size(), [&](int b, int e, int) {
    for (int i = b; i < e; ++i) out[(std::size_t)i] = evaluate(model, scenarios[(std::size_t)i]);
  });
  return out;
}

std::vector<ScenarioResult> run(const Model& model, const std::vector<Scenario>& scenarios, int threads) {
  if (threads <= 1 || scenarios.size() < 2) return run_single_thread(model, scenarios);
  return run_multi_thread(model, scenarios, threads);
}

}
