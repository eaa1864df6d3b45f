#pragma once
#include <vector>
#include "iim/model.hpp"
#include "iim/scenario.hpp"

namespace iim {

    // Builds every scenario's c* up front so that bad names or fractions fail
    // before anything is reported or written.
    void check_scenarios(const Model& model, const std::vector<Scenario>& scenarios);

    // Each scenario gets its own c* and q; the model is only read.
    std::vector<ScenarioResult> run_single_thread(const Model& model, const std::vector<Scenario>& scenarios);
    std::vector<ScenarioResult> run_multi_thread(const Model& model, const std::vector<Scenario>& scenarios, int threads);
    std::vector<ScenarioResult> run(const Model& model, const std::vector<Scenario>& scenarios, int threads);

}
