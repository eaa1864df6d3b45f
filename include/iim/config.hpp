#pragma once
#include <string>
#include <vector>
#include "iim/constants.hpp"
#include "iim/scenario.hpp"
#include "iim/types.hpp"

namespace iim {

    struct RunConfig {

        std::string table_file;
        TableForm table = TableForm::IO;
        Mode mode = Mode::Demand;

        std::vector<std::string> psector;
        Vec cvalue;

        std::vector<Scenario> scenarios;

        i32 nth_order = 0;
        i32 threads = 1;
        f64 rcond_tol = RCOND_TOL;

        std::string output_csv;
        std::string nth_order_csv;
        std::string batch_csv;
    };

    RunConfig load_config(const std::string& path);
    RunConfig parse_config(const std::string& text);
    void validate_config(const RunConfig& cfg);
}
