#include <catch2/catch.hpp>
#include "iim/config.hpp"
#include "iim/errors.hpp"

using namespace iim;

TEST_CASE("parse_config reads every field", "[config]") {
  const auto cfg = parse_config(R"({
    "table_file": "data/case4.csv",
    "table": "IO",
    "mode": "Supply",
    "perturbations": [ {"sector": "Electric", "cvalue": 0.1} ],
    "scenarios": [
      {"name": "a", "psector": ["Water"], "cvalue": [0.2]},
      {"name": "b", "perturbations": [ {"sector": "Telecom", "cvalue": 0.05} ]}
    ],
    "nth_order": 2,
    "threads": 4,
    "rcond_tol": 1e-10,
    "output_csv": "out/report.csv",
    "nth_order_csv": "out/dep.csv",
    "batch_csv": "out/batch.csv"
  })");

  REQUIRE(cfg.table_file == "data/case4.csv");
  REQUIRE(cfg.table == TableForm::IO);
  REQUIRE(cfg.mode == Mode::Supply);
  REQUIRE(cfg.psector == std::vector<std::string>{"Electric"});
  REQUIRE(cfg.cvalue == Vec{0.1});
  REQUIRE(cfg.scenarios.size() == 2);
  REQUIRE(cfg.scenarios[0].psector == std::vector<std::string>{"Water"});
  REQUIRE(cfg.scenarios[1].cvalue == Vec{0.05});
  REQUIRE(cfg.nth_order == 2);
  REQUIRE(cfg.threads == 4);
  REQUIRE(cfg.rcond_tol == Approx(1e-10));
  REQUIRE(cfg.batch_csv == "out/batch.csv");
  REQUIRE_NOTHROW(validate_config(cfg));
}

TEST_CASE("parse_config defaults", "[config]") {
  const auto cfg = parse_config(R"({"table_file": "t.csv"})");
  REQUIRE(cfg.table == TableForm::IO);
  REQUIRE(cfg.mode == Mode::Demand);
  REQUIRE(cfg.psector.empty());
  REQUIRE(cfg.threads == 1);
  REQUIRE(cfg.nth_order == 0);
  REQUIRE(cfg.rcond_tol == RCOND_TOL);
  REQUIRE_NOTHROW(validate_config(cfg));
}

TEST_CASE("parse_config rejects bad input", "[config]") {
  REQUIRE_THROWS_AS(parse_config("{ not json"), ConfigError);
  REQUIRE_THROWS_AS(parse_config("[1, 2]"), ConfigError);
  REQUIRE_THROWS_AS(parse_config(R"({"table": "XY"})"), ConfigError);
  REQUIRE_THROWS_AS(parse_config(R"({"mode": "Both"})"), ConfigError);
  REQUIRE_THROWS_AS(parse_config(R"({"threads": "many"})"), ConfigError);
  REQUIRE_THROWS_AS(parse_config(R"({"perturbations": [ {"sector": "A"} ]})"), ConfigError);
}

TEST_CASE("validate_config", "[config]") {
  RunConfig cfg;
  REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);

  cfg.table_file = "t.csv";
  REQUIRE_NOTHROW(validate_config(cfg));

  cfg.threads = 0;
  REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
  cfg.threads = 1;

  cfg.nth_order_csv = "dep.csv";
  REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
  cfg.nth_order = 1;
  REQUIRE_NOTHROW(validate_config(cfg));

  cfg.scenarios = {Scenario{"x", {}, {}}, Scenario{"x", {}, {}}};
  REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);

  cfg.scenarios = {};
  cfg.batch_csv = "batch.csv";
  REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
}

TEST_CASE("load_config reports missing files", "[config]") {
  REQUIRE_THROWS_AS(load_config("no/such/config.json"), IoError);
}

TEST_CASE("validate_config checks every perturbation", "[config]") {
  auto cfg = parse_config(R"({"table_file": "t", "scenarios": [{"name": "s", "psector": ["X"], "cvalue": [1.5]}]})");
  REQUIRE_THROWS_AS(validate_config(cfg), InvalidPerturbationError);

  cfg = parse_config(R"({"table_file": "t", "scenarios": [{"name": "s", "psector": ["X", "Y"], "cvalue": [0.5]}]})");
  REQUIRE_THROWS_AS(validate_config(cfg), InvalidPerturbationError);

  cfg = parse_config(R"({"table_file": "t", "psector": ["X"], "cvalue": [-0.1]})");
  REQUIRE_THROWS_AS(validate_config(cfg), InvalidPerturbationError);

  cfg = parse_config(R"({"table_file": "t", "psector": ["X"], "cvalue": [0.1],
                         "scenarios": [{"name": "s", "psector": ["Y"], "cvalue": [1.0]}]})");
  REQUIRE_NOTHROW(validate_config(cfg));
}

TEST_CASE("validate_config caps the thread count", "[config]") {
  auto cfg = parse_config(R"({"table_file": "t", "threads": 100000})");
  REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
  cfg.threads = MAX_THREADS;
  REQUIRE_NOTHROW(validate_config(cfg));
}
