#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include "iim/csv.hpp"
#include "iim/engine.hpp"
#include "iim/invariants.hpp"
#include "iim/report.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace iim;

static std::string slurp(const std::string& path) {
  std::ifstream in(path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / "iim_tests" / name).string();
}

TEST_CASE("check_inoperability flags negative and non-finite values", "[output]") {
  const std::vector<std::string> names{"A", "B", "C"};
  REQUIRE(check_inoperability(Vec{0.0, 0.5, 1.0}, names).empty());

  const auto w = check_inoperability(Vec{-0.2, 0.1, std::numeric_limits<double>::quiet_NaN()}, names);
  REQUIRE(w.size() == 2);
  REQUIRE(w[0].find("negative inoperability for sector A") != std::string::npos);
  REQUIRE(w[1].find("non-finite") != std::string::npos);
}

TEST_CASE("console report layout", "[output]") {
  const Model m(iim_test::two_sector_astar(), {"Sector2"}, {0.6}, TableForm::A, Mode::Demand);
  std::ostringstream os;
  print_header(os, m.mode());
  print_perturbed_sectors(os, m.perturbed_sectors(), m.perturbation_values());
  print_results(os, m);

  const auto s = os.str();
  REQUIRE(s.find(std::string(90, '=')) == 0);
  REQUIRE(s.find("Demand-Driven Inoperability Input-Output Model") != std::string::npos);
  REQUIRE(s.find("Perturbed sector: Sector2 (0.60)") != std::string::npos);
  REQUIRE(s.find("0.571429") != std::string::npos);
  REQUIRE(s.find("q_tot = 1.286") != std::string::npos);
  REQUIRE(s.find("note:") == std::string::npos);
}

TEST_CASE("supply report carries the index note", "[output]") {
  const Model m(iim_test::four_sector_io(), {"Electric"}, {0.1}, TableForm::IO, Mode::Supply);
  std::ostringstream os;
  print_results(os, m);
  REQUIRE(os.str().find("note: dependency and influence indices") != std::string::npos);
}

TEST_CASE("csv writers", "[output]") {
  const Model m(iim_test::four_sector_io(), {"Electric"}, {0.1}, TableForm::IO, Mode::Supply);

  SECTION("per-sector report") {
    const auto path = temp_path("report.csv");
    {
      CsvWriter w(path);
      w.write_report(m);
    }
    const auto s = slurp(path);
    REQUIRE(s.rfind("Sector,inoperability,dependency,dependency_overall,influence,influence_overall\n", 0) == 0);
    REQUIRE(s.find("Electric,0.1565528081,") != std::string::npos);
  }

  SECTION("nth-order file") {
    const auto path = temp_path("dep.csv");
    {
      CsvWriter w(path);
      w.write_nth_order(m.max_nth_order_interdependency(1), 1);
    }
    const auto s = slurp(path);
    REQUIRE(s.rfind("i,j,max(aj^1)\n", 0) == 0);
    REQUIRE(s.find("Electric,Telecom,0.2000000000") != std::string::npos);
  }

  SECTION("batch file") {
    const std::vector<Scenario> sc{Scenario{"e", {"Electric"}, {0.1}}, Scenario{"w", {"Water"}, {0.2}}};
    const auto path = temp_path("batch.csv");
    {
      CsvWriter w(path);
      w.write_batch(m, run(m, sc, 1));
    }
    std::istringstream in(slurp(path));
    std::string line;
    std::getline(in, line);
    REQUIRE(line == "Sector,delta,delta_overall,rho,rho_overall,e,w");
    std::getline(in, line);
    REQUIRE(line.rfind("Electric,0.0000000000,0.0000000000,0.0000000000,0.0000000000,0.1565528081,", 0) == 0);
  }
}
