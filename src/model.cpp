#include "iim/model.hpp"
#include "iim/coefficients.hpp"
#include "iim/constants.hpp"
#include "iim/errors.hpp"
#include "iim/linalg.hpp"
#include "iim/util.hpp"
#include <numeric>

namespace iim {

Model::Model(const IoTable& table,
             const std::vector<std::string>& psector,
             const Vec& cvalue,
             TableForm form,
             Mode mode,
             const ResolventOptions& opt)
  : form_(form), mode_(mode) {
  validate_table(table, form_);
  index_ = SectorIndex(table.sectors);

  // Perturbation errors surface before any matrix work.
  cstar_ = make_perturbation(index_, psector, cvalue);
  psector_ = psector;
  cvalue_ = cvalue;

  if (form_ == TableForm::IO) {
    auto split = split_io_table(table);
    xoutput_ = std::move(split.xoutput);
    amat_ = tech_coeff_matrix(split.flows, xoutput_);
    astar_ = iim::interdependency_matrix(form_, mode_, split.flows, xoutput_, amat_);
  } else {
    astar_ = iim::interdependency_matrix(form_, mode_, table.values, xoutput_, amat_);
  }

  smat_ = resolvent_matrix(astar_, opt);
}

void Model::set_perturbation(const std::vector<std::string>& psector, const Vec& cvalue) {
  Vec c = make_perturbation(index_, psector, cvalue);
  cstar_.swap(c);
  psector_ = psector;
  cvalue_ = cvalue;
}

Vec Model::inoperability_for(const Vec& cstar) const {
  if ((int)cstar.size() != size())
    throw InputShapeError("perturbation has " + std::to_string(cstar.size()) + " entries, expected " + std::to_string(size()));
  for (int i = 0; i < size(); ++i) check_fraction(cstar[(std::size_t)i], index_.name(i));
  Vec q = matvec(smat_, cstar);
  for (auto& x : q) x = clamp_max(x, INOPERABILITY_MAX);
  return q;
}

Vec Model::inoperability_for(const std::vector<std::string>& psector, const Vec& cvalue) const {
  return inoperability_for(make_perturbation(index_, psector, cvalue));
}

Vec Model::inoperability() const {
  return inoperability_for(cstar_);
}

f64 Model::total_inoperability() const {
  const Vec q = inoperability();
  return std::accumulate(q.begin(), q.end(), 0.0);
}

Vec Model::row_index(const Mat& m) const {
  const int n = size();
  Vec out((std::size_t)n, 0.0);
  if (!indices_defined() || n < 2) return out;
  for (int i = 0; i < n; ++i) {
    f64 acc = 0.0;
    for (int j = 0; j < n; ++j)
      if (j != i) acc += m[(std::size_t)i][(std::size_t)j];
    out[(std::size_t)i] = acc / (n - 1.0);
  }
  return out;
}

Vec Model::col_index(const Mat& m) const {
  const int n = size();
  Vec out((std::size_t)n, 0.0);
  if (!indices_defined() || n < 2) return out;
  for (int j = 0; j < n; ++j) {
    f64 acc = 0.0;
    for (int i = 0; i < n; ++i)
      if (i != j) acc += m[(std::size_t)i][(std::size_t)j];
    out[(std::size_t)j] = acc / (n - 1.0);
  }
  return out;
}

Vec Model::dependency() const { return row_index(astar_); }
Vec Model::influence() const { return col_index(astar_); }
Vec Model::overall_dependency() const { return row_index(smat_); }
Vec Model::overall_influence() const { return col_index(smat_); }

SectorReport Model::get(const std::string& sector) const {
  const auto i = (std::size_t)index_.at(sector);
  SectorReport r{};
  r.inoperability = inoperability()[i];
  r.dependency = dependency()[i];
  r.overall_dependency = overall_dependency()[i];
  r.influence = influence()[i];
  r.overall_influence = overall_influence()[i];
  return r;
}

f64 Model::interdependency_index(int i, int j, int order) const {
  const int n = size();
  if (i < 0 || i >= n || j < 0 || j >= n)
    throw InputShapeError("sector index out of range: (" + std::to_string(i) + ", " + std::to_string(j) + ")");
  const Mat ak = matrix_power(astar_, order);
  return ak[(std::size_t)i][(std::size_t)j];
}

f64 Model::interdependency_index(const std::string& isector, const std::string& jsector, int order) const {
  return interdependency_index(index_.at(isector), index_.at(jsector), order);
}

std::vector<MaxDependency> Model::max_nth_order_interdependency(int order) const {
  const Mat ak = matrix_power(astar_, order);
  const int n = size();

  std::vector<MaxDependency> res;
  res.reserve((std::size_t)n);
  for (int i = 0; i < n; ++i) {
    const auto& row = ak[(std::size_t)i];
    int jmax = 0;
    for (int j = 1; j < n; ++j)
      if (row[(std::size_t)j] > row[(std::size_t)jmax]) jmax = j;
    res.push_back(MaxDependency{index_.name(i), index_.name(jmax), row[(std::size_t)jmax]});
  }
  return res;
}

}
