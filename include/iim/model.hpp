#pragma once
#include <string>
#include <vector>
#include "iim/perturbation.hpp"
#include "iim/resolvent.hpp"
#include "iim/table.hpp"
#include "iim/types.hpp"

namespace iim {

struct SectorReport {
  f64 inoperability;
  f64 dependency;
  f64 overall_dependency;
  f64 influence;
  f64 overall_influence;
};

struct MaxDependency {
  std::string from;
  std::string to;
  f64 value;
};

// Static demand- or supply-driven Inoperability Input-Output Model.
//
// All matrices are built once in the constructor (A, A*, S) and never change.
// set_perturbation() replaces c* only; the const query methods may be called
// concurrently from several threads.
//
// The dependency/influence family is only defined for demand-driven models.
// For supply-driven models those methods return a zero vector and
// indices_defined() is false. With a single sector there is no "other"
// sector to average over and the indices are zero as well.
class Model {
public:
  Model(const IoTable& table,
        const std::vector<std::string>& psector,
        const Vec& cvalue,
        TableForm form = TableForm::IO,
        Mode mode = Mode::Demand,
        const ResolventOptions& opt = ResolventOptions{});

  int size() const { return index_.size(); }
  TableForm form() const { return form_; }
  Mode mode() const { return mode_; }
  bool indices_defined() const { return mode_ == Mode::Demand; }

  const std::vector<std::string>& sectors() const { return index_.names(); }
  const SectorIndex& index() const { return index_; }

  // Empty unless the model was built from an IO table.
  const Mat& tech_coeff() const { return amat_; }
  const Vec& xoutput() const { return xoutput_; }

  const Mat& interdependency_matrix() const { return astar_; }
  const Mat& resolvent() const { return smat_; }
  const Vec& perturbation() const { return cstar_; }
  const std::vector<std::string>& perturbed_sectors() const { return psector_; }
  const Vec& perturbation_values() const { return cvalue_; }

  void set_perturbation(const std::vector<std::string>& psector, const Vec& cvalue);

  Vec inoperability() const;
  Vec inoperability_for(const Vec& cstar) const;
  Vec inoperability_for(const std::vector<std::string>& psector, const Vec& cvalue) const;
  f64 total_inoperability() const;

  Vec dependency() const;
  Vec influence() const;
  Vec overall_dependency() const;
  Vec overall_influence() const;

  SectorReport get(const std::string& sector) const;

  f64 interdependency_index(int i, int j, int order = 1) const;
  f64 interdependency_index(const std::string& isector, const std::string& jsector, int order = 1) const;
  std::vector<MaxDependency> max_nth_order_interdependency(int order) const;

private:
  Vec row_index(const Mat& m) const;
  Vec col_index(const Mat& m) const;

  TableForm form_;
  Mode mode_;
  SectorIndex index_;

  Vec xoutput_;
  Mat amat_;
  Mat astar_;
  Mat smat_;

  Vec cstar_;
  std::vector<std::string> psector_;
  Vec cvalue_;
};

}
