#include "iim/coefficients.hpp"
#include "iim/errors.hpp"
#include "iim/linalg.hpp"
#include "iim/util.hpp"

namespace iim {

Mat tech_coeff_matrix(const Mat& flows, const Vec& xoutput) {
  const int n = (int)xoutput.size();
  check_square(flows, n, "tech_coeff_matrix: flows");

  Mat A((std::size_t)n, Vec((std::size_t)n, 0.0));
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j)
      A[(std::size_t)i][(std::size_t)j] = ratio_or_zero(flows[(std::size_t)i][(std::size_t)j], xoutput[(std::size_t)j]);
  return A;
}

Mat interdependency_matrix(TableForm form, Mode mode, const Mat& table, const Vec& xoutput, const Mat& amat) {
  if (form == TableForm::A) {
    check_square(table, (int)table.size(), "interdependency_matrix");
    return table;
  }

  const int n = (int)xoutput.size();
  if (mode == Mode::Supply) {
    check_square(amat, n, "interdependency_matrix: A");
    return transpose(amat);
  }

  // Normalizing row-wise avoids inverting diag(x), which is singular when some x[i] == 0.
  check_square(table, n, "interdependency_matrix: flows");
  Mat astar((std::size_t)n, Vec((std::size_t)n, 0.0));
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j)
      astar[(std::size_t)i][(std::size_t)j] = ratio_or_zero(table[(std::size_t)i][(std::size_t)j], xoutput[(std::size_t)i]);
  return astar;
}

}
