#include "iim/resolvent.hpp"
#include "iim/errors.hpp"
#include "iim/linalg.hpp"
#include "iim/util.hpp"
#include <Eigen/Dense>
#include <sstream>

namespace iim {

Mat resolvent_matrix(const Mat& astar, const ResolventOptions& opt) {
  const int n = (int)astar.size();
  check_square(astar, n, "resolvent_matrix");
  if (n == 0) throw InputShapeError("resolvent_matrix: empty interdependency matrix");

  Eigen::MatrixXd M = Eigen::MatrixXd::Identity(n, n);
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j) M(i, j) -= astar[(std::size_t)i][(std::size_t)j];

  Eigen::FullPivLU<Eigen::MatrixXd> lu(M);
  if (!lu.isInvertible())
    throw SingularOperatorError("I - A* has rank " + std::to_string(lu.rank()) + " < " + std::to_string(n));

  const f64 rc = lu.rcond();
  if (!(rc >= opt.rcond_tol)) {
    std::ostringstream ss;
    ss << "rcond(I - A*) = " << rc << " below tolerance " << opt.rcond_tol;
    throw SingularOperatorError(ss.str());
  }

  const Eigen::MatrixXd Sinv = lu.inverse();

  Mat S((std::size_t)n, Vec((std::size_t)n, 0.0));
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j) S[(std::size_t)i][(std::size_t)j] = Sinv(i, j);

  if (!all_finite(S)) throw SingularOperatorError("resolvent has NaN/Inf");
  return S;
}

}
