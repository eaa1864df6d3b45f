#include "iim/linalg.hpp"
#include "iim/errors.hpp"

namespace iim {

Mat identity(int n) {
  Mat I((std::size_t)n, Vec((std::size_t)n, 0.0));
  for (int i = 0; i < n; ++i) I[(std::size_t)i][(std::size_t)i] = 1.0;
  return I;
}

Mat transpose(const Mat& m) {
  const int rows = (int)m.size();
  const int cols = rows > 0 ? (int)m[0].size() : 0;
  Mat t((std::size_t)cols, Vec((std::size_t)rows, 0.0));
  for (int i = 0; i < rows; ++i)
    for (int j = 0; j < cols; ++j) t[(std::size_t)j][(std::size_t)i] = m[(std::size_t)i][(std::size_t)j];
  return t;
}

Mat matmul(const Mat& a, const Mat& b) {
  const int n = (int)a.size();
  const int k = (int)b.size();
  const int m = k > 0 ? (int)b[0].size() : 0;
  for (const auto& row : a)
    if ((int)row.size() != k) throw InputShapeError("matmul: inner dimensions differ");

  Mat c((std::size_t)n, Vec((std::size_t)m, 0.0));
  for (int i = 0; i < n; ++i) {
    for (int p = 0; p < k; ++p) {
      const f64 aip = a[(std::size_t)i][(std::size_t)p];
      if (aip == 0.0) continue;
      for (int j = 0; j < m; ++j) c[(std::size_t)i][(std::size_t)j] += aip * b[(std::size_t)p][(std::size_t)j];
    }
  }
  return c;
}

Vec matvec(const Mat& m, const Vec& v) {
  const int n = (int)m.size();
  Vec out((std::size_t)n, 0.0);
  for (int i = 0; i < n; ++i) {
    if (m[(std::size_t)i].size() != v.size()) throw InputShapeError("matvec: row length != vector length");
    f64 acc = 0.0;
    for (std::size_t j = 0; j < v.size(); ++j) acc += m[(std::size_t)i][j] * v[j];
    out[(std::size_t)i] = acc;
  }
  return out;
}

Mat matrix_power(const Mat& m, int order) {
  if (order < 0) throw InvalidOrderError(order);
  const int n = (int)m.size();
  check_square(m, n, "matrix_power");

  Mat result = identity(n);
  Mat base = m;
  int e = order;
  while (e > 0) {
    if (e & 1) result = matmul(result, base);
    e >>= 1;
    if (e > 0) base = matmul(base, base);
  }
  return result;
}

void check_square(const Mat& m, int n, const std::string& what) {
  if ((int)m.size() != n) throw InputShapeError(what + ": rows != " + std::to_string(n));
  for (const auto& row : m)
    if ((int)row.size() != n) throw InputShapeError(what + ": cols != " + std::to_string(n));
}

}
