#include <catch2/catch.hpp>
#include "iim/errors.hpp"
#include "iim/linalg.hpp"
#include "iim/resolvent.hpp"

using namespace iim;

TEST_CASE("resolvent of the two-sector operator", "[resolvent]") {
  const Mat S = resolvent_matrix(Mat{{0.0, 0.8}, {0.2, 0.0}});
  REQUIRE(S[0][0] == Approx(1.0 / 0.84));
  REQUIRE(S[0][1] == Approx(0.8 / 0.84));
  REQUIRE(S[1][0] == Approx(0.2 / 0.84));
  REQUIRE(S[1][1] == Approx(1.0 / 0.84));
}

TEST_CASE("resolvent times (I - A*) is the identity", "[resolvent]") {
  const Mat astar{{0.0, 0.2, 0.1}, {0.3, 0.0, 0.2}, {0.1, 0.1, 0.0}};
  const Mat S = resolvent_matrix(astar);

  Mat ima = identity(3);
  for (int i = 0; i < 3; ++i)
    for (int j = 0; j < 3; ++j) ima[i][j] -= astar[i][j];

  const Mat p = matmul(S, ima);
  for (int i = 0; i < 3; ++i)
    for (int j = 0; j < 3; ++j) REQUIRE(p[i][j] == Approx(i == j ? 1.0 : 0.0).margin(1e-12));
}

TEST_CASE("singular operators are reported, not approximated", "[resolvent]") {
  REQUIRE_THROWS_AS(resolvent_matrix(Mat{{0.0, 1.0}, {1.0, 0.0}}), SingularOperatorError);
  REQUIRE_THROWS_AS(resolvent_matrix(Mat{{1.0}}), SingularOperatorError);
}

TEST_CASE("rcond tolerance rejects nearly singular operators", "[resolvent]") {
  const Mat near{{0.0, 1.0}, {1.0 - 1e-9, 0.0}};
  REQUIRE_NOTHROW(resolvent_matrix(near));

  ResolventOptions strict;
  strict.rcond_tol = 1e-6;
  REQUIRE_THROWS_AS(resolvent_matrix(near, strict), SingularOperatorError);
}

TEST_CASE("resolvent rejects non-square input", "[resolvent]") {
  REQUIRE_THROWS_AS(resolvent_matrix(Mat{{0.0, 1.0}}), InputShapeError);
  REQUIRE_THROWS_AS(resolvent_matrix(Mat{}), InputShapeError);
}
