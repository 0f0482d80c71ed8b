/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#include <davidsonxx/model/model_problems.hpp>
#include <davidsonxx/operator.hpp>
#include <davidsonxx/preconditioner.hpp>
#include <davidsonxx/sparse_operator.hpp>

#include "ut_common.hpp"

using namespace davidsonxx;

TEST_CASE("Dense Matrix Operator") {
  const int64_t N = 3;
  // A = [2 1 0; 1 3 1; 0 1 4]
  std::vector<double> A = {2, 1, 0, 1, 3, 1, 0, 1, 4};
  DenseMatrixOperator<double> op(N, A);
  REQUIRE(op.rows() == N);

  std::vector<double> V = {1, 1, 1, 1, 0, 0};
  std::vector<double> AV = {1, 1, 1, 1, 1, 1};

  SECTION("Overwrite") {
    op.operator_action(2, 1., V.data(), N, 0., AV.data(), N);
    std::vector<double> AV_ref = {3, 5, 5, 2, 1, 0};
    for(int i = 0; i < 6; ++i) REQUIRE(AV[i] == Approx(AV_ref[i]));
  }

  SECTION("Accumulate") {
    op.operator_action(2, 2., V.data(), N, -1., AV.data(), N);
    std::vector<double> AV_ref = {5, 9, 9, 3, 1, -1};
    for(int i = 0; i < 6; ++i) REQUIRE(AV[i] == Approx(AV_ref[i]));
  }

  SECTION("Diagonal") {
    auto D = extract_diagonal(op);
    REQUIRE(D == std::vector<double>{2, 3, 4});
  }

  SECTION("Invalid Construction") {
    REQUIRE_THROWS(DenseMatrixOperator<double>(N, nullptr, N));
    REQUIRE_THROWS(DenseMatrixOperator<double>(N, A.data(), N - 1));
    REQUIRE_THROWS(DenseMatrixOperator<double>(N + 1, A));
  }
}

TEST_CASE("Matrix Free Operator") {
  const int64_t N = 4;
  size_t napply = 0;

  // Negative shift operator, AV = -V
  MatrixFreeOperator<double> op(N, [&](int64_t n, int64_t k, const double* V,
                                       int64_t LDV, double* AV, int64_t LDAV) {
    ++napply;
    for(int64_t j = 0; j < k; ++j)
      for(int64_t i = 0; i < n; ++i) AV[i + j * LDAV] = -V[i + j * LDV];
  });
  REQUIRE(op.rows() == N);

  std::vector<double> V(N, 2.), AV(N, 1.);

  SECTION("Direct") {
    op.operator_action(1, 1., V.data(), N, 0., AV.data(), N);
    for(auto x : AV) REQUIRE(x == -2.);
    REQUIRE(napply == 1);
  }

  SECTION("Scaled") {
    op.operator_action(1, 3., V.data(), N, 2., AV.data(), N);
    for(auto x : AV) REQUIRE(x == -4.);
    REQUIRE(napply == 1);
  }

  SECTION("Null Op") {
    REQUIRE_THROWS(MatrixFreeOperator<double>(N, nullptr));
  }
}

TEST_CASE("Sparse Matrix Operator") {
  const int64_t N = 5;
  auto A = laplacian_1d(N);
  SparseMatrixOperator op(A);
  REQUIRE(op.rows() == N);

  std::vector<double> V(N, 1.), AV(N);
  op.operator_action(1, 1., V.data(), N, 0., AV.data(), N);
  std::vector<double> AV_ref = {1, 0, 0, 0, 1};
  for(int i = 0; i < N; ++i)
    REQUIRE(AV[i] == Approx(AV_ref[i]).margin(1e-15));

  auto D = extract_diagonal(op);
  REQUIRE(D.size() == size_t(N));
  for(auto d : D) REQUIRE(d == 2.);

  // Agrees with the dense representation
  auto A_dense = diagonal_matrix(std::vector<double>(N, 2.));
  for(int64_t i = 0; i < N - 1; ++i) {
    A_dense[i + (i + 1) * N] = -1.;
    A_dense[(i + 1) + i * N] = -1.;
  }
  DenseMatrixOperator<double> dense_op(N, A_dense);

  std::vector<double> X(N * 2), AX_sp(N * 2), AX_de(N * 2);
  for(int64_t i = 0; i < N * 2; ++i) X[i] = std::sin(double(i));
  op.operator_action(2, 1., X.data(), N, 0., AX_sp.data(), N);
  dense_op.operator_action(2, 1., X.data(), N, 0., AX_de.data(), N);
  for(int64_t i = 0; i < N * 2; ++i)
    REQUIRE(AX_sp[i] == Approx(AX_de[i]).margin(1e-14));
}

TEST_CASE("Preconditioners") {
  const int64_t N = 3;
  std::vector<double> R = {1, 1, 1, 2, 2, 2};
  std::vector<double> KR(N * 2);

  SECTION("Identity") {
    std::vector<double> W = {0, 0};
    IdentityPreconditioner().preconditioner_action(N, 2, W.data(), R.data(), N,
                                                   KR.data(), N);
    REQUIRE(KR == R);
  }

  SECTION("Diagonal") {
    DiagonalPreconditioner<double> K({1, 2, 3});
    std::vector<double> W = {0, 1};
    K.preconditioner_action(N, 2, W.data(), R.data(), N, KR.data(), N);
    REQUIRE(KR[0] == Approx(1.));
    REQUIRE(KR[1] == Approx(0.5));
    REQUIRE(KR[2] == Approx(1. / 3.));

    // D(0) - W(1) = 0 is replaced by the guard
    REQUIRE(KR[3] == Approx(2. / K.guard()));
    REQUIRE(KR[4] == Approx(2.));
    REQUIRE(KR[5] == Approx(1.));
  }

  SECTION("Diagonal Guard Keeps Sign") {
    DiagonalPreconditioner<double> K({1, 1, 1}, 1e-2);
    std::vector<double> W = {1.001, 0.999};
    K.preconditioner_action(N, 2, W.data(), R.data(), N, KR.data(), N);
    REQUIRE(KR[0] == Approx(-100.));
    REQUIRE(KR[3] == Approx(200.));
  }

  SECTION("Diagonal Dimension Mismatch") {
    DiagonalPreconditioner<double> K({1, 2});
    std::vector<double> W = {0, 0};
    REQUIRE_THROWS(
        K.preconditioner_action(N, 2, W.data(), R.data(), N, KR.data(), N));
  }

  SECTION("Operator") {
    std::vector<double> A = {2, 0, 0, 0, 2, 0, 0, 0, 2};
    DenseMatrixOperator<double> op(N, A);
    OperatorPreconditioner K(op);
    std::vector<double> W = {0, 0};
    K.preconditioner_action(N, 2, W.data(), R.data(), N, KR.data(), N);
    for(int64_t i = 0; i < N * 2; ++i) REQUIRE(KR[i] == Approx(2. * R[i]));
  }
}
