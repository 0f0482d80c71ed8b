/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#include <davidsonxx/model/model_problems.hpp>
#include <davidsonxx/solvers/guess.hpp>
#include <davidsonxx/solvers/mixed_precision.hpp>

#include "ut_common.hpp"

using namespace davidsonxx;

TEST_CASE("Promote Guess") {
  const int64_t N = 40, K = 3;
  auto X_f = random_orthonormal_guess<float>(N, K, 67);

  // Single precision orthonormality does not meet double precision tolerances
  auto X_d = promote_guess<double>(N, K, X_f.data(), N);
  REQUIRE(X_d.size() == size_t(N * K));
  REQUIRE(orthonormality_error(N, K, X_d.data(), N) < 1e-13);

  // Spans the same space
  for(int64_t j = 0; j < K; ++j) {
    double proj = 0;
    for(int64_t k = 0; k < K; ++k) {
      double ov = 0;
      for(int64_t i = 0; i < N; ++i) ov += X_d[i + k * N] * X_f[i + j * N];
      proj += ov * ov;
    }
    REQUIRE(proj == Approx(1.).margin(1e-5));
  }

  SECTION("Rank Deficient") {
    for(int64_t i = 0; i < N; ++i) X_f[i + N] = X_f[i];
    REQUIRE_THROWS_AS(promote_guess<double>(N, K, X_f.data(), N),
                      numerical_failure);
  }

  SECTION("Null Guess") {
    REQUIRE_THROWS_AS(
        promote_guess<double>(N, K, static_cast<const float*>(nullptr), N),
        invalid_input);
  }
}

TEST_CASE("Mixed Precision Refinement") {
  if(!spdlog::get("davidson")) {
    spdlog::null_logger_mt("davidson");
  }

  const int64_t n = 100, nev = 2;
  auto A = diagonally_dominant_matrix(n);
  auto W_ref = reference_eigenvalues(n, A);

  DenseMatrixOperator<double> op_d(n, A);
  auto D = extract_diagonal(op_d);
  DiagonalPreconditioner<double> K_d(D);

  // Loose single precision solve
  auto A_f = cast_matrix<float>(A);
  auto D_f = cast_matrix<float>(D);
  DenseMatrixOperator<float> op_f(n, A_f);
  DiagonalPreconditioner<float> K_f(D_f);

  DavidsonSettings loose;
  loose.res_tol = 1e-3;
  auto X0_f = random_orthonormal_guess<float>(n, nev, 71);
  auto result_f = block_davidson(loose, op_f, K_f, nev, nev, X0_f.data(), n);
  REQUIRE(result_f.residual_norm < 1e-3);

  DavidsonSettings tight;
  tight.res_tol = 1e-10;

  SECTION("Refine In Double") {
    auto result_d = davidson_refine(tight, op_d, K_d, result_f);
    REQUIRE(result_d.residual_norm < 1e-10);
    for(int64_t i = 0; i < nev; ++i)
      REQUIRE(result_d.eigenvalues[i] == Approx(W_ref[i]).margin(1e-9));

    // A cold start from a random guess needs at least as many iterations
    auto X0_d = random_orthonormal_guess<double>(n, nev, 71);
    auto result_cold =
        block_davidson(tight, op_d, K_d, nev, nev, X0_d.data(), n);
    REQUIRE(result_d.iterations <= result_cold.iterations);
  }

  SECTION("Single To Double To Extended") {
    auto result_d = davidson_refine(tight, op_d, K_d, result_f);

    auto A_ld = cast_matrix<long double>(A);
    auto D_ld = cast_matrix<long double>(D);
    DenseMatrixOperator<long double> op_ld(n, A_ld);
    DiagonalPreconditioner<long double> K_ld(D_ld);

    DavidsonSettings tighter;
    tighter.res_tol = 1e-14;
    auto result_ld = davidson_refine(tighter, op_ld, K_ld, result_d);
    REQUIRE(double(result_ld.residual_norm) < 1e-14);
    for(int64_t i = 0; i < nev; ++i) {
      REQUIRE(double(result_ld.eigenvalues[i]) ==
              Approx(result_d.eigenvalues[i]).margin(1e-9));
      REQUIRE(double(result_ld.eigenvalues[i]) ==
              Approx(W_ref[i]).margin(1e-9));
    }
  }

  SECTION("Dimension Mismatch") {
    auto A_small = diagonally_dominant_matrix(n / 2);
    DenseMatrixOperator<double> op_small(n / 2, A_small);
    REQUIRE_THROWS_AS(davidson_refine(tight, op_small, result_f),
                      invalid_input);
  }

  spdlog::drop_all();
}
