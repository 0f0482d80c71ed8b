/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <Eigen/Eigenvalues>
#include <cmath>
#include <davidsonxx/types.hpp>
#include <vector>

#include "catch2/catch.hpp"

template <typename T>
double to_double(const T& x) {
  return static_cast<double>(davidsonxx::detail::real_part(x));
}

/// Ascending eigenvalues of a dense symmetric matrix
inline std::vector<double> reference_eigenvalues(int64_t n,
                                                 const std::vector<double>& A) {
  Eigen::Map<const Eigen::MatrixXd> A_map(A.data(), n, n);
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigensolver(A_map);
  const auto& evals = eigensolver.eigenvalues();
  return std::vector<double>(evals.data(), evals.data() + n);
}

/**
 *  Spectrum with LAM(i) = i+1 for the NEV wanted eigenvalues and the
 *  remaining ones clustered in [10,11)
 */
inline std::vector<double> gapped_spectrum(int64_t n, int64_t nev) {
  std::vector<double> D(n);
  for(int64_t i = 0; i < n; ++i)
    D[i] = i < nev ? double(i + 1) : 10. + double(i - nev) / double(n - nev);
  return D;
}

/// ||A*X - X*diag(W)||_F for dense A (N x N) and X (N x K)
template <typename T>
double residual_norm(int64_t n, int64_t k, const T* A, const T* X,
                     const davidsonxx::real_t<T>* W) {
  using davidsonxx::detail::widen;
  double nrm = 0;
  for(int64_t j = 0; j < k; ++j)
    for(int64_t i = 0; i < n; ++i) {
      auto r = -widen(X[i + j * n]) * widen(W[j]);
      for(int64_t l = 0; l < n; ++l)
        r += widen(A[i + l * n]) * widen(X[l + j * n]);
      const auto a = static_cast<double>(std::abs(r));
      nrm += a * a;
    }
  return std::sqrt(nrm);
}
