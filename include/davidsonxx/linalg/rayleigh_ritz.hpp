/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <Eigen/Eigenvalues>
#include <davidsonxx/exceptions.hpp>
#include <davidsonxx/linalg/dense_ops.hpp>

namespace davidsonxx {

/**
 *  @brief Replace C by (C + C**H) / 2
 *
 *  Removes the asymmetry rounding introduces into a projected
 *  Hermitian matrix.
 */
template <typename T>
void hermitian_part(int64_t K, T* C, int64_t LDC) {
  for(int64_t j = 0; j < K; ++j) {
    C[j + j * LDC] = T(detail::real_part(C[j + j * LDC]));
    for(int64_t i = j + 1; i < K; ++i) {
      const T avg = (C[i + j * LDC] + detail::conj(C[j + i * LDC])) / T(2);
      C[i + j * LDC] = avg;
      C[j + i * LDC] = detail::conj(avg);
    }
  }
}

/**
 *  @brief Compute approximate eigenpairs through the Rayleigh-Ritz procedure
 *
 *  Forms P = X**H * AX, symmetrizes it and computes its full
 *  eigendecomposition.
 *
 *  @param[in]  N    Number of rows in X / AX
 *  @param[in]  K    Number of columns in X / AX
 *  @param[in]  X    Orthonormal basis (LDX*K)
 *  @param[in]  LDX  Leading dimension of X ( >= N )
 *  @param[in]  AX   Precomputed A * X (LDAX*K)
 *  @param[in]  LDAX Leading dimension of AX ( >= N )
 *  @param[out] W    Ritz values, ascending (K)
 *  @param[out] C    Ritz coefficients (LDC*K)
 *  @param[in]  LDC  Leading dimension of C ( >= K )
 *
 *  Throws numerical_failure if P is not finite or the eigensolver fails.
 */
template <typename T>
void rayleigh_ritz(int64_t N, int64_t K, const T* X, int64_t LDX, const T* AX,
                   int64_t LDAX, compute_real_t<T>* W, T* C, int64_t LDC) {
  if constexpr(is_reduced_precision_v<T>) {
    auto X_w = detail::widen_block(N, K, X, LDX);
    auto AX_w = detail::widen_block(N, K, AX, LDAX);
    std::vector<compute_t<T>> C_w(K * K);
    rayleigh_ritz(N, K, X_w.data(), N, AX_w.data(), N, W, C_w.data(), K);
    detail::narrow_block(K, K, C_w.data(), K, C, LDC);
  } else {
    gemm(blas::Op::ConjTrans, blas::Op::NoTrans, K, K, N, T(1), X, LDX, AX,
         LDAX, T(0), C, LDC);
    hermitian_part(K, C, LDC);

    if(not all_finite(K, K, C, LDC))
      throw numerical_failure(failure_stage::rayleigh_ritz,
                              "Projected Matrix Is Not Finite");

    if constexpr(is_blas_type_v<T>) {
      int64_t info;
      if constexpr(is_complex_v<T>)
        info = lapack::heev(lapack::Job::Vec, lapack::Uplo::Lower, K, C, LDC,
                            W);
      else
        info = lapack::syev(lapack::Job::Vec, lapack::Uplo::Lower, K, C, LDC,
                            W);
      if(info)
        throw numerical_failure(failure_stage::rayleigh_ritz,
                                "Eigensolver Failed (INFO = " +
                                    std::to_string(info) + ")");
    } else {
      Eigen::SelfAdjointEigenSolver<detail::dense_matrix<T>> eigensolver(
          detail::cmap_block(K, K, static_cast<const T*>(C), LDC));
      if(eigensolver.info() != Eigen::Success)
        throw numerical_failure(failure_stage::rayleigh_ritz,
                                "Eigensolver Failed");
      const auto& evals = eigensolver.eigenvalues();
      std::copy_n(evals.data(), K, W);
      auto C_m = detail::map_block(K, K, C, LDC);
      C_m = eigensolver.eigenvectors();
    }
  }

}  // rayleigh_ritz

}  // namespace davidsonxx
