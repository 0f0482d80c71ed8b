/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <Eigen/QR>
#include <davidsonxx/exceptions.hpp>
#include <davidsonxx/linalg/dense_ops.hpp>

namespace davidsonxx {

/**
 *  @brief Replace the columns of V by an orthonormal basis of their span.
 *
 *  Rank revealing through column pivoted QR (V * P = Q * R). Pivots with
 *  |R(i,i)| <= RANK_TOL * |R(0,0)| are treated as numerically zero and
 *  the corresponding directions are dropped.
 *
 *  @param[in]     N        Number of rows in V
 *  @param[in]     K        Number of columns in V
 *  @param[in/out] V        On input, the raw block. On output, the first
 *                          RANK columns hold an orthonormal basis (LDV*K)
 *  @param[in]     LDV      Leading dimension of V
 *  @param[in]     RANK_TOL Relative pivot threshold
 *
 *  @returns The numerical rank of the input block
 */
template <typename T>
int64_t orthonormalize(int64_t N, int64_t K, T* V, int64_t LDV,
                       compute_real_t<T> RANK_TOL) {
  if(K == 0) return 0;
  if(not all_finite(N, K, V, LDV))
    throw numerical_failure(failure_stage::orthonormalization,
                            "Basis Is Not Finite");

  int64_t rank = 0;
  if constexpr(is_reduced_precision_v<T>) {
    auto V_w = detail::widen_block(N, K, V, LDV);
    rank = orthonormalize(N, K, V_w.data(), N, RANK_TOL);
    detail::narrow_block(N, rank, V_w.data(), N, V, LDV);
  } else if constexpr(is_blas_type_v<T>) {
    const int64_t min_nk = std::min(N, K);
    std::vector<int64_t> jpvt(K, 0);
    std::vector<T> tau(min_nk);

    auto info = lapack::geqp3(N, K, V, LDV, jpvt.data(), tau.data());
    if(info)
      throw numerical_failure(failure_stage::orthonormalization,
                              "GEQP3 Failed (INFO = " + std::to_string(info) +
                                  ")");

    // Pivoted diagonal of R is non-increasing in magnitude
    const auto r00 = detail::abs(V[0]);
    for(int64_t i = 0; i < min_nk; ++i) {
      if(detail::abs(V[i + i * LDV]) <= RANK_TOL * r00) break;
      ++rank;
    }
    if(rank == 0) return 0;

    if constexpr(is_complex_v<T>)
      info = lapack::ungqr(N, rank, rank, V, LDV, tau.data());
    else
      info = lapack::orgqr(N, rank, rank, V, LDV, tau.data());
    if(info)
      throw numerical_failure(failure_stage::orthonormalization,
                              "Q Formation Failed (INFO = " +
                                  std::to_string(info) + ")");
  } else {
    Eigen::ColPivHouseholderQR<detail::dense_matrix<T>> qr(N, K);
    qr.setThreshold(RANK_TOL);
    qr.compute(detail::dense_matrix<T>(detail::cmap_block(
        N, K, static_cast<const T*>(V), LDV)));

    rank = qr.rank();
    if(rank == 0) return 0;

    detail::dense_matrix<T> Q =
        qr.householderQ() * detail::dense_matrix<T>::Identity(N, rank);
    detail::map_block(N, rank, V, LDV) = Q;
  }

  return rank;

}  // orthonormalize

}  // namespace davidsonxx
