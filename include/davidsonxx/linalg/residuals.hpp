/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <davidsonxx/exceptions.hpp>
#include <davidsonxx/linalg/dense_ops.hpp>

namespace davidsonxx {

/**
 *  @brief Compute Ritz vectors and their residuals from Ritz coefficients
 *
 *  X = S * Y(:,0:NEV)
 *  R = AS * Y(:,0:NEV) - X * diag(W(0:NEV))
 *
 *  @param[in]  N    Number of rows in S / AS
 *  @param[in]  M    Number of columns in S / AS (rows of Y)
 *  @param[in]  NEV  Number of Ritz pairs to form
 *  @param[in]  S    Orthonormal basis (LDS*M)
 *  @param[in]  LDS  Leading dimension of S
 *  @param[in]  AS   Precomputed A * S (LDAS*M)
 *  @param[in]  LDAS Leading dimension of AS
 *  @param[in]  Y    Ritz coefficients (LDY*NEV)
 *  @param[in]  LDY  Leading dimension of Y
 *  @param[in]  W    Ritz values (NEV)
 *  @param[out] X    Ritz vectors (LDX*NEV)
 *  @param[in]  LDX  Leading dimension of X
 *  @param[out] R    Residuals (LDR*NEV)
 *  @param[in]  LDR  Leading dimension of R
 *  @param[out] RES  Residual norms of the individual pairs (NEV)
 *
 *  @returns ||R||_F
 */
template <typename T>
compute_real_t<T> ritz_residuals(int64_t N, int64_t M, int64_t NEV,
                                 const T* S, int64_t LDS, const T* AS,
                                 int64_t LDAS, const T* Y, int64_t LDY,
                                 const compute_real_t<T>* W, T* X, int64_t LDX,
                                 T* R, int64_t LDR, compute_real_t<T>* RES) {
  compute_real_t<T> res_nrm = 0;
  if constexpr(is_reduced_precision_v<T>) {
    auto S_w = detail::widen_block(N, M, S, LDS);
    auto AS_w = detail::widen_block(N, M, AS, LDAS);
    auto Y_w = detail::widen_block(M, NEV, Y, LDY);
    std::vector<compute_t<T>> X_w(N * NEV), R_w(N * NEV);
    res_nrm = ritz_residuals(N, M, NEV, S_w.data(), N, AS_w.data(), N,
                             Y_w.data(), M, W, X_w.data(), N, R_w.data(), N,
                             RES);
    detail::narrow_block(N, NEV, X_w.data(), N, X, LDX);
    detail::narrow_block(N, NEV, R_w.data(), N, R, LDR);
  } else {
    // X = S * Y
    gemm(blas::Op::NoTrans, blas::Op::NoTrans, N, NEV, M, T(1), S, LDS, Y, LDY,
         T(0), X, LDX);

    // R = AS * Y - X * LAM
    gemm(blas::Op::NoTrans, blas::Op::NoTrans, N, NEV, M, T(1), AS, LDAS, Y,
         LDY, T(0), R, LDR);
    for(int64_t i = 0; i < NEV; ++i)
      axpy(N, T(-W[i]), X + i * LDX, R + i * LDR);

    column_norms(N, NEV, R, LDR, RES);
    for(int64_t i = 0; i < NEV; ++i) res_nrm += RES[i] * RES[i];
    res_nrm = std::sqrt(res_nrm);
  }

  if(not std::isfinite(res_nrm))
    throw numerical_failure(failure_stage::residuals,
                            "Residual Norm Is Not Finite");

  return res_nrm;

}  // ritz_residuals

}  // namespace davidsonxx
