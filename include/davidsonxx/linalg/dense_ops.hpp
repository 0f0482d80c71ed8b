/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <Eigen/Core>
#include <algorithm>
#include <blas.hh>
#include <cmath>
#include <davidsonxx/types.hpp>
#include <lapack.hh>
#include <vector>

/**
 *  Dense block kernels on column-major data.
 *
 *  Every kernel dispatches on the scalar type:
 *    - BLAS types are forwarded to blaspp / lapackpp
 *    - reduced precision is widened to compute_t<T>, served by the
 *      BLAS path and narrowed back to storage precision
 *    - remaining types (e.g. long double) are handled by Eigen
 */

namespace davidsonxx {

namespace detail {

template <typename T>
using dense_matrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

template <typename T>
using dense_map = Eigen::Map<dense_matrix<T>, 0, Eigen::OuterStride<>>;

template <typename T>
using const_dense_map =
    Eigen::Map<const dense_matrix<T>, 0, Eigen::OuterStride<>>;

template <typename T>
dense_map<T> map_block(int64_t M, int64_t N, T* A, int64_t LDA) {
  return dense_map<T>(A, M, N, Eigen::OuterStride<>(LDA));
}

template <typename T>
const_dense_map<T> cmap_block(int64_t M, int64_t N, const T* A,
                              int64_t LDA) {
  return const_dense_map<T>(A, M, N, Eigen::OuterStride<>(LDA));
}

template <typename T>
dense_matrix<T> apply_op(blas::Op op, const const_dense_map<T>& A) {
  switch(op) {
    case blas::Op::Trans:
      return A.transpose();
    case blas::Op::ConjTrans:
      return A.adjoint();
    default:
      return A;
  }
}

/// Copy a block into packed (LD = M) storage of compute precision
template <typename T>
std::vector<compute_t<T>> widen_block(int64_t M, int64_t N, const T* A,
                                      int64_t LDA) {
  std::vector<compute_t<T>> A_w(M * N);
  for(int64_t j = 0; j < N; ++j)
    for(int64_t i = 0; i < M; ++i) A_w[i + j * M] = widen(A[i + j * LDA]);
  return A_w;
}

/// Round a block of compute precision back to storage precision
template <typename T>
void narrow_block(int64_t M, int64_t N, const compute_t<T>* A, int64_t LDA,
                  T* B, int64_t LDB) {
  for(int64_t j = 0; j < N; ++j)
    for(int64_t i = 0; i < M; ++i)
      B[i + j * LDB] = convert<T>(A[i + j * LDA]);
}

}  // namespace detail

/**
 *  @brief C = ALPHA * op(A) * op(B) + BETA * C
 *
 *  Semantics follow BLAS xGEMM; if BETA == 0, C need not be initialized
 *  on the BLAS and Eigen paths.
 */
template <typename T>
void gemm(blas::Op transA, blas::Op transB, int64_t M, int64_t N, int64_t K,
          compute_t<T> alpha, const T* A, int64_t LDA, const T* B,
          int64_t LDB, compute_t<T> beta, T* C, int64_t LDC) {
  if(M == 0 or N == 0) return;

  const int64_t A_rows = transA == blas::Op::NoTrans ? M : K;
  const int64_t A_cols = transA == blas::Op::NoTrans ? K : M;
  const int64_t B_rows = transB == blas::Op::NoTrans ? K : N;
  const int64_t B_cols = transB == blas::Op::NoTrans ? N : K;

  if constexpr(is_blas_type_v<T>) {
    blas::gemm(blas::Layout::ColMajor, transA, transB, M, N, K, alpha, A, LDA,
               B, LDB, beta, C, LDC);
  } else if constexpr(is_reduced_precision_v<T>) {
    auto A_w = detail::widen_block(A_rows, A_cols, A, LDA);
    auto B_w = detail::widen_block(B_rows, B_cols, B, LDB);
    auto C_w = detail::widen_block(M, N, C, LDC);
    gemm(transA, transB, M, N, K, alpha, A_w.data(), A_rows, B_w.data(),
         B_rows, beta, C_w.data(), M);
    detail::narrow_block(M, N, C_w.data(), M, C, LDC);
  } else {
    auto A_op = detail::apply_op<T>(transA,
                                    detail::cmap_block(A_rows, A_cols, A, LDA));
    auto B_op = detail::apply_op<T>(transB,
                                    detail::cmap_block(B_rows, B_cols, B, LDB));
    auto C_m = detail::map_block(M, N, C, LDC);
    if(beta == compute_t<T>(0))
      C_m.noalias() = alpha * (A_op * B_op);
    else
      C_m = alpha * (A_op * B_op) + beta * C_m;
  }
}

/// B = A (general M x N block)
template <typename T>
void lacpy(int64_t M, int64_t N, const T* A, int64_t LDA, T* B, int64_t LDB) {
  if constexpr(is_blas_type_v<T>) {
    lapack::lacpy(lapack::MatrixType::General, M, N, A, LDA, B, LDB);
  } else {
    for(int64_t j = 0; j < N; ++j) std::copy_n(A + j * LDA, M, B + j * LDB);
  }
}

/// Y = ALPHA * X + Y
template <typename T>
void axpy(int64_t N, compute_t<T> alpha, const T* X, T* Y) {
  if constexpr(is_blas_type_v<T>) {
    blas::axpy(N, alpha, X, 1, Y, 1);
  } else {
    for(int64_t i = 0; i < N; ++i)
      Y[i] = detail::convert<T>(detail::widen(Y[i]) +
                                alpha * detail::widen(X[i]));
  }
}

/// Whether every entry of the block is finite
template <typename T>
bool all_finite(int64_t M, int64_t N, const T* A, int64_t LDA) {
  for(int64_t j = 0; j < N; ++j)
    for(int64_t i = 0; i < M; ++i)
      if(not detail::is_finite(A[i + j * LDA])) return false;
  return true;
}

/// NRM[j] = ||A(:,j)||_2
template <typename T>
void column_norms(int64_t M, int64_t N, const T* A, int64_t LDA,
                  compute_real_t<T>* NRM) {
  for(int64_t j = 0; j < N; ++j) {
    if constexpr(is_blas_type_v<T>) {
      NRM[j] = blas::nrm2(M, A + j * LDA, 1);
    } else {
      compute_real_t<T> sum = 0;
      for(int64_t i = 0; i < M; ++i) {
        const auto a = detail::abs(A[i + j * LDA]);
        sum += a * a;
      }
      NRM[j] = std::sqrt(sum);
    }
  }
}

/// ||A||_F
template <typename T>
compute_real_t<T> fro_norm(int64_t M, int64_t N, const T* A, int64_t LDA) {
  if(M == 0 or N == 0) return 0;
  if constexpr(is_blas_type_v<T>) {
    return lapack::lange(lapack::Norm::Fro, M, N, A, LDA);
  } else {
    std::vector<compute_real_t<T>> nrm(N);
    column_norms(M, N, A, LDA, nrm.data());
    compute_real_t<T> sum = 0;
    for(auto x : nrm) sum += x * x;
    return std::sqrt(sum);
  }
}

/**
 *  @brief Scale every nonzero column of A to unit 2-norm.
 *
 *  Zero columns are left untouched.
 *
 *  @returns The number of nonzero columns
 */
template <typename T>
int64_t normalize_columns(int64_t M, int64_t N, T* A, int64_t LDA) {
  std::vector<compute_real_t<T>> nrm(N);
  column_norms(M, N, A, LDA, nrm.data());

  int64_t nnz_cols = 0;
  for(int64_t j = 0; j < N; ++j) {
    if(nrm[j] == compute_real_t<T>(0)) continue;
    ++nnz_cols;
    const compute_real_t<T> scale = compute_real_t<T>(1) / nrm[j];
    if constexpr(is_blas_type_v<T>) {
      blas::scal(M, T(scale), A + j * LDA, 1);
    } else {
      for(int64_t i = 0; i < M; ++i)
        A[i + j * LDA] =
            detail::convert<T>(detail::widen(A[i + j * LDA]) * scale);
    }
  }
  return nnz_cols;
}

/**
 *  @brief Deviation of a block from column orthonormality
 *
 *  @returns max_ij | (V**H * V - I)_ij |
 */
template <typename T>
compute_real_t<T> orthonormality_error(int64_t N, int64_t K, const T* V,
                                       int64_t LDV) {
  if constexpr(is_reduced_precision_v<T>) {
    auto V_w = detail::widen_block(N, K, V, LDV);
    return orthonormality_error(N, K, V_w.data(), N);
  } else {
    std::vector<T> G(K * K);
    gemm(blas::Op::ConjTrans, blas::Op::NoTrans, K, K, N, compute_t<T>(1), V,
         LDV, V, LDV, compute_t<T>(0), G.data(), K);
    compute_real_t<T> err = 0;
    for(int64_t j = 0; j < K; ++j)
      for(int64_t i = 0; i < K; ++i) {
        const T g = i == j ? G[i + j * K] - T(1) : G[i + j * K];
        err = std::max(err, detail::abs(g));
      }
    return err;
  }
}

}  // namespace davidsonxx
