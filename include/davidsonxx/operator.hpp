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
#include <functional>
#include <vector>

/**
 *  Operators are duck-typed. A type Op models an operator on T if it
 *  provides
 *
 *    using value_type = T;
 *    int64_t rows() const;
 *    void operator_action(int64_t K, T alpha, const T* V, int64_t LDV,
 *                         T beta, T* AV, int64_t LDAV) const;
 *
 *  where operator_action computes AV = alpha * A * V + beta * AV for a
 *  rows() x K block V. A is assumed to be Hermitian.
 */

namespace davidsonxx {

/**
 *  @brief Typedef for a matrix-free operator action AV = A * V.
 *
 *  Arguments are (N, K, V, LDV, AV, LDAV).
 */
template <typename T>
using operator_action_type =
    std::function<void(int64_t, int64_t, const T*, int64_t, T*, int64_t)>;

/**
 *  @brief Non-owning view of a dense column-major N x N matrix
 */
template <typename T>
class DenseMatrixOperator {
  int64_t n_;
  const T* A_;
  int64_t lda_;

 public:
  using value_type = T;

  DenseMatrixOperator(int64_t n, const T* A, int64_t lda)
      : n_(n), A_(A), lda_(lda) {
    if(!A_) throw std::runtime_error("DenseMatrixOperator: Null Matrix");
    if(lda_ < n_) throw std::runtime_error("DenseMatrixOperator: LDA < N");
  }

  DenseMatrixOperator(int64_t n, const std::vector<T>& A)
      : DenseMatrixOperator(n, A.data(), n) {
    if(A.size() != size_t(n * n))
      throw std::runtime_error("DenseMatrixOperator: Size Mismatch");
  }

  int64_t rows() const { return n_; }
  const T* data() const { return A_; }
  int64_t ld() const { return lda_; }

  void operator_action(int64_t K, T alpha, const T* V, int64_t LDV, T beta,
                       T* AV, int64_t LDAV) const {
    gemm(blas::Op::NoTrans, blas::Op::NoTrans, n_, K, n_, detail::widen(alpha),
         A_, lda_, V, LDV, detail::widen(beta), AV, LDAV);
  }
};

/**
 *  @brief Operator defined only through its action on a block.
 */
template <typename T>
class MatrixFreeOperator {
  int64_t n_;
  operator_action_type<T> Aop_;

 public:
  using value_type = T;

  MatrixFreeOperator() = delete;

  MatrixFreeOperator(int64_t n, operator_action_type<T> Aop)
      : n_(n), Aop_(std::move(Aop)) {
    if(not Aop_) throw std::runtime_error("A cannot be a null op");
  }

  int64_t rows() const { return n_; }

  void operator_action(int64_t K, T alpha, const T* V, int64_t LDV, T beta,
                       T* AV, int64_t LDAV) const {
    if(alpha == T(1) and beta == T(0)) {
      Aop_(n_, K, V, LDV, AV, LDAV);
      return;
    }

    // AV = alpha * (A*V) + beta * AV
    std::vector<T> tmp(n_ * K);
    Aop_(n_, K, V, LDV, tmp.data(), n_);
    const auto a = detail::widen(alpha);
    const auto b = detail::widen(beta);
    for(int64_t j = 0; j < K; ++j)
      for(int64_t i = 0; i < n_; ++i) {
        auto& av = AV[i + j * LDAV];
        const auto t = a * detail::widen(tmp[i + j * n_]);
        av = detail::convert<T>(
            b == compute_t<T>(0) ? t : t + b * detail::widen(av));
      }
  }
};

/**
 *  @brief Diagonal of a dense column-major matrix
 */
template <typename T>
std::vector<T> extract_diagonal(int64_t n, const T* A, int64_t lda) {
  std::vector<T> D(n);
  for(int64_t i = 0; i < n; ++i) D[i] = A[i + i * lda];
  return D;
}

template <typename T>
std::vector<T> extract_diagonal(const DenseMatrixOperator<T>& op) {
  return extract_diagonal(op.rows(), op.data(), op.ld());
}

}  // namespace davidsonxx
