/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <davidsonxx/linalg/dense_ops.hpp>
#include <stdexcept>
#include <vector>

/**
 *  Preconditioners are duck-typed. A type P models a preconditioner on T
 *  if it provides
 *
 *    void preconditioner_action(int64_t N, int64_t K,
 *                               const compute_real_t<T>* W, const T* R,
 *                               int64_t LDR, T* KR, int64_t LDKR) const;
 *
 *  mapping the residual block R (N x K) onto the correction block KR.
 *  W(i) is the Ritz value the i-th residual belongs to.
 */

namespace davidsonxx {

/**
 *  @brief Default preconditioner.
 *
 *  Does nothing to the residual and copies it into the result.
 */
struct IdentityPreconditioner {
  template <typename T, typename RealType>
  void preconditioner_action(int64_t N, int64_t K, const RealType*,
                             const T* R, int64_t LDR, T* KR,
                             int64_t LDKR) const {
    lacpy(N, K, R, LDR, KR, LDKR);
  }
};

/**
 *  @brief Classical Davidson preconditioner
 *
 *  KR(:,i) = (D - W(i))**-1 * R(:,i)
 *
 *  Denominators smaller in magnitude than a guard value are replaced
 *  by the guard, keeping their sign.
 */
template <typename T>
class DiagonalPreconditioner {
  using real_type = compute_real_t<T>;

  std::vector<real_type> D_;
  real_type guard_;

 public:
  DiagonalPreconditioner(int64_t n, const T* D,
                         real_type guard = std::sqrt(epsilon<T>()))
      : D_(n), guard_(guard) {
    if(!D) throw std::runtime_error("DiagonalPreconditioner: Null Diagonal");
    if(guard_ <= real_type(0))
      throw std::runtime_error("DiagonalPreconditioner: Guard Must Be > 0");
    for(int64_t i = 0; i < n; ++i) D_[i] = detail::real_part(D[i]);
  }

  DiagonalPreconditioner(const std::vector<T>& D,
                         real_type guard = std::sqrt(epsilon<T>()))
      : DiagonalPreconditioner(D.size(), D.data(), guard) {}

  int64_t rows() const { return D_.size(); }
  real_type guard() const { return guard_; }

  void preconditioner_action(int64_t N, int64_t K, const real_type* W,
                             const T* R, int64_t LDR, T* KR,
                             int64_t LDKR) const {
    if(N != rows())
      throw std::runtime_error("DiagonalPreconditioner: Dimension Mismatch");

#pragma omp parallel for collapse(2)
    for(int64_t j = 0; j < K; ++j)
      for(int64_t i = 0; i < N; ++i) {
        auto denom = D_[i] - W[j];
        if(std::abs(denom) < guard_) denom = std::copysign(guard_, denom);
        KR[i + j * LDKR] =
            detail::convert<T>(detail::widen(R[i + j * LDR]) / denom);
      }
  }
};

/**
 *  @brief Use an operator (e.g. an approximate inverse of A) as a
 *  shift independent preconditioner
 */
template <typename Op>
class OperatorPreconditioner {
  const Op& op_;

 public:
  using value_type = typename Op::value_type;

  OperatorPreconditioner(const Op& op) : op_(op) {}

  template <typename RealType>
  void preconditioner_action(int64_t N, int64_t K, const RealType*,
                             const value_type* R, int64_t LDR, value_type* KR,
                             int64_t LDKR) const {
    if(N != op_.rows())
      throw std::runtime_error("OperatorPreconditioner: Dimension Mismatch");
    op_.operator_action(K, value_type(1), R, LDR, value_type(0), KR, LDKR);
  }
};

}  // namespace davidsonxx
