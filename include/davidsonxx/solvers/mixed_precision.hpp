/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <davidsonxx/solvers/davidson.hpp>

namespace davidsonxx {

/**
 *  @brief Convert an N x K block to scalar type To and re-orthonormalize it.
 *
 *  Columns which are orthonormal in the source precision generally are
 *  not to the tolerance of a higher target precision, the solver
 *  requires the latter.
 */
template <typename To, typename From>
std::vector<To> promote_guess(int64_t N, int64_t K, const From* X,
                              int64_t LDX) {
  if(!X) throw invalid_input("No Guess Provided");

  std::vector<To> X_new(N * K);
  for(int64_t j = 0; j < K; ++j)
    for(int64_t i = 0; i < N; ++i)
      X_new[i + j * N] = detail::convert<To>(X[i + j * LDX]);

  auto rank = orthonormalize(N, K, X_new.data(), N,
                             compute_real_t<To>(N) * epsilon<To>());
  if(rank < K)
    throw numerical_failure(failure_stage::orthonormalization,
                            "Promoted Guess Is Rank Deficient");

  return X_new;
}

/**
 *  @brief Refine a converged (lower precision) result in the precision
 *  of op.
 *
 *  The previous eigenvectors are promoted and used as the initial guess
 *  (M0 = NEV = prev.nev).
 */
template <typename Functor, typename Preconditioner, typename From>
davidson_result<typename Functor::value_type> davidson_refine(
    const DavidsonSettings& settings, const Functor& op,
    const Preconditioner& precond, const davidson_result<From>& prev,
    davidson_convergence<typename Functor::value_type>* conv = nullptr) {
  using To = typename Functor::value_type;
  if(prev.n != op.rows())
    throw invalid_input("Previous Result Does Not Match Operator Dimension");

  auto X0 = promote_guess<To>(prev.n, prev.nev, prev.eigenvectors.data(),
                              prev.n);
  return block_davidson(settings, op, precond, prev.nev, prev.nev, X0.data(),
                        prev.n, conv);
}

template <typename Functor, typename From>
davidson_result<typename Functor::value_type> davidson_refine(
    const DavidsonSettings& settings, const Functor& op,
    const davidson_result<From>& prev,
    davidson_convergence<typename Functor::value_type>* conv = nullptr) {
  return davidson_refine(settings, op, IdentityPreconditioner{}, prev, conv);
}

}  // namespace davidsonxx
