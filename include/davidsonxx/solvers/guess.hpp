/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <algorithm>
#include <davidsonxx/exceptions.hpp>
#include <davidsonxx/linalg/orthonormalize.hpp>
#include <numeric>
#include <random>
#include <vector>

namespace davidsonxx {

/**
 *  @brief Random N x K block with orthonormal columns
 *
 *  Entries are drawn from a standard normal distribution (real and
 *  imaginary parts independently for complex T) and orthonormalized.
 */
template <typename T>
std::vector<T> random_orthonormal_guess(int64_t N, int64_t K,
                                        uint64_t seed = 0) {
  if(K > N) throw invalid_input("Guess Width Must Be <= N");

  using real_type = compute_real_t<T>;
  std::mt19937_64 gen(seed);
  std::normal_distribution<real_type> dist(0, 1);

  std::vector<T> X(N * K);
  for(auto& x : X) {
    if constexpr(is_complex_v<T>)
      x = detail::convert<T>(compute_t<T>(dist(gen), dist(gen)));
    else
      x = detail::convert<T>(dist(gen));
  }

  auto rank = orthonormalize(N, K, X.data(), N, real_type(N) * epsilon<T>());
  if(rank < K)
    throw numerical_failure(failure_stage::orthonormalization,
                            "Random Guess Is Rank Deficient");

  return X;
}

/**
 *  @brief Unit vectors on the K smallest diagonal entries
 *
 *  The classical Davidson guess for diagonally dominant operators.
 */
template <typename T>
std::vector<T> diagonal_guess(int64_t N, int64_t K, const T* D) {
  if(K > N) throw invalid_input("Guess Width Must Be <= N");

  std::vector<int64_t> idx(N);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](auto i, auto j) {
    return detail::real_part(D[i]) < detail::real_part(D[j]);
  });

  std::vector<T> X(N * K, T(0));
  for(int64_t i = 0; i < K; ++i) X[idx[i] + i * N] = T(1);
  return X;
}

template <typename T>
std::vector<T> diagonal_guess(int64_t K, const std::vector<T>& D) {
  return diagonal_guess(D.size(), K, D.data());
}

}  // namespace davidsonxx
