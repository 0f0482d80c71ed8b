/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <davidsonxx/types.hpp>
#include <vector>

namespace davidsonxx {

/**
 *  @brief Eigenpairs produced by the Davidson solver.
 *
 *  Also used to report the last (unconverged) iterate through
 *  not_converged<T>.
 */
template <typename T>
struct davidson_result {
  int64_t n = 0;    ///< Problem dimension
  int64_t nev = 0;  ///< Number of eigenpairs

  std::vector<real_t<T>> eigenvalues;  ///< Ritz values, ascending (nev)
  std::vector<T> eigenvectors;         ///< Ritz vectors (n x nev, col-major)

  size_t iterations = 0;                          ///< Rayleigh-Ritz steps taken
  compute_real_t<T> residual_norm = 0;            ///< ||A*X - X*LAM||_F
  std::vector<compute_real_t<T>> residual_norms;  ///< Per-pair residual norms
};

/**
 *  @brief Per-iteration convergence data of the Davidson solver
 */
template <typename T>
struct davidson_convergence {
  struct davidson_iteration {
    std::vector<compute_real_t<T>> W;    ///< Lowest nev Ritz values
    std::vector<compute_real_t<T>> res;  ///< Per-pair residual norms
    compute_real_t<T> res_norm = 0;      ///< Block residual norm
    int64_t subspace_dim = 0;            ///< Basis dimension at this step
    bool restarted = false;  ///< Whether the basis was re-seeded before it
  };

  std::vector<davidson_iteration> conv_data;
};

}  // namespace davidsonxx
