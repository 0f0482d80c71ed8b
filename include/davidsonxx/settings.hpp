/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <cmath>
#include <davidsonxx/exceptions.hpp>
#include <davidsonxx/types.hpp>
#include <optional>

namespace davidsonxx {

/**
 *  @brief Parameters of a Davidson solve.
 *
 *  Unset optionals take defaults derived from the problem shape and the
 *  scalar type once the solve starts (see resolve_settings).
 */
struct DavidsonSettings {
  size_t max_iter = 100;

  std::optional<double> res_tol;       // 20 * N * eps(T)
  std::optional<size_t> max_subspace;  // 8 * M0
  std::optional<double> rank_tol;      // N * eps(T)
  std::optional<double> ortho_tol;     // sqrt(eps(T))
};

template <typename T>
struct ResolvedDavidsonSettings {
  size_t max_iter;
  int64_t max_subspace;
  compute_real_t<T> res_tol;
  compute_real_t<T> rank_tol;
  compute_real_t<T> ortho_tol;
};

/**
 *  @brief Apply defaults and sanity check a DavidsonSettings instance
 *
 *  @param[in] settings User supplied settings
 *  @param[in] N        Problem dimension
 *  @param[in] M0       Width of the initial guess
 */
template <typename T>
ResolvedDavidsonSettings<T> resolve_settings(const DavidsonSettings& settings,
                                             int64_t N, int64_t M0) {
  using real_type = compute_real_t<T>;
  const real_type eps = epsilon<T>();

  ResolvedDavidsonSettings<T> r;
  r.max_iter = settings.max_iter;
  r.max_subspace = settings.max_subspace.value_or(8 * M0);
  r.res_tol = settings.res_tol ? real_type(*settings.res_tol)
                               : real_type(20) * real_type(N) * eps;
  r.rank_tol =
      settings.rank_tol ? real_type(*settings.rank_tol) : real_type(N) * eps;
  r.ortho_tol =
      settings.ortho_tol ? real_type(*settings.ortho_tol) : std::sqrt(eps);

  if(r.max_iter == 0) throw invalid_input("MAX_ITER Must Be > 0");
  if(not(r.res_tol > real_type(0)) or not std::isfinite(r.res_tol))
    throw invalid_input("RES_TOL Must Be Finite And > 0");
  if(not(r.rank_tol >= real_type(0)) or r.rank_tol >= real_type(1))
    throw invalid_input("RANK_TOL Must Be In [0,1)");
  if(not(r.ortho_tol > real_type(0)))
    throw invalid_input("ORTHO_TOL Must Be > 0");

  return r;
}

}  // namespace davidsonxx
