/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <davidsonxx/exceptions.hpp>
#include <davidsonxx/linalg/orthonormalize.hpp>
#include <davidsonxx/linalg/rayleigh_ritz.hpp>
#include <davidsonxx/linalg/residuals.hpp>
#include <davidsonxx/operator.hpp>
#include <davidsonxx/preconditioner.hpp>
#include <davidsonxx/settings.hpp>
#include <davidsonxx/solvers/davidson_result.hpp>
#include <memory>

namespace davidsonxx {

namespace detail {

/**
 *  @brief Fetch the "davidson" logger, creating it if it is not registered.
 *
 *  Concurrent solves may race to create the logger, the loser of the
 *  registration picks up the winner's instance.
 */
inline std::shared_ptr<spdlog::logger> davidson_logger() {
  auto logger = spdlog::get("davidson");
  if(logger) return logger;
  try {
    return spdlog::stdout_color_mt("davidson");
  } catch(const spdlog::spdlog_ex&) {
    logger = spdlog::get("davidson");
    if(!logger) throw;
    return logger;
  }
}

}  // namespace detail

/**
 *  @brief Compute the NEV lowest eigenpairs of a Hermitian operator with
 *  the block Davidson method.
 *
 *  Each iteration applies the operator to the search space S, solves the
 *  projected eigenproblem, forms the residuals R = A*X - X*LAM of the NEV
 *  lowest Ritz pairs and, if they have not converged, extends S by the
 *  preconditioned residuals K*R. Once S would hold more than MAX_M
 *  columns it is re-seeded from [X, K*R]. The extended block is
 *  orthonormalized with a rank revealing QR, numerically dependent
 *  directions are dropped.
 *
 *  @param[in]  settings Solver parameters
 *  @param[in]  op       Operator (see operator.hpp)
 *  @param[in]  precond  Preconditioner (see preconditioner.hpp)
 *  @param[in]  M0       Number of columns in the initial guess
 *  @param[in]  NEV      Number of eigenpairs to compute (<= M0)
 *  @param[in]  X0       Initial guess, must have orthonormal columns (LDX*M0)
 *  @param[in]  LDX      Leading dimension of X0
 *  @param[out] conv     If not null, receives per-iteration data
 *
 *  @returns Converged eigenpairs. Throws not_converged<T> (carrying the
 *  last iterate) if MAX_ITER is exhausted.
 */
template <typename Functor, typename Preconditioner>
davidson_result<typename Functor::value_type> block_davidson(
    const DavidsonSettings& settings, const Functor& op,
    const Preconditioner& precond, int64_t M0, int64_t NEV,
    const typename Functor::value_type* X0, int64_t LDX,
    davidson_convergence<typename Functor::value_type>* conv = nullptr) {
  using T = typename Functor::value_type;
  using real_type = compute_real_t<T>;
  using hrt_t = std::chrono::high_resolution_clock;
  using dur_t = std::chrono::duration<double, std::milli>;

  const int64_t N = op.rows();

  // Validate input before touching the operator
  if(!X0) throw invalid_input("No Guess Provided");
  if(NEV < 1) throw invalid_input("NEV Must Be > 0");
  if(NEV > M0) throw invalid_input("NEV Must Be <= M0");
  if(M0 > N) throw invalid_input("M0 Must Be <= N");
  if(LDX < N) throw invalid_input("LDX Must Be >= N");

  const auto rs = resolve_settings<T>(settings, N, M0);
  if(M0 > rs.max_subspace) throw invalid_input("M0 Must Be <= MAX_SUBSPACE");
  if(not all_finite(N, M0, X0, LDX))
    throw invalid_input("Initial Guess Is Not Finite");
  if(orthonormality_error(N, M0, X0, LDX) > rs.ortho_tol)
    throw invalid_input("Initial Guess Is Not Column-Orthonormal");

  auto logger = detail::davidson_logger();

  const int64_t max_m = std::min(rs.max_subspace, N);

  logger->info("[Davidson Eigensolver]:");
  logger->info("  {} = {:6}, {} = {:4}, {} = {:4}, {} = {:4}", "N", N, "NEV",
               NEV, "M0", M0, "MAX_M", max_m);
  logger->info("  {} = {:4}, {} = {:10.5e}, {} = {:10.5e}", "MAX_ITER",
               rs.max_iter, "RES_TOL", rs.res_tol, "RANK_TOL", rs.rank_tol);

  // A restarted basis always holds [X, K*R]
  const int64_t max_cols = std::max(max_m, 2 * NEV);
  std::vector<T> V(N * max_cols), AV(N * max_cols), C(max_cols * max_cols);
  std::vector<real_type> W(max_cols);
  std::vector<T> X(N * NEV), R(N * NEV), KR(N * NEV);
  std::vector<real_type> res(NEV);

  // Copy over guess
  lacpy(N, M0, X0, LDX, V.data(), N);

  auto make_result = [&](size_t niter, real_type rnorm) {
    davidson_result<T> result;
    result.n = N;
    result.nev = NEV;
    result.eigenvalues.resize(NEV);
    for(int64_t i = 0; i < NEV; ++i)
      result.eigenvalues[i] = detail::convert<real_t<T>>(W[i]);
    result.eigenvectors = X;
    result.iterations = niter;
    result.residual_norm = rnorm;
    result.residual_norms = res;
    return result;
  };

  int64_t m = M0;
  bool restarted = false;
  real_type res_nrm = 0;
  for(size_t iter = 1; iter <= rs.max_iter; ++iter) {
    // AV = A * V
    auto op_st = hrt_t::now();
    op.operator_action(m, T(1), V.data(), N, T(0), AV.data(), N);
    auto op_en = hrt_t::now();
    dur_t op_dur = op_en - op_st;

    if(not all_finite(N, m, AV.data(), N))
      throw numerical_failure(failure_stage::operator_application,
                              "A*V Is Not Finite");

    // Rayleigh Ritz
    auto rr_st = hrt_t::now();
    rayleigh_ritz(N, m, V.data(), N, AV.data(), N, W.data(), C.data(), m);
    auto rr_en = hrt_t::now();
    dur_t rr_dur = rr_en - rr_st;

    for(int64_t i = 0; i < m; ++i)
      if(not std::isfinite(W[i]))
        throw numerical_failure(failure_stage::rayleigh_ritz,
                                "Ritz Values Are Not Finite");

    // X = V * C(:,0:NEV), R = AV * C(:,0:NEV) - X * LAM
    auto res_st = hrt_t::now();
    res_nrm = ritz_residuals(N, m, NEV, V.data(), N, AV.data(), N, C.data(), m,
                             W.data(), X.data(), N, R.data(), N, res.data());
    auto res_en = hrt_t::now();
    dur_t res_dur = res_en - res_st;

    logger->info("iter = {:4}, M = {:4}, LAM(0) = {:20.12e}, RNORM = {:20.12e}",
                 iter, m, W[0], res_nrm);
    logger->trace(
        "  * OP_DUR = {:.2e} ms, RR_DUR = {:.2e} ms, RES_DUR = {:.2e} ms",
        op_dur.count(), rr_dur.count(), res_dur.count());

    if(conv) {
      typename davidson_convergence<T>::davidson_iteration it;
      it.W.assign(W.begin(), W.begin() + NEV);
      it.res = res;
      it.res_norm = res_nrm;
      it.subspace_dim = m;
      it.restarted = restarted;
      conv->conv_data.emplace_back(std::move(it));
    }

    // Check for convergence
    if(res_nrm < rs.res_tol) {
      logger->info("Davidson Converged!");
      return make_result(iter, res_nrm);
    }

    if(iter == rs.max_iter) break;

    // Compute new directions KR = K * R
    auto ortho_st = hrt_t::now();
    precond.preconditioner_action(N, NEV, W.data(), R.data(), N, KR.data(),
                                  N);
    if(not all_finite(N, NEV, KR.data(), N))
      throw numerical_failure(failure_stage::preconditioner,
                              "K*R Is Not Finite");

    // Restart from [X, K*R] or extend to [V, K*R]
    restarted = m + NEV > max_m;
    int64_t k = m;
    if(restarted) {
      logger->debug("  * Restarting: M = {} -> {}", m, 2 * NEV);
      lacpy(N, NEV, X.data(), N, V.data(), N);
      k = NEV;
    }
    lacpy(N, NEV, KR.data(), N, V.data() + k * N, N);
    normalize_columns(N, NEV, V.data() + k * N, N);
    k += NEV;

    const auto m_new = orthonormalize(N, k, V.data(), N, rs.rank_tol);
    auto ortho_en = hrt_t::now();
    dur_t ortho_dur = ortho_en - ortho_st;
    logger->trace("  * ORTHO_DUR = {:.2e} ms", ortho_dur.count());

    if(m_new < NEV)
      throw numerical_failure(failure_stage::orthonormalization,
                              "Search Space Rank Dropped Below NEV");
    if(m_new < k)
      logger->debug("  * Dropped {} Linearly Dependent Directions", k - m_new);
    if(not restarted and m_new <= m)
      logger->warn("Davidson: Search Space Did Not Grow (M = {})", m_new);

    m = m_new;

  }  // Davidson iterations

  throw not_converged<T>(make_result(rs.max_iter, res_nrm));
}

/**
 *  @brief Block Davidson without preconditioning
 */
template <typename Functor>
davidson_result<typename Functor::value_type> block_davidson(
    const DavidsonSettings& settings, const Functor& op, int64_t M0,
    int64_t NEV, const typename Functor::value_type* X0, int64_t LDX,
    davidson_convergence<typename Functor::value_type>* conv = nullptr) {
  return block_davidson(settings, op, IdentityPreconditioner{}, M0, NEV, X0,
                        LDX, conv);
}

/**
 *  @brief Block Davidson for as many eigenpairs as guess vectors
 */
template <typename Functor>
davidson_result<typename Functor::value_type> block_davidson(
    const DavidsonSettings& settings, const Functor& op, int64_t M0,
    const typename Functor::value_type* X0, int64_t LDX) {
  return block_davidson(settings, op, IdentityPreconditioner{}, M0, M0, X0,
                        LDX);
}

}  // namespace davidsonxx
