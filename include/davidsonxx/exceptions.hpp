/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <davidsonxx/solvers/davidson_result.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace davidsonxx {

/// Base class of all errors raised by davidsonxx
class davidson_exception : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 *  @brief Malformed problem setup, raised before the operator is touched
 */
class invalid_input : public davidson_exception {
 public:
  explicit invalid_input(const std::string& msg);
};

enum class failure_stage {
  operator_application,
  rayleigh_ritz,
  residuals,
  preconditioner,
  orthonormalization
};

const char* failure_stage_string(failure_stage stage);

/**
 *  @brief Non-finite data or a failed dense factorization.
 *
 *  Never retried: continuing would propagate corrupted data into the
 *  eigenvalue estimates.
 */
class numerical_failure : public davidson_exception {
  failure_stage stage_;

 public:
  numerical_failure(failure_stage stage, const std::string& msg);

  failure_stage stage() const noexcept { return stage_; }
};

/**
 *  @brief Residual did not drop below tolerance within the iteration budget
 */
class not_converged_error : public davidson_exception {
  size_t iterations_;
  double residual_norm_;

 public:
  not_converged_error(size_t iterations, double residual_norm);

  size_t iterations() const noexcept { return iterations_; }
  double residual_norm() const noexcept { return residual_norm_; }
};

/**
 *  @brief not_converged_error which also carries the last iterate.
 *
 *  The iterate is diagnostic data only, it does not satisfy the
 *  requested tolerance.
 */
template <typename T>
class not_converged : public not_converged_error {
  davidson_result<T> last_iterate_;

 public:
  not_converged(davidson_result<T> last)
      : not_converged_error(last.iterations,
                            static_cast<double>(last.residual_norm)),
        last_iterate_(std::move(last)) {}

  const davidson_result<T>& last_iterate() const noexcept {
    return last_iterate_;
  }
};

}  // namespace davidsonxx
