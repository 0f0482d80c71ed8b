/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#include <spdlog/fmt/fmt.h>

#include <davidsonxx/exceptions.hpp>

namespace davidsonxx {

invalid_input::invalid_input(const std::string& msg)
    : davidson_exception("Davidson: Invalid Input: " + msg) {}

const char* failure_stage_string(failure_stage stage) {
  switch(stage) {
    case failure_stage::operator_application:
      return "Operator Application";
    case failure_stage::rayleigh_ritz:
      return "Rayleigh-Ritz";
    case failure_stage::residuals:
      return "Residuals";
    case failure_stage::preconditioner:
      return "Preconditioner";
    case failure_stage::orthonormalization:
      return "Orthonormalization";
    default:
      return "Unknown";
  }
}

numerical_failure::numerical_failure(failure_stage stage,
                                     const std::string& msg)
    : davidson_exception(fmt::format("Davidson: Numerical Failure in {}: {}",
                                     failure_stage_string(stage), msg)),
      stage_(stage) {}

not_converged_error::not_converged_error(size_t iterations,
                                         double residual_norm)
    : davidson_exception(
          fmt::format("Davidson Did Not Converge! ITER = {}, RNORM = {:.6e}",
                      iterations, residual_norm)),
      iterations_(iterations),
      residual_norm_(residual_norm) {}

}  // namespace davidsonxx
