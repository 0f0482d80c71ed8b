/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#include <davidsonxx/types.hpp>
#include <limits>

#include "ut_common.hpp"

using namespace davidsonxx;

TEST_CASE("Scalar Traits") {
  SECTION("Real Type") {
    STATIC_REQUIRE(std::is_same_v<real_t<double>, double>);
    STATIC_REQUIRE(std::is_same_v<real_t<std::complex<float>>, float>);
    STATIC_REQUIRE(std::is_same_v<real_t<Eigen::half>, Eigen::half>);
  }

  SECTION("Compute Type") {
    STATIC_REQUIRE(std::is_same_v<compute_t<Eigen::half>, float>);
    STATIC_REQUIRE(std::is_same_v<compute_t<Eigen::bfloat16>, float>);
    STATIC_REQUIRE(std::is_same_v<compute_t<long double>, long double>);
    STATIC_REQUIRE(std::is_same_v<compute_real_t<std::complex<double>>,
                                  double>);
  }

  SECTION("Dispatch Predicates") {
    STATIC_REQUIRE(is_blas_type_v<float>);
    STATIC_REQUIRE(is_blas_type_v<std::complex<double>>);
    STATIC_REQUIRE_FALSE(is_blas_type_v<long double>);
    STATIC_REQUIRE_FALSE(is_blas_type_v<Eigen::half>);
    STATIC_REQUIRE(is_reduced_precision_v<Eigen::bfloat16>);
    STATIC_REQUIRE_FALSE(is_reduced_precision_v<float>);
    STATIC_REQUIRE(is_complex_v<std::complex<float>>);
    STATIC_REQUIRE_FALSE(is_complex_v<double>);
  }
}

TEST_CASE("Machine Epsilon") {
  REQUIRE(epsilon<double>() == std::numeric_limits<double>::epsilon());
  REQUIRE(epsilon<std::complex<float>>() ==
          std::numeric_limits<float>::epsilon());
  REQUIRE(epsilon<long double>() ==
          std::numeric_limits<long double>::epsilon());

  // Storage precision, not compute precision
  REQUIRE(epsilon<Eigen::half>() == Approx(0.0009765625f));
  REQUIRE(epsilon<Eigen::bfloat16>() == Approx(0.0078125f));
}

TEST_CASE("Scalar Conversions") {
  SECTION("Reduced Precision") {
    auto h = detail::convert<Eigen::half>(1.5);
    REQUIRE(detail::convert<double>(h) == 1.5);
    REQUIRE(detail::widen(h) == 1.5f);
  }

  SECTION("Real To Complex") {
    auto z = detail::convert<std::complex<double>>(2.f);
    REQUIRE(z == std::complex<double>(2., 0.));
  }

  SECTION("Complex To Complex") {
    auto z = detail::convert<std::complex<long double>>(
        std::complex<float>(1.f, -3.f));
    REQUIRE(z.real() == 1.l);
    REQUIRE(z.imag() == -3.l);
  }

  SECTION("Helpers") {
    REQUIRE(detail::real_part(std::complex<double>(4., 5.)) == 4.);
    REQUIRE(detail::conj(std::complex<double>(4., 5.)) ==
            std::complex<double>(4., -5.));
    REQUIRE(detail::conj(-2.) == -2.);
    REQUIRE(detail::abs(std::complex<double>(3., 4.)) == Approx(5.));
    REQUIRE(detail::abs(detail::convert<Eigen::half>(-0.5)) == 0.5f);
  }

  SECTION("Finiteness") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    REQUIRE(detail::is_finite(1.));
    REQUIRE_FALSE(detail::is_finite(nan));
    REQUIRE_FALSE(detail::is_finite(std::complex<double>(1., inf)));
    REQUIRE_FALSE(detail::is_finite(detail::convert<Eigen::half>(inf)));
  }
}
