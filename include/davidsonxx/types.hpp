/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <Eigen/Core>
#include <cmath>
#include <complex>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace davidsonxx {

namespace detail {

template <typename T>
struct real_type {
  using type = T;
};

template <typename T>
struct real_type<std::complex<T>> {
  using type = T;
};

template <typename T>
struct is_complex : std::false_type {};

template <typename T>
struct is_complex<std::complex<T>> : std::true_type {};

/// Types served natively by blaspp / lapackpp
template <typename T>
struct is_blas_type : std::false_type {};

template <>
struct is_blas_type<float> : std::true_type {};
template <>
struct is_blas_type<double> : std::true_type {};
template <>
struct is_blas_type<std::complex<float>> : std::true_type {};
template <>
struct is_blas_type<std::complex<double>> : std::true_type {};

template <typename T>
struct is_reduced_precision : std::false_type {};

template <>
struct is_reduced_precision<Eigen::half> : std::true_type {};
template <>
struct is_reduced_precision<Eigen::bfloat16> : std::true_type {};

/**
 *  @brief Type in which dense kernels on T are evaluated.
 *
 *  Reduced precision storage is widened to single precision for
 *  products and factorizations, everything else is computed in place.
 */
template <typename T>
struct compute_type {
  using type = T;
};

template <>
struct compute_type<Eigen::half> {
  using type = float;
};

template <>
struct compute_type<Eigen::bfloat16> {
  using type = float;
};

}  // namespace detail

template <typename T>
using real_t = typename detail::real_type<T>::type;

template <typename T>
using compute_t = typename detail::compute_type<T>::type;

/// Real type of norms, Ritz values and tolerances for storage type T
template <typename T>
using compute_real_t = real_t<compute_t<T>>;

template <typename T>
inline constexpr bool is_complex_v = detail::is_complex<T>::value;

template <typename T>
inline constexpr bool is_blas_type_v = detail::is_blas_type<T>::value;

template <typename T>
inline constexpr bool is_reduced_precision_v =
    detail::is_reduced_precision<T>::value;

/**
 *  @brief Machine epsilon of the storage precision of T
 *
 *  Note that for reduced precision types this is the epsilon of the
 *  storage type, not the (wider) type kernels are evaluated in.
 */
template <typename T>
compute_real_t<T> epsilon() {
  return static_cast<compute_real_t<T>>(
      std::numeric_limits<real_t<T>>::epsilon());
}

namespace detail {

/// Convert between scalar types, routing reduced precision through float
template <typename To, typename From>
To convert(const From& x) {
  if constexpr(std::is_same_v<To, From>) {
    return x;
  } else if constexpr(is_complex_v<To> and is_complex_v<From>) {
    return To(convert<real_t<To>>(x.real()), convert<real_t<To>>(x.imag()));
  } else if constexpr(is_complex_v<To>) {
    return To(convert<real_t<To>>(x), real_t<To>(0));
  } else {
    static_assert(not is_complex_v<From>,
                  "Cannot convert a complex scalar to a real scalar");
    return static_cast<To>(static_cast<compute_t<From>>(x));
  }
}

template <typename T>
compute_t<T> widen(const T& x) {
  return convert<compute_t<T>>(x);
}

template <typename T>
compute_real_t<T> real_part(const T& x) {
  if constexpr(is_complex_v<T>)
    return convert<compute_real_t<T>>(x.real());
  else
    return widen(x);
}

template <typename T>
T conj(const T& x) {
  if constexpr(is_complex_v<T>)
    return std::conj(x);
  else
    return x;
}

template <typename T>
compute_real_t<T> abs(const T& x) {
  return std::abs(widen(x));
}

template <typename T>
bool is_finite(const T& x) {
  if constexpr(is_complex_v<T>)
    return is_finite(x.real()) and is_finite(x.imag());
  else
    return std::isfinite(widen(x));
}

}  // namespace detail

}  // namespace davidsonxx
