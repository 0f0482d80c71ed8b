/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <cstdint>
#include <davidsonxx/types.hpp>
#include <sparsexx/matrix_types/csr_matrix.hpp>
#include <vector>

namespace davidsonxx {

/**
 *  @brief Generate a dense diagonal matrix (N x N, col-major)
 */
std::vector<double> diagonal_matrix(const std::vector<double>& D);

/**
 *  @brief Generate A = B + B**T + I with B(i,j) ~ U(-1,1)
 */
std::vector<double> random_symmetric_matrix(int64_t n, uint64_t seed = 0);

/**
 *  @brief Generate A = diag(1,2,...,n) + scale * (B + B**T), B(i,j) ~ U(-1,1)
 *
 *  Diagonally dominant for small scale, the regime in which the diagonal
 *  preconditioner is effective.
 */
std::vector<double> diagonally_dominant_matrix(int64_t n, double scale = 1e-2,
                                               uint64_t seed = 0);

/**
 *  @brief Generate the 1D Laplacian tridiag(-1, 2, -1) in CSR format
 */
sparsexx::csr_matrix<double, int32_t> laplacian_1d(int64_t n);

/**
 *  @brief Store the nonzero entries of a dense N x N matrix in CSR format
 */
sparsexx::csr_matrix<double, int32_t> dense_to_csr(int64_t n,
                                                   const std::vector<double>& A);

/**
 *  @brief Exact eigenvalues of laplacian_1d(n), ascending
 *
 *  LAM(k) = 2 - 2 * cos( (k+1) * pi / (n+1) )
 */
std::vector<double> laplacian_1d_eigenvalues(int64_t n);

/**
 *  @brief Round a double precision matrix to scalar type T
 */
template <typename T>
std::vector<T> cast_matrix(const std::vector<double>& A) {
  std::vector<T> A_T(A.size());
  for(size_t i = 0; i < A.size(); ++i) A_T[i] = detail::convert<T>(A[i]);
  return A_T;
}

}  // namespace davidsonxx
