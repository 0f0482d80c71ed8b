/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#include <cmath>
#include <davidsonxx/exceptions.hpp>
#include <davidsonxx/model/model_problems.hpp>
#include <random>

namespace davidsonxx {

namespace {

// B + B**T for B(i,j) ~ U(-1,1)
std::vector<double> random_symmetric_part(int64_t n, uint64_t seed) {
  std::mt19937_64 gen(seed);
  std::uniform_real_distribution<double> dist(-1., 1.);

  std::vector<double> B(n * n);
  for(auto& b : B) b = dist(gen);

  std::vector<double> A(n * n);
  for(int64_t j = 0; j < n; ++j)
    for(int64_t i = 0; i < n; ++i) A[i + j * n] = B[i + j * n] + B[j + i * n];
  return A;
}

}  // namespace

std::vector<double> diagonal_matrix(const std::vector<double>& D) {
  const int64_t n = D.size();
  std::vector<double> A(n * n, 0.);
  for(int64_t i = 0; i < n; ++i) A[i * (n + 1)] = D[i];
  return A;
}

std::vector<double> random_symmetric_matrix(int64_t n, uint64_t seed) {
  if(n < 1) throw invalid_input("Matrix Dimension Must Be > 0");
  auto A = random_symmetric_part(n, seed);
  for(int64_t i = 0; i < n; ++i) A[i * (n + 1)] += 1.;
  return A;
}

std::vector<double> diagonally_dominant_matrix(int64_t n, double scale,
                                               uint64_t seed) {
  if(n < 1) throw invalid_input("Matrix Dimension Must Be > 0");
  auto A = random_symmetric_part(n, seed);
  for(auto& a : A) a *= scale;
  for(int64_t i = 0; i < n; ++i) A[i * (n + 1)] += double(i + 1);
  return A;
}

sparsexx::csr_matrix<double, int32_t> laplacian_1d(int64_t n) {
  if(n < 1) throw invalid_input("Matrix Dimension Must Be > 0");

  std::vector<int32_t> colind, rowptr(n + 1);
  std::vector<double> nzval;
  colind.reserve(3 * n);
  nzval.reserve(3 * n);

  rowptr[0] = 0;
  for(int64_t i = 0; i < n; ++i) {
    if(i > 0) {
      colind.emplace_back(i - 1);
      nzval.emplace_back(-1.);
    }
    colind.emplace_back(i);
    nzval.emplace_back(2.);
    if(i < n - 1) {
      colind.emplace_back(i + 1);
      nzval.emplace_back(-1.);
    }
    rowptr[i + 1] = colind.size();
  }

  return sparsexx::csr_matrix<double, int32_t>(
      n, n, std::move(rowptr), std::move(colind), std::move(nzval));
}

sparsexx::csr_matrix<double, int32_t> dense_to_csr(
    int64_t n, const std::vector<double>& A) {
  if(A.size() != size_t(n * n)) throw invalid_input("Matrix Size Mismatch");

  std::vector<int32_t> colind, rowptr(n + 1);
  std::vector<double> nzval;

  rowptr[0] = 0;
  for(int64_t i = 0; i < n; ++i) {
    for(int64_t j = 0; j < n; ++j) {
      const auto a = A[i + j * n];
      if(a != 0.) {
        colind.emplace_back(j);
        nzval.emplace_back(a);
      }
    }
    rowptr[i + 1] = colind.size();
  }

  return sparsexx::csr_matrix<double, int32_t>(
      n, n, std::move(rowptr), std::move(colind), std::move(nzval));
}

std::vector<double> laplacian_1d_eigenvalues(int64_t n) {
  std::vector<double> lam(n);
  for(int64_t k = 0; k < n; ++k)
    lam[k] = 2. - 2. * std::cos((k + 1) * M_PI / (n + 1));
  return lam;
}

}  // namespace davidsonxx
