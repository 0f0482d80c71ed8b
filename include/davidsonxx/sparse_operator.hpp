/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#pragma once
#include <davidsonxx/operator.hpp>
#include <sparsexx/matrix_types/csr_matrix.hpp>
#include <sparsexx/spblas/spmbv.hpp>
#include <sparsexx/util/submatrix.hpp>

namespace davidsonxx {

/**
 *  @brief Non-owning view of a sparsexx sparse matrix
 */
template <typename SpMatType>
class SparseMatrixOperator {
  const SpMatType& m_matrix_;

 public:
  using value_type = typename SpMatType::value_type;

  SparseMatrixOperator(const SpMatType& m) : m_matrix_(m) {
    if(m_matrix_.m() != m_matrix_.n())
      throw std::runtime_error("SparseMatrixOperator: Matrix Is Not Square");
  }

  int64_t rows() const { return m_matrix_.m(); }
  const SpMatType& matrix() const { return m_matrix_; }

  void operator_action(int64_t K, value_type alpha, const value_type* V,
                       int64_t LDV, value_type beta, value_type* AV,
                       int64_t LDAV) const {
    sparsexx::spblas::gespmbv(K, alpha, m_matrix_, V, LDV, beta, AV, LDAV);
  }
};

/**
 *  @brief Diagonal of a sparse matrix (zero where not stored)
 */
template <typename SpMatType>
auto extract_diagonal(const SparseMatrixOperator<SpMatType>& op) {
  return sparsexx::extract_diagonal_elements(op.matrix());
}

}  // namespace davidsonxx
