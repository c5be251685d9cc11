/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/dense_matrix.hpp>
#include <simplex/types.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace lpmip::linear_programming::simplex {

// Raised by tableau_t::pivot when the pivot element is numerically zero. The tableau is unchanged.
class degenerate_pivot_error : public std::runtime_error {
 public:
  degenerate_pivot_error(const std::string& message, int column, int row)
    : std::runtime_error(message), column_(column), row_(row)
  {
  }

  int column() const noexcept { return column_; }
  int row() const noexcept { return row_; }

 private:
  int column_;
  int row_;
};

/**
 * @brief Dense simplex tableau for A x = b, x >= 0.
 *
 * Holds B^{-1} A, B^{-1} b, the basis (row to column) and the reduced cost row
 * d = c - c_B^T B^{-1} A for the installed objective. After construction and after every pivot the
 * basic column of each row is the unit vector of that row.
 */
template <typename i_t, typename f_t>
class tableau_t {
 public:
  /**
   * @brief Canonicalize A x = b with respect to `basis` (one column per row).
   *
   * @throws lpmip::logic_error if the named basis is singular.
   */
  tableau_t(const dense_matrix_t<i_t, f_t>& A,
            const std::vector<f_t>& b,
            const std::vector<i_t>& basis,
            f_t pivot_tol);

  /**
   * @brief Make `entering_column` basic in `leaving_row`.
   *
   * @throws degenerate_pivot_error if |a(leaving_row, entering_column)| < pivot_tol
   */
  void pivot(i_t entering_column, i_t leaving_row);

  // Install the cost vector c and price out the basic columns
  void set_objective(const std::vector<f_t>& c);

  const std::vector<f_t>& reduced_costs() const { return reduced_costs_; }

  // Basic columns take the right-hand side of their row, the others are zero
  std::vector<f_t> current_solution() const;

  // c_B^T x_B for the installed cost vector
  f_t objective() const { return objective_; }

  // Drop a redundant row together with its basic column's membership in the basis
  void remove_row(i_t row);

  f_t operator()(i_t row, i_t col) const { return A_(row, col); }

  i_t num_rows() const { return A_.m; }
  i_t num_cols() const { return A_.n; }
  const std::vector<i_t>& basis() const { return basis_; }
  const std::vector<f_t>& rhs() const { return rhs_; }

 private:
  dense_matrix_t<i_t, f_t> A_;
  std::vector<f_t> rhs_;
  std::vector<i_t> basis_;
  std::vector<f_t> reduced_costs_;
  f_t objective_;
  f_t pivot_tol_;
};

}  // namespace lpmip::linear_programming::simplex
