/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <simplex/tableau.hpp>

#include <lpmip/error.hpp>

#include <cmath>

namespace lpmip::linear_programming::simplex {

template <typename i_t, typename f_t>
tableau_t<i_t, f_t>::tableau_t(const dense_matrix_t<i_t, f_t>& A,
                               const std::vector<f_t>& b,
                               const std::vector<i_t>& basis,
                               f_t pivot_tol)
  : A_(A),
    rhs_(b),
    basis_(basis),
    reduced_costs_(A.n, 0.0),
    objective_(0.0),
    pivot_tol_(pivot_tol)
{
  LPMIP_EXPECTS(static_cast<i_t>(b.size()) == A.m, "Right-hand side size does not match A");
  LPMIP_EXPECTS(static_cast<i_t>(basis.size()) == A.m, "Basis size does not match A");
  for (i_t i = 0; i < A_.m; ++i) {
    const i_t j = basis_[i];
    LPMIP_EXPECTS(j >= 0 && j < A_.n, "Basic column %d out of range", static_cast<int>(j));
    try {
      pivot(j, i);
    } catch (const degenerate_pivot_error& e) {
      LPMIP_FAIL("Singular initial basis: %s", e.what());
    }
  }
}

template <typename i_t, typename f_t>
void tableau_t<i_t, f_t>::pivot(i_t entering_column, i_t leaving_row)
{
  const i_t m     = A_.m;
  const i_t n     = A_.n;
  const f_t alpha = A_(leaving_row, entering_column);
  if (std::abs(alpha) < pivot_tol_) {
    throw degenerate_pivot_error("Pivot element " + std::to_string(alpha) + " in row " +
                                   std::to_string(leaving_row) + " column " +
                                   std::to_string(entering_column) + " is below tolerance",
                                 static_cast<int>(entering_column),
                                 static_cast<int>(leaving_row));
  }

  // Scale the leaving row so the pivot element becomes one
  for (i_t j = 0; j < n; ++j) {
    A_(leaving_row, j) /= alpha;
  }
  rhs_[leaving_row] /= alpha;
  A_(leaving_row, entering_column) = 1.0;

  // Eliminate the entering column from the other rows
  for (i_t i = 0; i < m; ++i) {
    if (i == leaving_row) { continue; }
    const f_t factor = A_(i, entering_column);
    if (factor == 0.0) { continue; }
    for (i_t j = 0; j < n; ++j) {
      A_(i, j) -= factor * A_(leaving_row, j);
    }
    rhs_[i] -= factor * rhs_[leaving_row];
    A_(i, entering_column) = 0.0;
  }

  const f_t d_q = reduced_costs_[entering_column];
  if (d_q != 0.0) {
    for (i_t j = 0; j < n; ++j) {
      reduced_costs_[j] -= d_q * A_(leaving_row, j);
    }
    objective_ += d_q * rhs_[leaving_row];
  }
  reduced_costs_[entering_column] = 0.0;

  basis_[leaving_row] = entering_column;
}

template <typename i_t, typename f_t>
void tableau_t<i_t, f_t>::set_objective(const std::vector<f_t>& c)
{
  LPMIP_EXPECTS(static_cast<i_t>(c.size()) == A_.n, "Cost vector size does not match A");
  reduced_costs_ = c;
  objective_     = 0.0;
  for (i_t i = 0; i < A_.m; ++i) {
    const f_t c_b = c[basis_[i]];
    if (c_b == 0.0) { continue; }
    for (i_t j = 0; j < A_.n; ++j) {
      reduced_costs_[j] -= c_b * A_(i, j);
    }
    objective_ += c_b * rhs_[i];
  }
  for (i_t i = 0; i < A_.m; ++i) {
    reduced_costs_[basis_[i]] = 0.0;
  }
}

template <typename i_t, typename f_t>
std::vector<f_t> tableau_t<i_t, f_t>::current_solution() const
{
  std::vector<f_t> x(A_.n, 0.0);
  for (i_t i = 0; i < A_.m; ++i) {
    x[basis_[i]] = rhs_[i];
  }
  return x;
}

template <typename i_t, typename f_t>
void tableau_t<i_t, f_t>::remove_row(i_t row)
{
  A_.remove_row(row);
  rhs_.erase(rhs_.begin() + row);
  basis_.erase(basis_.begin() + row);
}

#ifdef LPMIP_INSTANTIATE_DOUBLE
template class tableau_t<int, double>;
#endif

}  // namespace lpmip::linear_programming::simplex
