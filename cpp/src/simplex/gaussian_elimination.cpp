/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <simplex/gaussian_elimination.hpp>

#include <simplex/dense_matrix.hpp>

#include <lpmip/error.hpp>

#include <cmath>
#include <utility>

namespace lpmip::linear_programming::simplex {

template <typename i_t, typename f_t>
lp_status_t gaussian_elimination(const user_problem_t<i_t, f_t>& user_problem,
                                 const simplex_solver_settings_t<i_t, f_t>& settings,
                                 std::vector<f_t>& x)
{
  const i_t m = user_problem.num_rows;
  const i_t n = user_problem.num_cols;
  for (i_t i = 0; i < m; ++i) {
    lpmip_expects(user_problem.row_sense[i] == 'E',
                  error_type_t::ValidationError,
                  "Constraint %d is an inequality. A problem without objective must only contain "
                  "equality constraints",
                  static_cast<int>(i));
  }
  lpmip_expects(m == n,
                error_type_t::ValidationError,
                "A problem without objective must be a square system. It has %d constraints and "
                "%d variables",
                static_cast<int>(m),
                static_cast<int>(n));

  dense_matrix_t<i_t, f_t> M(n, n);
  std::vector<f_t> b = user_problem.rhs;
  for (i_t i = 0; i < m; ++i) {
    for (i_t p = user_problem.A.row_start[i]; p < user_problem.A.row_start[i + 1]; ++p) {
      M(i, user_problem.A.j[p]) = user_problem.A.x[p];
    }
  }

  // Forward elimination with partial pivoting
  for (i_t k = 0; k < n; ++k) {
    i_t pivot_row = k;
    for (i_t i = k + 1; i < n; ++i) {
      if (std::abs(M(i, k)) > std::abs(M(pivot_row, k))) { pivot_row = i; }
    }
    if (std::abs(M(pivot_row, k)) < settings.pivot_tol) {
      LPMIP_FAIL("The constraints are linearly dependent. No unique solution for variable %d",
                 static_cast<int>(k));
    }
    if (pivot_row != k) {
      for (i_t j = k; j < n; ++j) {
        std::swap(M(k, j), M(pivot_row, j));
      }
      std::swap(b[k], b[pivot_row]);
    }
    for (i_t i = k + 1; i < n; ++i) {
      const f_t factor = M(i, k) / M(k, k);
      if (factor == 0.0) { continue; }
      for (i_t j = k; j < n; ++j) {
        M(i, j) -= factor * M(k, j);
      }
      b[i] -= factor * b[k];
    }
  }

  // Back substitution
  x.assign(n, 0.0);
  for (i_t k = n - 1; k >= 0; --k) {
    f_t sum = b[k];
    for (i_t j = k + 1; j < n; ++j) {
      sum -= M(k, j) * x[j];
    }
    x[k] = sum / M(k, k);
  }

  for (i_t j = 0; j < n; ++j) {
    if (x[j] < user_problem.lower[j] - settings.tolerance ||
        x[j] > user_problem.upper[j] + settings.tolerance) {
      settings.log.printf("Solution of the linear system violates the bounds of variable %d\n", j);
      return lp_status_t::INFEASIBLE;
    }
  }
  settings.log.debug("Solved %d x %d system by Gaussian elimination\n", n, n);
  return lp_status_t::OPTIMAL;
}

#ifdef LPMIP_INSTANTIATE_DOUBLE

template lp_status_t gaussian_elimination<int, double>(
  const user_problem_t<int, double>& user_problem,
  const simplex_solver_settings_t<int, double>& settings,
  std::vector<double>& x);

#endif

}  // namespace lpmip::linear_programming::simplex
