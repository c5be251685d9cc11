/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <simplex/standard_form.hpp>

#include <cmath>

namespace lpmip::linear_programming::simplex {

template <typename i_t, typename f_t>
bool convert_user_problem(const user_problem_t<i_t, f_t>& user_problem,
                          const std::vector<f_t>& lower,
                          const std::vector<f_t>& upper,
                          const simplex_solver_settings_t<i_t, f_t>& settings,
                          lp_problem_t<i_t, f_t>& problem)
{
  const i_t n      = user_problem.num_cols;
  const i_t m_user = user_problem.num_rows;

  for (i_t j = 0; j < n; ++j) {
    if (lower[j] > upper[j]) {
      settings.log.debug("Variable %d has lower bound %e > upper bound %e\n", j, lower[j], upper[j]);
      return false;
    }
  }

  problem.col_plus.assign(n, -1);
  problem.col_minus.assign(n, -1);
  problem.sign.assign(n, 1.0);
  problem.offset.assign(n, 0.0);

  // Substitute every user variable with non-negative columns
  i_t num_structural = 0;
  std::vector<i_t> bounded_vars;
  for (i_t j = 0; j < n; ++j) {
    const bool has_lower = std::isfinite(lower[j]);
    const bool has_upper = std::isfinite(upper[j]);
    problem.col_plus[j]  = num_structural++;
    if (has_lower) {
      problem.offset[j] = lower[j];
      if (has_upper) { bounded_vars.push_back(j); }
    } else if (has_upper) {
      problem.sign[j]   = -1.0;
      problem.offset[j] = upper[j];
    } else {
      problem.col_minus[j] = num_structural++;
    }
  }

  const i_t m = m_user + static_cast<i_t>(bounded_vars.size());
  dense_matrix_t<i_t, f_t> S(m, num_structural);
  std::vector<f_t> b(m);
  std::vector<char> row_sense(m);

  for (i_t i = 0; i < m_user; ++i) {
    b[i]         = user_problem.rhs[i];
    row_sense[i] = user_problem.row_sense[i];
    for (i_t p = user_problem.A.row_start[i]; p < user_problem.A.row_start[i + 1]; ++p) {
      const i_t j = user_problem.A.j[p];
      const f_t a = user_problem.A.x[p];
      S(i, problem.col_plus[j]) += a * problem.sign[j];
      if (problem.col_minus[j] >= 0) { S(i, problem.col_minus[j]) -= a; }
      b[i] -= a * problem.offset[j];
    }
  }
  for (size_t k = 0; k < bounded_vars.size(); ++k) {
    const i_t i               = m_user + static_cast<i_t>(k);
    const i_t j               = bounded_vars[k];
    S(i, problem.col_plus[j]) = 1.0;
    b[i]                      = upper[j] - lower[j];
    row_sense[i]              = 'L';
  }

  // Make the right-hand side non-negative
  i_t num_slack      = 0;
  i_t num_artificial = 0;
  for (i_t i = 0; i < m; ++i) {
    if (b[i] < 0) {
      b[i] = -b[i];
      for (i_t k = 0; k < num_structural; ++k) {
        S(i, k) = -S(i, k);
      }
      if (row_sense[i] == 'L') {
        row_sense[i] = 'G';
      } else if (row_sense[i] == 'G') {
        row_sense[i] = 'L';
      }
    }
    if (row_sense[i] == 'L') {
      num_slack++;
    } else if (row_sense[i] == 'G') {
      num_slack++;
      num_artificial++;
    } else {
      num_artificial++;
    }
  }

  problem.num_rows       = m;
  problem.num_structural = num_structural;
  problem.num_artificial = num_artificial;
  problem.num_cols       = num_structural + num_slack + num_artificial;
  problem.A.resize(m, problem.num_cols);
  problem.rhs = b;
  problem.basis.assign(m, -1);

  for (i_t k = 0; k < num_structural; ++k) {
    for (i_t i = 0; i < m; ++i) {
      problem.A(i, k) = S(i, k);
    }
  }

  i_t slack_col      = num_structural;
  i_t artificial_col = num_structural + num_slack;
  for (i_t i = 0; i < m; ++i) {
    if (row_sense[i] == 'L') {
      problem.A(i, slack_col) = 1.0;
      problem.basis[i]        = slack_col++;
    } else if (row_sense[i] == 'G') {
      problem.A(i, slack_col++)    = -1.0;
      problem.A(i, artificial_col) = 1.0;
      problem.basis[i]             = artificial_col++;
    } else {
      problem.A(i, artificial_col) = 1.0;
      problem.basis[i]             = artificial_col++;
    }
  }

  problem.objective.assign(problem.num_cols, 0.0);
  problem.obj_constant = 0.0;
  problem.obj_scale    = user_problem.obj_scale;
  for (i_t j = 0; j < n; ++j) {
    const f_t c = user_problem.objective[j];
    problem.objective[problem.col_plus[j]] += c * problem.sign[j];
    if (problem.col_minus[j] >= 0) { problem.objective[problem.col_minus[j]] -= c; }
    problem.obj_constant += c * problem.offset[j];
  }

  settings.log.debug("Standard form: %d rows %d columns (%d structural, %d slack, %d artificial)\n",
                     m,
                     problem.num_cols,
                     num_structural,
                     num_slack,
                     num_artificial);
  return true;
}

template <typename i_t, typename f_t>
void uncrush_primal_solution(const lp_problem_t<i_t, f_t>& problem,
                             const std::vector<f_t>& solution,
                             std::vector<f_t>& user_solution)
{
  const i_t n = static_cast<i_t>(problem.col_plus.size());
  user_solution.resize(n);
  for (i_t j = 0; j < n; ++j) {
    f_t value = problem.offset[j] + problem.sign[j] * solution[problem.col_plus[j]];
    if (problem.col_minus[j] >= 0) { value -= solution[problem.col_minus[j]]; }
    user_solution[j] = value;
  }
}

#ifdef LPMIP_INSTANTIATE_DOUBLE

template bool convert_user_problem<int, double>(const user_problem_t<int, double>& user_problem,
                                                const std::vector<double>& lower,
                                                const std::vector<double>& upper,
                                                const simplex_solver_settings_t<int, double>& settings,
                                                lp_problem_t<int, double>& problem);

template void uncrush_primal_solution<int, double>(const lp_problem_t<int, double>& problem,
                                                   const std::vector<double>& solution,
                                                   std::vector<double>& user_solution);

#endif

}  // namespace lpmip::linear_programming::simplex
