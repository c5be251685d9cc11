/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/dense_matrix.hpp>
#include <simplex/simplex_solver_settings.hpp>
#include <simplex/types.hpp>
#include <simplex/user_problem.hpp>

#include <vector>

namespace lpmip::linear_programming::simplex {

// min c^T x + obj_constant  s.t.  A x = b, x >= 0, b >= 0
//
// Columns are ordered structural, then slack/surplus, then artificial. basis[i] names the slack
// or artificial column that gives row i a feasible starting point.
template <typename i_t, typename f_t>
struct lp_problem_t {
  lp_problem_t()
    : num_rows(0),
      num_cols(0),
      num_structural(0),
      num_artificial(0),
      A(0, 0),
      obj_constant(0.0),
      obj_scale(1.0)
  {
  }

  bool is_artificial(i_t j) const { return j >= num_cols - num_artificial; }

  i_t num_rows;
  i_t num_cols;
  i_t num_structural;
  i_t num_artificial;
  dense_matrix_t<i_t, f_t> A;
  std::vector<f_t> rhs;
  std::vector<f_t> objective;
  std::vector<i_t> basis;
  f_t obj_constant;
  f_t obj_scale;  // 1.0 for min, -1.0 for max

  // For every user variable x_j = offset[j] + sign[j] * x[col_plus[j]] - x[col_minus[j]], where
  // col_minus[j] is -1 unless x_j is free.
  std::vector<i_t> col_plus;
  std::vector<i_t> col_minus;
  std::vector<f_t> sign;
  std::vector<f_t> offset;
};

/**
 * @brief Build the standard form of `user_problem` with the variable bounds `lower` and `upper`
 * (which replace the bounds stored in the user problem).
 *
 * A variable with a finite lower bound is shifted, x = l + x', and a finite upper bound becomes
 * the row x' <= u - l. A variable bounded only above is reflected, x = u - x'. A free variable is
 * split, x = x+ - x-.
 *
 * @return false if some variable has lower > upper, in which case `problem` is not built.
 */
template <typename i_t, typename f_t>
bool convert_user_problem(const user_problem_t<i_t, f_t>& user_problem,
                          const std::vector<f_t>& lower,
                          const std::vector<f_t>& upper,
                          const simplex_solver_settings_t<i_t, f_t>& settings,
                          lp_problem_t<i_t, f_t>& problem);

// Map a standard form solution back to the user's variables
template <typename i_t, typename f_t>
void uncrush_primal_solution(const lp_problem_t<i_t, f_t>& problem,
                             const std::vector<f_t>& solution,
                             std::vector<f_t>& user_solution);

}  // namespace lpmip::linear_programming::simplex
