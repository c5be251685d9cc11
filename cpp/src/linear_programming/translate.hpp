/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/linear_programming/optimization_problem.hpp>
#include <lpmip/linear_programming/solver_settings.hpp>

#include <simplex/simplex_solver_settings.hpp>
#include <simplex/user_problem.hpp>

#include <algorithm>

namespace lpmip::linear_programming {

template <typename i_t, typename f_t>
static simplex::user_problem_t<i_t, f_t> lpmip_problem_to_simplex_problem(
  const optimization_problem_t<i_t, f_t>& model)
{
  simplex::user_problem_t<i_t, f_t> user_problem;

  const i_t m           = model.get_n_constraints();
  const i_t n           = model.get_n_variables();
  const f_t scale       = model.get_sense() ? -1.0 : 1.0;
  user_problem.num_rows = m;
  user_problem.num_cols = n;

  // The simplex always minimizes
  user_problem.objective = model.get_objective_coefficients();
  for (f_t& c : user_problem.objective) {
    c *= scale;
  }
  user_problem.obj_scale    = scale;
  user_problem.obj_constant = scale * model.get_objective_offset();

  user_problem.A.m         = m;
  user_problem.A.n         = n;
  user_problem.A.row_start = model.get_constraint_matrix_offsets();
  user_problem.A.j         = model.get_constraint_matrix_indices();
  user_problem.A.x         = model.get_constraint_matrix_values();

  user_problem.rhs       = model.get_constraint_bounds();
  user_problem.row_sense = model.get_row_types();
  user_problem.lower     = model.get_variable_lower_bounds();
  user_problem.upper     = model.get_variable_upper_bounds();

  user_problem.var_types.resize(n);
  const auto& var_types = model.get_variable_types();
  for (i_t j = 0; j < n; ++j) {
    switch (var_types[j]) {
      case var_t::CONTINUOUS:
        user_problem.var_types[j] = simplex::variable_type_t::CONTINUOUS;
        break;
      case var_t::INTEGER: user_problem.var_types[j] = simplex::variable_type_t::INTEGER; break;
      case var_t::BINARY:
        user_problem.var_types[j] = simplex::variable_type_t::BINARY;
        user_problem.lower[j]     = std::max<f_t>(user_problem.lower[j], 0.0);
        user_problem.upper[j]     = std::min<f_t>(user_problem.upper[j], 1.0);
        break;
    }
  }
  user_problem.problem_name = model.get_problem_name();
  return user_problem;
}

template <typename i_t, typename f_t>
static simplex::simplex_solver_settings_t<i_t, f_t> lpmip_settings_to_simplex_settings(
  const solver_settings_t<i_t, f_t>& settings)
{
  simplex::simplex_solver_settings_t<i_t, f_t> simplex_settings;
  simplex_settings.tolerance       = settings.tolerance;
  simplex_settings.pivot_tol       = settings.pivot_tolerance;
  simplex_settings.integer_tol     = settings.integrality_tolerance;
  simplex_settings.iteration_limit = settings.iteration_limit;
  simplex_settings.node_limit      = settings.node_limit;
  simplex_settings.time_limit      = settings.time_limit;
  return simplex_settings;
}

}  // namespace lpmip::linear_programming
