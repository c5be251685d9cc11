/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/primal.hpp>
#include <simplex/simplex_solver_settings.hpp>
#include <simplex/solution.hpp>
#include <simplex/types.hpp>
#include <simplex/user_problem.hpp>

#include <utilities/timer.hpp>

#include <vector>

namespace lpmip::linear_programming::simplex {

template <typename i_t, typename f_t>
bool is_mip(const user_problem_t<i_t, f_t>& problem);

template <typename i_t, typename f_t>
f_t compute_objective(const user_problem_t<i_t, f_t>& problem, const std::vector<f_t>& x);

template <typename i_t, typename f_t>
f_t compute_user_objective(const user_problem_t<i_t, f_t>& problem, f_t obj);

// Solve the LP relaxation of `user_problem` with the bounds `lower` and `upper`
template <typename i_t, typename f_t>
lp_status_t solve_linear_program_with_bounds(const user_problem_t<i_t, f_t>& user_problem,
                                             const std::vector<f_t>& lower,
                                             const std::vector<f_t>& upper,
                                             const simplex_solver_settings_t<i_t, f_t>& settings,
                                             const timer_t& timer,
                                             lp_solution_t<i_t, f_t>& solution);

template <typename i_t, typename f_t>
lp_status_t solve_linear_program(const user_problem_t<i_t, f_t>& user_problem,
                                 const simplex_solver_settings_t<i_t, f_t>& settings,
                                 lp_solution_t<i_t, f_t>& solution);

}  // namespace lpmip::linear_programming::simplex
