/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/linear_programming/optimization_problem.hpp>
#include <lpmip/linear_programming/solver_settings.hpp>
#include <lpmip/linear_programming/solver_solution.hpp>

namespace lpmip::linear_programming {

/**
 * @brief Solve a linear or mixed integer program.
 *
 * A problem with only continuous variables is solved with the two-phase primal simplex method. A
 * problem with integer variables is solved by branch-and-bound over its LP relaxations. A
 * continuous problem without objective coefficients must be a square system of equalities and
 * is solved by Gaussian elimination.
 *
 * Limits stop the search with the matching termination status and keep the best assignment found
 * so far. Invalid input is reported through `solution_t::get_error_status()` with the
 * `NoTermination` status rather than thrown.
 *
 * @tparam i_t Integer type. int32_t is supported.
 * @tparam f_t Floating point type. double is supported.
 * @param[in] problem The problem to solve
 * @param[in] settings Tolerances, limits and logging options
 * @return solution_t<i_t, f_t> owning the assignment and the termination status
 */
template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve(const optimization_problem_t<i_t, f_t>& problem,
                           const solver_settings_t<i_t, f_t>& settings = solver_settings_t<i_t, f_t>{});

}  // namespace lpmip::linear_programming
