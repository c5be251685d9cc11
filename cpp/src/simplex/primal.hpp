/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/simplex_solver_settings.hpp>
#include <simplex/standard_form.hpp>
#include <simplex/tableau.hpp>
#include <simplex/types.hpp>

#include <utilities/timer.hpp>

#include <vector>

namespace lpmip::linear_programming::simplex {

enum class lp_status_t {
  OPTIMAL          = 0,
  INFEASIBLE       = 1,
  UNBOUNDED        = 2,
  ITERATION_LIMIT  = 3,
  TIME_LIMIT       = 4,
  NUMERICAL_ISSUES = 5,
  UNSET            = 6
};

const char* lp_status_to_string(lp_status_t status);

/**
 * @brief Pivot until no column allowed by `eligible` has a negative reduced cost.
 *
 * Entering column by Dantzig's rule, switching to Bland's rule after settings.bland_switch
 * consecutive pivots that do not move the solution. Leaving row by the minimum ratio test with
 * ties to the lowest row. `iterations` counts pivots and is compared with the iteration limit.
 *
 * @return OPTIMAL, UNBOUNDED, ITERATION_LIMIT, TIME_LIMIT or NUMERICAL_ISSUES
 */
template <typename i_t, typename f_t>
lp_status_t primal_iterations(tableau_t<i_t, f_t>& tableau,
                              const std::vector<bool>& eligible,
                              const simplex_solver_settings_t<i_t, f_t>& settings,
                              const timer_t& timer,
                              int64_t& iterations);

/**
 * @brief Two-phase primal simplex on a problem in standard form.
 *
 * On OPTIMAL, `x` holds the value of every standard form column and `objective` is
 * c^T x + lp.obj_constant.
 */
template <typename i_t, typename f_t>
lp_status_t primal_simplex(const lp_problem_t<i_t, f_t>& lp,
                           const simplex_solver_settings_t<i_t, f_t>& settings,
                           const timer_t& timer,
                           std::vector<f_t>& x,
                           f_t& objective,
                           int64_t& iterations);

}  // namespace lpmip::linear_programming::simplex
