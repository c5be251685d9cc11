/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/primal.hpp>
#include <simplex/simplex_solver_settings.hpp>
#include <simplex/types.hpp>
#include <simplex/user_problem.hpp>

#include <vector>

namespace lpmip::linear_programming::simplex {

/**
 * @brief Solve a square system of equality constraints A x = b with partial pivoting.
 *
 * The variable bounds are checked after the solve: a solution outside them is INFEASIBLE.
 *
 * @throws lpmip::logic_error (ValidationError) if a row is not an equality or the system is not
 * square, and (RuntimeError) if the rows are linearly dependent.
 */
template <typename i_t, typename f_t>
lp_status_t gaussian_elimination(const user_problem_t<i_t, f_t>& user_problem,
                                 const simplex_solver_settings_t<i_t, f_t>& settings,
                                 std::vector<f_t>& x);

}  // namespace lpmip::linear_programming::simplex
