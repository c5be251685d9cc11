/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <simplex/solve.hpp>

#include <simplex/standard_form.hpp>

namespace lpmip::linear_programming::simplex {

template <typename i_t, typename f_t>
bool is_mip(const user_problem_t<i_t, f_t>& problem)
{
  for (variable_type_t type : problem.var_types) {
    if (type != variable_type_t::CONTINUOUS) { return true; }
  }
  return false;
}

template <typename i_t, typename f_t>
f_t compute_objective(const user_problem_t<i_t, f_t>& problem, const std::vector<f_t>& x)
{
  f_t obj = 0.0;
  for (i_t j = 0; j < problem.num_cols; ++j) {
    obj += problem.objective[j] * x[j];
  }
  return obj;
}

template <typename i_t, typename f_t>
f_t compute_user_objective(const user_problem_t<i_t, f_t>& problem, f_t obj)
{
  return problem.obj_scale * (obj + problem.obj_constant);
}

template <typename i_t, typename f_t>
lp_status_t solve_linear_program_with_bounds(const user_problem_t<i_t, f_t>& user_problem,
                                             const std::vector<f_t>& lower,
                                             const std::vector<f_t>& upper,
                                             const simplex_solver_settings_t<i_t, f_t>& settings,
                                             const timer_t& timer,
                                             lp_solution_t<i_t, f_t>& solution)
{
  solution.iterations = 0;
  lp_problem_t<i_t, f_t> lp;
  if (!convert_user_problem(user_problem, lower, upper, settings, lp)) {
    return lp_status_t::INFEASIBLE;
  }

  std::vector<f_t> x;
  f_t objective;
  const lp_status_t status =
    primal_simplex(lp, settings, timer, x, objective, solution.iterations);
  if (status != lp_status_t::OPTIMAL) { return status; }

  uncrush_primal_solution(lp, x, solution.x);
  solution.objective      = objective;
  solution.user_objective = compute_user_objective(user_problem, objective);
  return lp_status_t::OPTIMAL;
}

template <typename i_t, typename f_t>
lp_status_t solve_linear_program(const user_problem_t<i_t, f_t>& user_problem,
                                 const simplex_solver_settings_t<i_t, f_t>& settings,
                                 lp_solution_t<i_t, f_t>& solution)
{
  timer_t timer(settings.time_limit);
  const lp_status_t status = solve_linear_program_with_bounds(
    user_problem, user_problem.lower, user_problem.upper, settings, timer, solution);
  settings.log.printf("Simplex %s after %ld iterations in %.2f seconds\n",
                      lp_status_to_string(status),
                      static_cast<long>(solution.iterations),
                      timer.elapsed_time());
  if (status == lp_status_t::OPTIMAL) {
    settings.log.printf("Objective %+.8e\n", solution.user_objective);
  }
  return status;
}

#ifdef LPMIP_INSTANTIATE_DOUBLE

template bool is_mip<int, double>(const user_problem_t<int, double>& problem);

template double compute_objective<int, double>(const user_problem_t<int, double>& problem,
                                               const std::vector<double>& x);

template double compute_user_objective<int, double>(const user_problem_t<int, double>& problem,
                                                    double obj);

template lp_status_t solve_linear_program_with_bounds<int, double>(
  const user_problem_t<int, double>& user_problem,
  const std::vector<double>& lower,
  const std::vector<double>& upper,
  const simplex_solver_settings_t<int, double>& settings,
  const timer_t& timer,
  lp_solution_t<int, double>& solution);

template lp_status_t solve_linear_program<int, double>(
  const user_problem_t<int, double>& user_problem,
  const simplex_solver_settings_t<int, double>& settings,
  lp_solution_t<int, double>& solution);

#endif

}  // namespace lpmip::linear_programming::simplex
