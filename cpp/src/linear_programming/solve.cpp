/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <lpmip/error.hpp>
#include <lpmip/linear_programming/solve.hpp>
#include <lpmip/logger.hpp>

#include <linear_programming/translate.hpp>
#include <linear_programming/utilities/logger_init.hpp>

#include <simplex/branch_and_bound.hpp>
#include <simplex/gaussian_elimination.hpp>
#include <simplex/solve.hpp>

#include <utilities/timer.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <new>
#include <utility>
#include <vector>

namespace lpmip::linear_programming {

namespace {

termination_status_t to_termination_status(simplex::lp_status_t status)
{
  switch (status) {
    case simplex::lp_status_t::OPTIMAL: return termination_status_t::Optimal;
    case simplex::lp_status_t::INFEASIBLE: return termination_status_t::Infeasible;
    case simplex::lp_status_t::UNBOUNDED: return termination_status_t::Unbounded;
    case simplex::lp_status_t::ITERATION_LIMIT: return termination_status_t::IterationLimit;
    case simplex::lp_status_t::TIME_LIMIT: return termination_status_t::TimeLimit;
    case simplex::lp_status_t::NUMERICAL_ISSUES: return termination_status_t::NumericalError;
    case simplex::lp_status_t::UNSET: return termination_status_t::NoTermination;
  }
  return termination_status_t::NoTermination;
}

termination_status_t to_termination_status(simplex::mip_status_t status)
{
  switch (status) {
    case simplex::mip_status_t::OPTIMAL: return termination_status_t::Optimal;
    case simplex::mip_status_t::INFEASIBLE: return termination_status_t::Infeasible;
    case simplex::mip_status_t::UNBOUNDED: return termination_status_t::Unbounded;
    case simplex::mip_status_t::ITERATION_LIMIT: return termination_status_t::IterationLimit;
    case simplex::mip_status_t::TIME_LIMIT: return termination_status_t::TimeLimit;
    case simplex::mip_status_t::NODE_LIMIT: return termination_status_t::NodeLimit;
    case simplex::mip_status_t::NUMERICAL: return termination_status_t::NumericalError;
    case simplex::mip_status_t::UNSET: return termination_status_t::NoTermination;
  }
  return termination_status_t::NoTermination;
}

// Integer variables are snapped to the nearest integer and the objective is re-evaluated on the
// original model, so it carries the user's sign and offset.
template <typename i_t, typename f_t>
solution_t<i_t, f_t> build_solution(const optimization_problem_t<i_t, f_t>& problem,
                                    const simplex::user_problem_t<i_t, f_t>& user_problem,
                                    std::vector<f_t> x,
                                    termination_status_t status,
                                    bool has_incumbent,
                                    f_t internal_bound,
                                    int64_t num_nodes,
                                    int64_t num_iterations,
                                    double solve_time)
{
  const f_t bound = simplex::compute_user_objective(user_problem, internal_bound);
  if (!has_incumbent) {
    return solution_t<i_t, f_t>(std::vector<f_t>{},
                                status,
                                false,
                                std::numeric_limits<f_t>::quiet_NaN(),
                                bound,
                                std::numeric_limits<f_t>::infinity(),
                                num_nodes,
                                num_iterations,
                                solve_time);
  }

  const auto& var_types = problem.get_variable_types();
  const auto& c         = problem.get_objective_coefficients();
  f_t objective         = problem.get_objective_offset();
  for (size_t j = 0; j < x.size(); ++j) {
    if (var_types[j] != var_t::CONTINUOUS) { x[j] = std::round(x[j]); }
    objective += c[j] * x[j];
  }

  f_t mip_gap = std::numeric_limits<f_t>::infinity();
  if (std::isfinite(bound)) {
    mip_gap = std::abs(objective - bound) / std::max<f_t>(std::abs(objective), 1e-10);
  }
  return solution_t<i_t, f_t>(std::move(x),
                              status,
                              true,
                              objective,
                              bound,
                              mip_gap,
                              num_nodes,
                              num_iterations,
                              solve_time);
}

}  // namespace

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve(const optimization_problem_t<i_t, f_t>& problem,
                           const solver_settings_t<i_t, f_t>& settings)
{
  // Outlives the try block so that errors are logged to the requested sinks
  init_logger_t log(settings.log_file, settings.log_to_console);
  try {
    timer_t timer(settings.time_limit);

    problem.check_problem();
    const auto user_problem     = lpmip_problem_to_simplex_problem(problem);
    const auto simplex_settings = lpmip_settings_to_simplex_settings(settings);
    const i_t n                 = problem.get_n_variables();

    LPMIP_LOG_INFO("Solving a problem with %d constraints, %d variables (%d integers) and %d "
                   "nonzeros",
                   problem.get_n_constraints(),
                   n,
                   problem.get_n_integers(),
                   problem.get_nnz());

    if (!problem.has_objective()) {
      lpmip_expects(problem.get_n_integers() == 0,
                    error_type_t::ValidationError,
                    "A problem with integer variables requires an objective");
      std::vector<f_t> x;
      const auto status = simplex::gaussian_elimination(user_problem, simplex_settings, x);
      const bool found  = status == simplex::lp_status_t::OPTIMAL;
      const f_t bound   = found ? simplex::compute_objective(user_problem, x) : f_t(0);
      return build_solution(problem,
                            user_problem,
                            std::move(x),
                            to_termination_status(status),
                            found,
                            bound,
                            0,
                            0,
                            timer.elapsed_time());
    }

    if (!simplex::is_mip(user_problem)) {
      simplex::lp_solution_t<i_t, f_t> lp_solution(n);
      const auto status = simplex::solve_linear_program(user_problem, simplex_settings, lp_solution);
      const bool found  = status == simplex::lp_status_t::OPTIMAL;
      return build_solution(problem,
                            user_problem,
                            std::move(lp_solution.x),
                            to_termination_status(status),
                            found,
                            found ? lp_solution.objective : -simplex::inf,
                            0,
                            lp_solution.iterations,
                            timer.elapsed_time());
    }

    simplex::branch_and_bound_t<i_t, f_t> branch_and_bound(user_problem, simplex_settings);
    simplex::mip_solution_t<i_t, f_t> mip_solution(n);
    const auto status = branch_and_bound.solve(mip_solution);
    return build_solution(problem,
                          user_problem,
                          std::move(mip_solution.x),
                          to_termination_status(status),
                          mip_solution.has_incumbent,
                          mip_solution.lower_bound,
                          mip_solution.nodes_explored,
                          mip_solution.simplex_iterations,
                          timer.elapsed_time());
  } catch (const lpmip::logic_error& e) {
    LPMIP_LOG_ERROR("Error in solve: %s", e.what());
    return solution_t<i_t, f_t>{e};
  } catch (const std::bad_alloc& e) {
    LPMIP_LOG_ERROR("Error in solve: %s", e.what());
    return solution_t<i_t, f_t>{
      lpmip::logic_error("Memory allocation failed", lpmip::error_type_t::RuntimeError)};
  }
}

#if LPMIP_INSTANTIATE_DOUBLE
template solution_t<int, double> solve(const optimization_problem_t<int, double>& problem,
                                       const solver_settings_t<int, double>& settings);
#endif

}  // namespace lpmip::linear_programming
