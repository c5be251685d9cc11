/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <simplex/branch_and_bound.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace lpmip::linear_programming::simplex {

const char* mip_status_to_string(mip_status_t status)
{
  switch (status) {
    case mip_status_t::OPTIMAL: return "optimal";
    case mip_status_t::UNBOUNDED: return "unbounded";
    case mip_status_t::INFEASIBLE: return "infeasible";
    case mip_status_t::TIME_LIMIT: return "time limit";
    case mip_status_t::NODE_LIMIT: return "node limit";
    case mip_status_t::NUMERICAL: return "numerical issues";
    case mip_status_t::ITERATION_LIMIT: return "iteration limit";
    case mip_status_t::UNSET: return "unset";
  }
  return "unknown";
}

template <typename f_t>
bool is_fractional(f_t x, variable_type_t var_type, f_t integer_tol)
{
  if (var_type == variable_type_t::CONTINUOUS) {
    return false;
  } else {
    f_t x_integer = std::round(x);
    return (std::abs(x_integer - x) > integer_tol);
  }
}

template <typename i_t, typename f_t>
branch_and_bound_t<i_t, f_t>::branch_and_bound_t(
  const user_problem_t<i_t, f_t>& user_problem,
  const simplex_solver_settings_t<i_t, f_t>& solver_settings)
  : original_problem_(user_problem),
    settings_(solver_settings),
    timer_(solver_settings.time_limit),
    upper_bound_(inf),
    has_incumbent_(false),
    nodes_explored_(0),
    total_lp_iters_(0),
    numerical_issues_(false)
{
}

template <typename i_t, typename f_t>
i_t branch_and_bound_t<i_t, f_t>::select_branch_variable(const std::vector<f_t>& x) const
{
  i_t branch_var = -1;
  f_t best_score = inf;
  for (i_t j = 0; j < original_problem_.num_cols; ++j) {
    if (!is_fractional(x[j], original_problem_.var_types[j], settings_.integer_tol)) { continue; }
    const f_t score = std::abs(x[j] - std::floor(x[j]) - 0.5);
    if (score < best_score) {
      best_score = score;
      branch_var = j;
    }
  }
  return branch_var;
}

template <typename i_t, typename f_t>
void branch_and_bound_t<i_t, f_t>::add_feasible_solution(f_t leaf_objective,
                                                         const std::vector<f_t>& leaf_solution,
                                                         i_t depth)
{
  if (leaf_objective < upper_bound_) {
    upper_bound_   = leaf_objective;
    incumbent_     = leaf_solution;
    has_incumbent_ = true;
    settings_.log.printf("New incumbent %+.8e at depth %d after %ld nodes\n",
                         compute_user_objective(original_problem_, leaf_objective),
                         depth,
                         static_cast<long>(nodes_explored_));
  }
}

template <typename i_t, typename f_t>
mip_status_t branch_and_bound_t<i_t, f_t>::to_mip_status(lp_status_t lp_status) const
{
  switch (lp_status) {
    case lp_status_t::OPTIMAL: return mip_status_t::OPTIMAL;
    case lp_status_t::INFEASIBLE: return mip_status_t::INFEASIBLE;
    case lp_status_t::UNBOUNDED: return mip_status_t::UNBOUNDED;
    case lp_status_t::ITERATION_LIMIT: return mip_status_t::ITERATION_LIMIT;
    case lp_status_t::TIME_LIMIT: return mip_status_t::TIME_LIMIT;
    case lp_status_t::NUMERICAL_ISSUES: return mip_status_t::NUMERICAL;
    case lp_status_t::UNSET: return mip_status_t::UNSET;
  }
  return mip_status_t::UNSET;
}

template <typename i_t, typename f_t>
void branch_and_bound_t<i_t, f_t>::push_children(i_t down_child, i_t up_child, f_t fractional_val)
{
  const f_t frac = fractional_val - std::floor(fractional_val);
  if (frac <= 0.5) {
    frontier_.push_back(up_child);
    frontier_.push_back(down_child);
  } else {
    frontier_.push_back(down_child);
    frontier_.push_back(up_child);
  }
}

template <typename i_t, typename f_t>
mip_status_t branch_and_bound_t<i_t, f_t>::set_final_solution(mip_solution_t<i_t, f_t>& solution,
                                                              mip_status_t status,
                                                              f_t lower_bound)
{
  solution.lower_bound        = lower_bound;
  solution.nodes_explored     = nodes_explored_;
  solution.simplex_iterations = total_lp_iters_;
  if (has_incumbent_) { solution.set_incumbent_solution(upper_bound_, incumbent_); }

  settings_.log.printf("Explored %ld nodes in %.2fs with %ld simplex iterations\n",
                       static_cast<long>(nodes_explored_),
                       timer_.elapsed_time(),
                       static_cast<long>(total_lp_iters_));
  if (has_incumbent_) {
    settings_.log.printf("Branch-and-bound %s. Objective %+.8e\n",
                         mip_status_to_string(status),
                         compute_user_objective(original_problem_, upper_bound_));
  } else {
    settings_.log.printf("Branch-and-bound %s. No integer solution found\n",
                         mip_status_to_string(status));
  }
  return status;
}

template <typename i_t, typename f_t>
mip_status_t branch_and_bound_t<i_t, f_t>::solve(mip_solution_t<i_t, f_t>& solution)
{
  const i_t n   = original_problem_.num_cols;
  const f_t tol = settings_.tolerance;
  solution.resize(n);

  lp_solution_t<i_t, f_t> root_relax_soln(n);
  settings_.log.printf("Solving LP root relaxation\n");
  const lp_status_t root_status = solve_linear_program_with_bounds(original_problem_,
                                                                   original_problem_.lower,
                                                                   original_problem_.upper,
                                                                   settings_,
                                                                   timer_,
                                                                   root_relax_soln);
  nodes_explored_ = 1;
  total_lp_iters_ = root_relax_soln.iterations;
  if (root_status != lp_status_t::OPTIMAL) {
    settings_.log.printf("Root relaxation %s\n", lp_status_to_string(root_status));
    return set_final_solution(solution, to_mip_status(root_status), -inf);
  }

  const f_t root_objective = root_relax_soln.objective;
  settings_.log.printf("Root relaxation objective %+.8e\n",
                       compute_user_objective(original_problem_, root_objective));

  const i_t root       = search_tree_.create_root(root_objective);
  const i_t branch_var = select_branch_variable(root_relax_soln.x);
  if (branch_var < 0) {
    add_feasible_solution(root_objective, root_relax_soln.x, 0);
    search_tree_.update_tree(root, node_status_t::INTEGER_FEASIBLE);
    return set_final_solution(solution, mip_status_t::OPTIMAL, root_objective);
  }

  const auto [root_down, root_up] = search_tree_.branch(root,
                                                        branch_var,
                                                        root_relax_soln.x[branch_var],
                                                        root_objective,
                                                        original_problem_.lower,
                                                        original_problem_.upper,
                                                        settings_.log);
  push_children(root_down, root_up, root_relax_soln.x[branch_var]);

  mip_status_t status  = mip_status_t::UNSET;
  f_t unresolved_bound = inf;  // Smallest bound of a node dropped without being resolved
  std::vector<f_t> lower;
  std::vector<f_t> upper;
  lp_solution_t<i_t, f_t> leaf_solution(n);

  while (!frontier_.empty()) {
    if (timer_.check_time_limit()) {
      status = mip_status_t::TIME_LIMIT;
      break;
    }
    if (nodes_explored_ >= settings_.node_limit) {
      status = mip_status_t::NODE_LIMIT;
      break;
    }

    const i_t slot       = frontier_.back();
    const f_t node_bound = search_tree_[slot].lower_bound;
    const i_t depth      = search_tree_[slot].depth;
    frontier_.pop_back();

    if (node_bound >= upper_bound_ - tol) {
      search_tree_.update_tree(slot, node_status_t::FATHOMED);
      continue;
    }

    lower = original_problem_.lower;
    upper = original_problem_.upper;
    search_tree_.get_variable_bounds(slot, lower, upper);

    const lp_status_t lp_status = solve_linear_program_with_bounds(
      original_problem_, lower, upper, settings_, timer_, leaf_solution);
    nodes_explored_++;
    total_lp_iters_ += leaf_solution.iterations;

    if (settings_.node_log_frequency > 0 && nodes_explored_ % settings_.node_log_frequency == 0) {
      settings_.log.printf("%10ld nodes %6d open %+.8e incumbent %.2fs\n",
                           static_cast<long>(nodes_explored_),
                           static_cast<int>(frontier_.size()),
                           compute_user_objective(original_problem_, upper_bound_),
                           timer_.elapsed_time());
    }

    if (lp_status == lp_status_t::INFEASIBLE) {
      search_tree_.update_tree(slot, node_status_t::INFEASIBLE);
      continue;
    }
    if (lp_status == lp_status_t::ITERATION_LIMIT || lp_status == lp_status_t::TIME_LIMIT) {
      unresolved_bound = std::min(unresolved_bound, node_bound);
      search_tree_.update_tree(slot,
                               lp_status == lp_status_t::TIME_LIMIT
                                 ? node_status_t::TIME_LIMIT
                                 : node_status_t::ITERATION_LIMIT);
      status = to_mip_status(lp_status);
      break;
    }
    if (lp_status != lp_status_t::OPTIMAL) {
      settings_.log.printf("Node %d LP relaxation %s\n",
                           search_tree_[slot].node_id,
                           lp_status_to_string(lp_status));
      numerical_issues_ = true;
      unresolved_bound  = std::min(unresolved_bound, node_bound);
      search_tree_.update_tree(slot, node_status_t::NUMERICAL);
      continue;
    }

    const f_t leaf_objective = leaf_solution.objective;
    if (leaf_objective >= upper_bound_ - tol) {
      search_tree_.update_tree(slot, node_status_t::FATHOMED);
      continue;
    }

    const i_t j = select_branch_variable(leaf_solution.x);
    if (j < 0) {
      add_feasible_solution(leaf_objective, leaf_solution.x, depth);
      search_tree_.update_tree(slot, node_status_t::INTEGER_FEASIBLE);
      continue;
    }

    const auto [down_child, up_child] = search_tree_.branch(
      slot, j, leaf_solution.x[j], leaf_objective, lower, upper, settings_.log);
    push_children(down_child, up_child, leaf_solution.x[j]);
  }

  if (status == mip_status_t::UNSET) {
    if (numerical_issues_) {
      status = mip_status_t::NUMERICAL;
    } else {
      status = has_incumbent_ ? mip_status_t::OPTIMAL : mip_status_t::INFEASIBLE;
    }
  }

  f_t lower_bound = std::min(upper_bound_, unresolved_bound);
  for (i_t slot : frontier_) {
    lower_bound = std::min(lower_bound, search_tree_[slot].lower_bound);
  }
  return set_final_solution(solution, status, lower_bound);
}

#ifdef LPMIP_INSTANTIATE_DOUBLE

template bool is_fractional<double>(double x, variable_type_t var_type, double integer_tol);

template class branch_and_bound_t<int, double>;

#endif

}  // namespace lpmip::linear_programming::simplex
