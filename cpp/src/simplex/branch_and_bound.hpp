/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/mip_node.hpp>
#include <simplex/simplex_solver_settings.hpp>
#include <simplex/solution.hpp>
#include <simplex/solve.hpp>
#include <simplex/types.hpp>
#include <simplex/user_problem.hpp>

#include <utilities/timer.hpp>

#include <vector>

namespace lpmip::linear_programming::simplex {

enum class mip_status_t {
  OPTIMAL         = 0,  // The optimal integer solution was found
  UNBOUNDED       = 1,  // The problem is unbounded
  INFEASIBLE      = 2,  // The problem is infeasible
  TIME_LIMIT      = 3,  // The solver reached a time limit
  NODE_LIMIT      = 4,  // The maximum number of nodes was reached
  NUMERICAL       = 5,  // The solver encountered a numerical error
  ITERATION_LIMIT = 6,  // An LP relaxation reached the pivot limit
  UNSET           = 7,  // The status is not set
};

const char* mip_status_to_string(mip_status_t status);

template <typename f_t>
bool is_fractional(f_t x, variable_type_t var_type, f_t integer_tol);

/**
 * @brief Depth-first branch-and-bound over the LP relaxations of a user problem.
 *
 * Every node re-solves its own standard form with the bounds inherited along its path. The
 * incumbent is owned by this object and only replaced by a strictly better integer solution.
 */
template <typename i_t, typename f_t>
class branch_and_bound_t {
 public:
  branch_and_bound_t(const user_problem_t<i_t, f_t>& user_problem,
                     const simplex_solver_settings_t<i_t, f_t>& solver_settings);

  mip_status_t solve(mip_solution_t<i_t, f_t>& solution);

  f_t get_upper_bound() const { return upper_bound_; }
  bool has_incumbent() const { return has_incumbent_; }

 private:
  // Returns the most fractional integer variable, or -1 if x is integer feasible
  i_t select_branch_variable(const std::vector<f_t>& x) const;

  void add_feasible_solution(f_t leaf_objective, const std::vector<f_t>& leaf_solution, i_t depth);

  mip_status_t set_final_solution(mip_solution_t<i_t, f_t>& solution,
                                  mip_status_t status,
                                  f_t lower_bound);

  mip_status_t to_mip_status(lp_status_t lp_status) const;

  // Push the children of a branched node so that the one nearer to the relaxed value is popped
  // first (the down child on an exact half)
  void push_children(i_t down_child, i_t up_child, f_t fractional_val);

  const user_problem_t<i_t, f_t>& original_problem_;
  const simplex_solver_settings_t<i_t, f_t> settings_;
  timer_t timer_;

  search_tree_t<i_t, f_t> search_tree_;
  std::vector<i_t> frontier_;

  std::vector<f_t> incumbent_;
  f_t upper_bound_;
  bool has_incumbent_;

  int64_t nodes_explored_;
  int64_t total_lp_iters_;
  bool numerical_issues_;
};

}  // namespace lpmip::linear_programming::simplex
