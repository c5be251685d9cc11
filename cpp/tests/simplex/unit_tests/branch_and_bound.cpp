/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include "../simplex_test_utils.hpp"

#include <simplex/branch_and_bound.hpp>
#include <simplex/mip_node.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace lpmip::linear_programming::simplex::test {

namespace {

// Negate the objective so that the problem is maximized
void maximize(user_problem_t<int, double>& problem)
{
  for (double& c : problem.objective) {
    c = -c;
  }
  problem.obj_scale = -1.0;
}

void make_binary(user_problem_t<int, double>& problem)
{
  problem.var_types.assign(problem.num_cols, variable_type_t::BINARY);
  problem.lower.assign(problem.num_cols, 0.0);
  problem.upper.assign(problem.num_cols, 1.0);
}

void make_integer(user_problem_t<int, double>& problem)
{
  problem.var_types.assign(problem.num_cols, variable_type_t::INTEGER);
}

user_problem_t<int, double> burglar()
{
  // maximize  sum_i value[i] * take[i]
  //           sum_i weight[i] * take[i] <= 102
  std::vector<double> value({15, 100, 90, 60, 40, 15, 10, 1});
  std::vector<double> weight({2, 20, 20, 30, 40, 30, 60, 10});
  auto problem = make_user_problem({weight}, {'L'}, {102.0}, value);
  maximize(problem);
  make_binary(problem);
  return problem;
}

}  // namespace

TEST(branch_and_bound, binary_equalities)
{
  // maximize x + 2y + 3z subject to x + z = 2, y + z = 2
  auto problem = make_user_problem(
    {{1.0, 0.0, 1.0}, {0.0, 1.0, 1.0}}, {'E', 'E'}, {2.0, 2.0}, {1.0, 2.0, 3.0});
  maximize(problem);
  make_binary(problem);

  const auto settings = quiet_simplex_settings();
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::OPTIMAL);
  ASSERT_TRUE(solution.has_incumbent);
  EXPECT_NEAR(compute_user_objective(problem, solution.objective), 6.0, 1e-9);
  EXPECT_NEAR(solution.x[0], 1.0, 1e-6);
  EXPECT_NEAR(solution.x[1], 1.0, 1e-6);
  EXPECT_NEAR(solution.x[2], 1.0, 1e-6);
}

TEST(branch_and_bound, five_binaries)
{
  auto problem = make_user_problem({{1.0, 1.0, 1.0, 1.0, 1.0},
                                    {3.0, 2.0, 1.0, 1.0, 2.0},
                                    {-2.0, -1.0, -1.0, -3.0, -2.0}},
                                   {'E', 'E', 'E'},
                                   {2.0, 3.0, -4.0},
                                   {4.0, 5.0, 3.0, 4.0, 5.0});
  maximize(problem);
  make_binary(problem);

  const auto settings = quiet_simplex_settings();
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::OPTIMAL);
  EXPECT_NEAR(compute_user_objective(problem, solution.objective), 9.0, 1e-9);
  const std::vector<double> expected{0.0, 1.0, 0.0, 1.0, 0.0};
  for (int j = 0; j < 5; ++j) {
    EXPECT_NEAR(solution.x[j], expected[j], 1e-6);
  }
}

TEST(branch_and_bound, infeasible_binaries)
{
  // x + y = 1 and x + y = 2
  auto problem =
    make_user_problem({{1.0, 1.0}, {1.0, 1.0}}, {'E', 'E'}, {1.0, 2.0}, {1.0, 1.0});
  make_binary(problem);

  const auto settings = quiet_simplex_settings();
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::INFEASIBLE);
  EXPECT_FALSE(solution.has_incumbent);
  EXPECT_FALSE(branch_and_bound.has_incumbent());
}

TEST(branch_and_bound, integral_root)
{
  // maximize x subject to x = 1
  auto problem = make_user_problem({{1.0}}, {'E'}, {1.0}, {1.0});
  maximize(problem);
  make_binary(problem);

  const auto settings = quiet_simplex_settings();
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::OPTIMAL);
  EXPECT_EQ(solution.nodes_explored, 1);
  EXPECT_NEAR(compute_user_objective(problem, solution.objective), 1.0, 1e-9);
}

TEST(branch_and_bound, general_integers)
{
  // maximize 5x + 4y subject to 6x + 4y <= 24, x + 2y <= 6
  // The relaxation is optimal at (3, 1.5)
  auto problem =
    make_user_problem({{6.0, 4.0}, {1.0, 2.0}}, {'L', 'L'}, {24.0, 6.0}, {5.0, 4.0});
  maximize(problem);
  make_integer(problem);

  const auto settings = quiet_simplex_settings();
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::OPTIMAL);
  EXPECT_NEAR(compute_user_objective(problem, solution.objective), 20.0, 1e-9);
  EXPECT_NEAR(solution.x[0], 4.0, 1e-6);
  EXPECT_NEAR(solution.x[1], 0.0, 1e-6);
  EXPECT_GT(solution.nodes_explored, 1);
  EXPECT_NEAR(solution.lower_bound, solution.objective, 1e-9);
}

TEST(branch_and_bound, knapsack)
{
  auto problem        = burglar();
  const auto settings = quiet_simplex_settings();
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::OPTIMAL);
  EXPECT_NEAR(compute_user_objective(problem, solution.objective), 280.0, 1e-9);
  EXPECT_NEAR(branch_and_bound.get_upper_bound(), -280.0, 1e-9);
}

TEST(branch_and_bound, node_limit)
{
  auto problem        = burglar();
  auto settings       = quiet_simplex_settings();
  settings.node_limit = 3;
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::NODE_LIMIT);
  EXPECT_EQ(solution.nodes_explored, 3);
  // The bound never exceeds the incumbent of a minimization
  if (solution.has_incumbent) { EXPECT_LE(solution.lower_bound, solution.objective + 1e-9); }
  EXPECT_LE(solution.lower_bound, -280.0 + 1e-9);
}

TEST(branch_and_bound, root_unbounded)
{
  // maximize x + y subject to x - y <= 1
  auto problem = make_user_problem({{1.0, -1.0}}, {'L'}, {1.0}, {1.0, 1.0});
  maximize(problem);
  make_integer(problem);

  const auto settings = quiet_simplex_settings();
  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::UNBOUNDED);
  EXPECT_FALSE(solution.has_incumbent);
}

TEST(branch_and_bound, continuous_problem_is_not_branched)
{
  auto problem = make_user_problem(
    {{3.0, 2.0, 1.0}, {2.0, 5.0, 3.0}}, {'L', 'L'}, {10.0, 15.0}, {-2.0, -3.0, -4.0});
  const auto settings = quiet_simplex_settings();

  lp_solution_t<int, double> relaxation(problem.num_cols);
  ASSERT_EQ(solve_linear_program(problem, settings, relaxation), lp_status_t::OPTIMAL);

  mip_solution_t<int, double> solution(problem.num_cols);
  branch_and_bound_t<int, double> branch_and_bound(problem, settings);
  EXPECT_EQ(branch_and_bound.solve(solution), mip_status_t::OPTIMAL);
  EXPECT_EQ(solution.nodes_explored, 1);
  EXPECT_EQ(solution.x, relaxation.x);
  EXPECT_DOUBLE_EQ(solution.objective, relaxation.objective);
}

TEST(branch_and_bound, child_relaxation_is_not_better)
{
  // Relaxation of 5x + 4y over 6x + 4y <= 24, x + 2y <= 6 is optimal at (3, 1.5)
  auto problem =
    make_user_problem({{6.0, 4.0}, {1.0, 2.0}}, {'L', 'L'}, {24.0, 6.0}, {5.0, 4.0});
  maximize(problem);
  const auto settings = quiet_simplex_settings();
  timer_t timer(settings.time_limit);

  lp_solution_t<int, double> parent(problem.num_cols);
  ASSERT_EQ(solve_linear_program_with_bounds(
              problem, problem.lower, problem.upper, settings, timer, parent),
            lp_status_t::OPTIMAL);
  EXPECT_NEAR(parent.x[1], 1.5, 1e-9);

  std::vector<double> upper = problem.upper;
  upper[1]                  = 1.0;
  lp_solution_t<int, double> down(problem.num_cols);
  ASSERT_EQ(solve_linear_program_with_bounds(problem, problem.lower, upper, settings, timer, down),
            lp_status_t::OPTIMAL);
  EXPECT_GE(down.objective, parent.objective - 1e-9);

  std::vector<double> lower = problem.lower;
  lower[1]                  = 2.0;
  lp_solution_t<int, double> up(problem.num_cols);
  ASSERT_EQ(solve_linear_program_with_bounds(problem, lower, problem.upper, settings, timer, up),
            lp_status_t::OPTIMAL);
  EXPECT_GE(up.objective, parent.objective - 1e-9);
}

TEST(branch_and_bound, is_fractional)
{
  EXPECT_FALSE(is_fractional(2.5, variable_type_t::CONTINUOUS, 1e-6));
  EXPECT_TRUE(is_fractional(2.5, variable_type_t::INTEGER, 1e-6));
  EXPECT_FALSE(is_fractional(3.0 - 1e-8, variable_type_t::INTEGER, 1e-6));
  EXPECT_TRUE(is_fractional(0.01, variable_type_t::BINARY, 1e-6));
}

TEST(search_tree, branch_creates_children)
{
  search_tree_t<int, double> tree;
  logger_t log;
  log.log = false;
  const int root = tree.create_root(-10.0);
  const std::vector<double> lower{0.0, 0.0};
  const std::vector<double> upper{5.0, 5.0};
  const auto [down, up] = tree.branch(root, 1, 2.4, -10.0, lower, upper, log);

  EXPECT_EQ(tree[root].status, node_status_t::HAS_CHILDREN);
  EXPECT_EQ(tree[down].parent, root);
  EXPECT_EQ(tree[up].parent, root);
  EXPECT_EQ(tree[down].depth, 1);
  EXPECT_DOUBLE_EQ(tree[down].lower_bound, -10.0);
  EXPECT_DOUBLE_EQ(tree[down].branch_var_upper, 2.0);
  EXPECT_DOUBLE_EQ(tree[up].branch_var_lower, 3.0);
  EXPECT_EQ(tree.num_nodes, 3);
  EXPECT_EQ(tree.live_nodes(), 3);
}

TEST(search_tree, deepest_bound_change_wins)
{
  search_tree_t<int, double> tree;
  logger_t log;
  log.log = false;
  const int root = tree.create_root(0.0);
  std::vector<double> lower{0.0};
  std::vector<double> upper{10.0};
  const auto [down, up]   = tree.branch(root, 0, 4.5, 0.0, lower, upper, log);
  upper[0]                = 4.0;
  const auto [down2, up2] = tree.branch(down, 0, 1.5, 0.0, lower, upper, log);

  std::vector<double> node_lower{0.0};
  std::vector<double> node_upper{10.0};
  tree.get_variable_bounds(up2, node_lower, node_upper);
  EXPECT_DOUBLE_EQ(node_lower[0], 2.0);
  EXPECT_DOUBLE_EQ(node_upper[0], 4.0);

  node_lower = {0.0};
  node_upper = {10.0};
  tree.get_variable_bounds(up, node_lower, node_upper);
  EXPECT_DOUBLE_EQ(node_lower[0], 5.0);
  EXPECT_DOUBLE_EQ(node_upper[0], 10.0);
  (void)down2;
}

TEST(search_tree, resolved_subtrees_are_released)
{
  search_tree_t<int, double> tree;
  logger_t log;
  log.log = false;
  const int root = tree.create_root(0.0);
  const std::vector<double> lower{0.0, 0.0};
  const std::vector<double> upper{1.0, 1.0};
  const auto [down, up]   = tree.branch(root, 0, 0.5, 0.0, lower, upper, log);
  const auto [down2, up2] = tree.branch(down, 1, 0.5, 0.0, lower, upper, log);
  EXPECT_EQ(tree.live_nodes(), 5);

  tree.update_tree(down2, node_status_t::INFEASIBLE);
  EXPECT_EQ(tree.live_nodes(), 5);
  tree.update_tree(up2, node_status_t::INTEGER_FEASIBLE);
  // Both grandchildren are gone and the down child is resolved
  EXPECT_EQ(tree.live_nodes(), 3);
  EXPECT_EQ(tree[down].status, node_status_t::FATHOMED);

  tree.update_tree(up, node_status_t::FATHOMED);
  EXPECT_EQ(tree.live_nodes(), 1);
  EXPECT_EQ(tree[root].status, node_status_t::FATHOMED);

  // Released slots are reused
  const auto [a, b] = tree.branch(root, 0, 0.5, 0.0, lower, upper, log);
  EXPECT_EQ(tree.live_nodes(), 3);
  EXPECT_LT(a, 5);
  EXPECT_LT(b, 5);
}

}  // namespace lpmip::linear_programming::simplex::test
