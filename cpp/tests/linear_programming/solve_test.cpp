/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <utilities/base_fixture.hpp>

#include <lpmip/linear_programming/solve.hpp>
#include <lpmip/logger.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <random>
#include <string>
#include <vector>

namespace lpmip::linear_programming::test {

using lpmip::test::brute_force;
using lpmip::test::quiet_settings;

namespace {

// maximize 2x + 3y subject to x + y <= 4, x <= 3
optimization_problem_t<int, double> two_variable_lp()
{
  auto problem = optimization_problem_t<int, double>::continuous(2);
  problem.set_maximize(true);
  problem.add_row({1.0, 1.0}, 'L', 4.0);
  problem.add_row({1.0, 0.0}, 'L', 3.0);
  const std::vector<double> c{2.0, 3.0};
  problem.set_objective_coefficients(c.data(), 2);
  return problem;
}

// maximize 4a + 5b + 3c + 4d + 5e over binaries
optimization_problem_t<int, double> five_binaries()
{
  auto problem = optimization_problem_t<int, double>::binary(5);
  problem.set_maximize(true);
  problem.add_row({1.0, 1.0, 1.0, 1.0, 1.0}, 'E', 2.0);
  problem.add_row({3.0, 2.0, 1.0, 1.0, 2.0}, 'E', 3.0);
  problem.add_row({-2.0, -1.0, -1.0, -3.0, -2.0}, 'E', -4.0);
  const std::vector<double> c{4.0, 5.0, 3.0, 4.0, 5.0};
  problem.set_objective_coefficients(c.data(), 5);
  return problem;
}

optimization_problem_t<int, double> knapsack()
{
  const std::vector<double> value{15, 100, 90, 60, 40, 15, 10, 1};
  const std::vector<double> weight{2, 20, 20, 30, 40, 30, 60, 10};
  auto problem = optimization_problem_t<int, double>::binary(8);
  problem.set_maximize(true);
  problem.add_row(weight, 'L', 102.0);
  problem.set_objective_coefficients(value.data(), 8);
  return problem;
}

}  // namespace

TEST(solve, two_variable_lp)
{
  const auto solution = solve(two_variable_lp(), quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_EQ(solution.get_termination_status_string(), "Optimal");
  ASSERT_TRUE(solution.has_incumbent());
  EXPECT_NEAR(solution.get_objective_value(), 12.0, 1e-9);
  EXPECT_NEAR(solution.get_solution()[0], 0.0, 1e-9);
  EXPECT_NEAR(solution.get_solution()[1], 4.0, 1e-9);
  EXPECT_NEAR(solution.get_solution_bound(), 12.0, 1e-9);
  EXPECT_EQ(solution.get_error_status().get_error_type(), error_type_t::Success);
}

TEST(solve, minimize_three_variables)
{
  auto problem = optimization_problem_t<int, double>::continuous(3);
  problem.add_row({3.0, 2.0, 1.0}, 'L', 10.0);
  problem.add_row({2.0, 5.0, 3.0}, 'L', 15.0);
  const std::vector<double> c{-2.0, -3.0, -4.0};
  problem.set_objective_coefficients(c.data(), 3);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), -20.0, 1e-9);
  EXPECT_NEAR(solution.get_solution()[2], 5.0, 1e-9);

  problem.set_maximize(true);
  const std::vector<double> negated{2.0, 3.0, 4.0};
  problem.set_objective_coefficients(negated.data(), 3);
  const auto maximized = solve(problem, quiet_settings());
  EXPECT_EQ(maximized.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(maximized.get_objective_value(), 20.0, 1e-9);
}

TEST(solve, objective_offset)
{
  // minimize x + 10 subject to x >= 2
  optimization_problem_t<int, double> problem;
  problem.add_variable(-10.0, 10.0);
  problem.add_constraint({0}, {1.0}, 'G', 2.0);
  const std::vector<double> c{1.0};
  problem.set_objective_coefficients(c.data(), 1);
  problem.set_objective_offset(10.0);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), 12.0, 1e-9);
  EXPECT_NEAR(solution.get_solution_bound(), 12.0, 1e-9);
}

TEST(solve, infeasible)
{
  // x >= 5 and x <= 3
  auto problem = optimization_problem_t<int, double>::continuous(1);
  problem.add_row({1.0}, 'G', 5.0);
  problem.add_row({1.0}, 'L', 3.0);
  const std::vector<double> c{1.0};
  problem.set_objective_coefficients(c.data(), 1);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Infeasible);
  EXPECT_FALSE(solution.has_incumbent());
  EXPECT_TRUE(solution.get_solution().empty());
  EXPECT_TRUE(std::isnan(solution.get_objective_value()));
}

TEST(solve, unbounded)
{
  // maximize x with x >= 0
  auto problem = optimization_problem_t<int, double>::continuous(1);
  problem.set_maximize(true);
  const std::vector<double> c{1.0};
  problem.set_objective_coefficients(c.data(), 1);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Unbounded);
  EXPECT_FALSE(solution.has_incumbent());
}

TEST(solve, integer_program)
{
  // maximize x + y subject to 2x + y <= 5 over the integers. (0, 5) is optimal.
  auto problem = optimization_problem_t<int, double>();
  problem.add_variable(0.0, std::numeric_limits<double>::infinity(), var_t::INTEGER);
  problem.add_variable(0.0, std::numeric_limits<double>::infinity(), var_t::INTEGER);
  problem.set_maximize(true);
  problem.add_row({2.0, 1.0}, 'L', 5.0);
  const std::vector<double> c{1.0, 1.0};
  problem.set_objective_coefficients(c.data(), 2);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), 5.0, 1e-9);
  EXPECT_NEAR(solution.get_solution()[0], 0.0, 1e-9);
  EXPECT_NEAR(solution.get_solution()[1], 5.0, 1e-9);
}

TEST(solve, branching_integer_program)
{
  // maximize 5x + 4y subject to 6x + 4y <= 24, x + 2y <= 6 over the integers
  optimization_problem_t<int, double> problem;
  problem.add_variable(0.0, 10.0, var_t::INTEGER);
  problem.add_variable(0.0, 10.0, var_t::INTEGER);
  problem.set_maximize(true);
  problem.add_row({6.0, 4.0}, 'L', 24.0);
  problem.add_row({1.0, 2.0}, 'L', 6.0);
  const std::vector<double> c{5.0, 4.0};
  problem.set_objective_coefficients(c.data(), 2);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), 20.0, 1e-9);
  // Integer values are reported exactly
  EXPECT_EQ(solution.get_solution()[0], 4.0);
  EXPECT_EQ(solution.get_solution()[1], 0.0);
  EXPECT_GT(solution.get_num_nodes(), 1);
  EXPECT_NEAR(solution.get_mip_gap(), 0.0, 1e-9);

  const auto oracle = brute_force(problem);
  ASSERT_TRUE(oracle.feasible);
  EXPECT_NEAR(solution.get_objective_value(), oracle.objective, 1e-9);
}

TEST(solve, binary_equalities)
{
  auto problem = optimization_problem_t<int, double>::binary(3);
  problem.set_maximize(true);
  problem.add_row({1.0, 0.0, 1.0}, 'E', 2.0);
  problem.add_row({0.0, 1.0, 1.0}, 'E', 2.0);
  const std::vector<double> c{1.0, 2.0, 3.0};
  problem.set_objective_coefficients(c.data(), 3);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), 6.0, 1e-9);
  EXPECT_EQ(solution.get_solution(), (std::vector<double>{1.0, 1.0, 1.0}));
}

TEST(solve, five_binaries_match_enumeration)
{
  const auto problem  = five_binaries();
  const auto solution = solve(problem, quiet_settings());
  const auto oracle   = brute_force(problem);
  ASSERT_TRUE(oracle.feasible);
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), 9.0, 1e-9);
  EXPECT_NEAR(oracle.objective, 9.0, 1e-9);
  EXPECT_EQ(solution.get_solution(), (std::vector<double>{0.0, 1.0, 0.0, 1.0, 0.0}));
}

TEST(solve, infeasible_binaries)
{
  auto problem = optimization_problem_t<int, double>::binary(2);
  problem.add_row({1.0, 1.0}, 'E', 1.0);
  problem.add_row({1.0, 1.0}, 'E', 2.0);
  const std::vector<double> c{1.0, 1.0};
  problem.set_objective_coefficients(c.data(), 2);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Infeasible);
  EXPECT_FALSE(brute_force(problem).feasible);
}

TEST(solve, single_binary)
{
  // maximize x subject to x = 1
  auto problem = optimization_problem_t<int, double>::binary(1);
  problem.set_maximize(true);
  problem.add_row({1.0}, 'E', 1.0);
  const std::vector<double> c{1.0};
  problem.set_objective_coefficients(c.data(), 1);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), 1.0, 1e-9);
  EXPECT_EQ(solution.get_num_nodes(), 1);
}

TEST(solve, mixed_integer)
{
  // minimize -x - 2y subject to x + y <= 3.5, y <= 2.5, y integer, x continuous
  optimization_problem_t<int, double> problem;
  problem.add_variable(0.0, std::numeric_limits<double>::infinity());
  problem.add_variable(0.0, std::numeric_limits<double>::infinity(), var_t::INTEGER);
  problem.add_row({1.0, 1.0}, 'L', 3.5);
  problem.add_row({0.0, 1.0}, 'L', 2.5);
  const std::vector<double> c{-1.0, -2.0};
  problem.set_objective_coefficients(c.data(), 2);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  EXPECT_NEAR(solution.get_objective_value(), -5.5, 1e-9);
  EXPECT_NEAR(solution.get_solution()[0], 1.5, 1e-9);
  EXPECT_EQ(solution.get_solution()[1], 2.0);
}

TEST(solve, small_integer_programs_match_enumeration)
{
  std::mt19937 gen(42);
  std::uniform_int_distribution<int> coefficient(0, 5);
  std::uniform_int_distribution<int> rhs(4, 15);
  std::uniform_int_distribution<int> cost(1, 9);

  for (int trial = 0; trial < 25; ++trial) {
    optimization_problem_t<int, double> problem;
    for (int j = 0; j < 3; ++j) {
      problem.add_variable(0.0, 3.0, var_t::INTEGER);
    }
    problem.set_maximize(true);
    for (int i = 0; i < 3; ++i) {
      problem.add_row({static_cast<double>(coefficient(gen)),
                       static_cast<double>(coefficient(gen)),
                       static_cast<double>(coefficient(gen))},
                      'L',
                      static_cast<double>(rhs(gen)));
    }
    const std::vector<double> c{static_cast<double>(cost(gen)),
                                static_cast<double>(cost(gen)),
                                static_cast<double>(cost(gen))};
    problem.set_objective_coefficients(c.data(), 3);

    const auto solution = solve(problem, quiet_settings());
    const auto oracle   = brute_force(problem);
    ASSERT_TRUE(oracle.feasible);
    ASSERT_EQ(solution.get_termination_status(), termination_status_t::Optimal) << trial;
    EXPECT_NEAR(solution.get_objective_value(), oracle.objective, 1e-6) << trial;
  }
}

TEST(solve, deterministic)
{
  const auto problem = knapsack();
  const auto first   = solve(problem, quiet_settings());
  const auto second  = solve(problem, quiet_settings());
  EXPECT_EQ(first.get_termination_status(), second.get_termination_status());
  EXPECT_EQ(first.get_objective_value(), second.get_objective_value());
  EXPECT_EQ(first.get_solution(), second.get_solution());
  EXPECT_EQ(first.get_num_nodes(), second.get_num_nodes());
  EXPECT_EQ(first.get_num_simplex_iterations(), second.get_num_simplex_iterations());
}

TEST(solve, node_limit)
{
  auto settings       = quiet_settings();
  settings.node_limit = 3;
  const auto solution = solve(knapsack(), settings);
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::NodeLimit);
  EXPECT_EQ(solution.get_termination_status_string(), "NodeLimit");
  EXPECT_EQ(solution.get_num_nodes(), 3);
  // The bound of a maximization is an upper bound on the optimum
  EXPECT_GE(solution.get_solution_bound(), 280.0 - 1e-9);
}

TEST(solve, node_limit_keeps_incumbent)
{
  auto settings       = quiet_settings();
  const auto complete = solve(knapsack(), settings);
  ASSERT_EQ(complete.get_termination_status(), termination_status_t::Optimal);
  ASSERT_GT(complete.get_num_nodes(), 2);

  // Stop one node short of the full search
  settings.node_limit = complete.get_num_nodes() - 1;
  const auto stopped  = solve(knapsack(), settings);
  EXPECT_EQ(stopped.get_termination_status(), termination_status_t::NodeLimit);
  if (stopped.has_incumbent()) {
    EXPECT_LE(stopped.get_objective_value(), 280.0 + 1e-9);
    EXPECT_GE(stopped.get_solution_bound(), stopped.get_objective_value() - 1e-9);
    EXPECT_EQ(stopped.get_solution().size(), 8u);
  }
}

TEST(solve, iteration_limit)
{
  auto settings            = quiet_settings();
  settings.iteration_limit = 0;
  const auto solution      = solve(two_variable_lp(), settings);
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::IterationLimit);
  EXPECT_FALSE(solution.has_incumbent());
}

TEST(solve, time_limit)
{
  auto settings       = quiet_settings();
  settings.time_limit = 0.0;
  const auto solution = solve(two_variable_lp(), settings);
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::TimeLimit);
}

TEST(solve, square_system_without_objective)
{
  auto problem = optimization_problem_t<int, double>::continuous(3);
  problem.add_row({2.0, 1.0, 1.0}, 'E', 3.0);
  problem.add_row({1.0, 0.0, 1.0}, 'E', 1.5);
  problem.add_row({2.0, 1.0, 0.0}, 'E', 2.0);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);
  ASSERT_EQ(solution.get_solution().size(), 3u);
  EXPECT_NEAR(solution.get_solution()[0], 0.5, 1e-12);
  EXPECT_NEAR(solution.get_solution()[1], 1.0, 1e-12);
  EXPECT_NEAR(solution.get_solution()[2], 1.0, 1e-12);
}

TEST(solve, dependent_system_without_objective)
{
  auto problem = optimization_problem_t<int, double>::continuous(3);
  problem.add_row({2.0, 1.0, 1.0}, 'E', 3.0);
  problem.add_row({4.0, 2.0, 2.0}, 'E', 6.0);
  problem.add_row({1.0, 0.0, 1.0}, 'E', 1.5);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::NoTermination);
  EXPECT_EQ(solution.get_error_status().get_error_type(), error_type_t::RuntimeError);
}

TEST(solve, non_square_system_without_objective)
{
  auto problem = optimization_problem_t<int, double>::continuous(3);
  problem.add_row({2.0, 1.0, 1.0}, 'E', 3.0);
  problem.add_row({1.0, 0.0, 1.0}, 'E', 1.5);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_error_status().get_error_type(), error_type_t::ValidationError);
}

TEST(solve, integer_problem_requires_objective)
{
  auto problem = optimization_problem_t<int, double>::binary(2);
  problem.add_row({1.0, 0.0}, 'E', 1.0);
  problem.add_row({0.0, 1.0}, 'E', 0.0);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::NoTermination);
  EXPECT_EQ(solution.get_error_status().get_error_type(), error_type_t::ValidationError);
}

TEST(solve, invalid_problem_is_reported)
{
  optimization_problem_t<int, double> problem;
  problem.add_variable(3.0, 1.0);
  const std::vector<double> c{1.0};
  problem.set_objective_coefficients(c.data(), 1);

  const auto solution = solve(problem, quiet_settings());
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::NoTermination);
  EXPECT_EQ(solution.get_error_status().get_error_type(), error_type_t::ValidationError);
  EXPECT_FALSE(solution.has_incumbent());
}

TEST(solve, log_file)
{
  const std::string log_file = ::testing::TempDir() + "lpmip_solve_test.log";
  std::remove(log_file.c_str());

  auto settings       = quiet_settings();
  settings.log_file   = log_file;
  const auto solution = solve(two_variable_lp(), settings);
  ASSERT_EQ(solution.get_termination_status(), termination_status_t::Optimal);

  std::ifstream in(log_file);
  ASSERT_TRUE(in.good());
  const std::string contents((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  EXPECT_NE(contents.find("Simplex optimal"), std::string::npos);
  std::remove(log_file.c_str());
}

TEST(solve, log_file_receives_errors)
{
  const std::string log_file = ::testing::TempDir() + "lpmip_solve_error_test.log";
  std::remove(log_file.c_str());

  optimization_problem_t<int, double> problem;
  problem.add_variable(3.0, 1.0);
  const std::vector<double> c{1.0};
  problem.set_objective_coefficients(c.data(), 1);

  auto settings       = quiet_settings();
  settings.log_file   = log_file;
  const auto solution = solve(problem, settings);
  ASSERT_EQ(solution.get_error_status().get_error_type(), error_type_t::ValidationError);
  EXPECT_EQ(std::string(solution.get_error_status().what()).rfind("ValidationError: ", 0), 0u);

  std::ifstream in(log_file);
  ASSERT_TRUE(in.good());
  const std::string contents((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  EXPECT_NE(contents.find("Error in solve"), std::string::npos);
  std::remove(log_file.c_str());
}

TEST(solve, restores_logger_sinks)
{
  const auto before = lpmip::default_logger().sinks();

  const std::string log_file = ::testing::TempDir() + "lpmip_solve_sinks_test.log";
  auto settings              = quiet_settings();
  settings.log_file          = log_file;
  const auto solution        = solve(two_variable_lp(), settings);
  EXPECT_EQ(solution.get_termination_status(), termination_status_t::Optimal);

  const auto after = lpmip::default_logger().sinks();
  ASSERT_EQ(after.size(), before.size());
  for (std::size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(after[i], before[i]);
  }
  std::remove(log_file.c_str());
}

}  // namespace lpmip::linear_programming::test
