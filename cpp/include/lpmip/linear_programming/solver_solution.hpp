/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/error.hpp>
#include <lpmip/linear_programming/constants.h>

#include <cstdint>
#include <string>
#include <vector>

namespace lpmip::linear_programming {

enum class termination_status_t : int8_t {
  NoTermination  = LPMIP_TERMINATION_STATUS_NO_TERMINATION,
  Optimal        = LPMIP_TERMINATION_STATUS_OPTIMAL,
  Infeasible     = LPMIP_TERMINATION_STATUS_INFEASIBLE,
  Unbounded      = LPMIP_TERMINATION_STATUS_UNBOUNDED,
  IterationLimit = LPMIP_TERMINATION_STATUS_ITERATION_LIMIT,
  TimeLimit      = LPMIP_TERMINATION_STATUS_TIME_LIMIT,
  NumericalError = LPMIP_TERMINATION_STATUS_NUMERICAL_ERROR,
  NodeLimit      = LPMIP_TERMINATION_STATUS_NODE_LIMIT,
};

/**
 * @brief Result of `solve`.
 *
 * The objective value and the solution bound are expressed in the sense of the original problem
 * (the sign is re-applied for maximization). A solution stopped by a limit keeps the best
 * assignment found so far, which `has_incumbent()` reports.
 *
 * @tparam i_t Integer type. int32_t is supported.
 * @tparam f_t Floating point type. double is supported.
 */
template <typename i_t, typename f_t>
class solution_t {
 public:
  solution_t(std::vector<f_t> solution,
             termination_status_t termination_status,
             bool has_incumbent,
             f_t objective,
             f_t solution_bound,
             f_t mip_gap,
             int64_t num_nodes,
             int64_t num_simplex_iterations,
             double total_solve_time);

  explicit solution_t(const lpmip::logic_error& error_status);

  const std::vector<f_t>& get_solution() const;
  f_t get_objective_value() const;
  f_t get_solution_bound() const;
  f_t get_mip_gap() const;
  termination_status_t get_termination_status() const;
  static std::string get_termination_status_string(termination_status_t termination_status);
  std::string get_termination_status_string() const;
  const lpmip::logic_error& get_error_status() const;
  bool has_incumbent() const;
  int64_t get_num_nodes() const;
  int64_t get_num_simplex_iterations() const;
  double get_total_solve_time() const;

  /**
   * @brief Writes "Objective = <value>" and one "x[i] = <value>" line per variable to the
   * default logger.
   */
  void log_summary() const;

 private:
  std::vector<f_t> x_;
  termination_status_t termination_status_;
  lpmip::logic_error error_status_;
  bool has_incumbent_;
  f_t objective_;
  f_t solution_bound_;
  f_t mip_gap_;
  int64_t num_nodes_;
  int64_t num_simplex_iterations_;
  double total_solve_time_;
};

}  // namespace lpmip::linear_programming
