/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/logger.hpp>
#include <simplex/types.hpp>

#include <cstdint>
#include <limits>

namespace lpmip::linear_programming::simplex {

template <typename i_t, typename f_t>
struct simplex_solver_settings_t {
 public:
  simplex_solver_settings_t()
    : iteration_limit(1000000),
      node_limit(100000),
      time_limit(std::numeric_limits<f_t>::infinity()),
      tolerance(1e-9),
      pivot_tol(1e-9),
      integer_tol(1e-6),
      bland_switch(50),
      iteration_log_frequency(1000),
      node_log_frequency(100)
  {
  }

  void set_log(bool logging) const { log.log = logging; }

  int64_t iteration_limit;      // Maximum number of pivots in one LP solve
  int64_t node_limit;           // Maximum number of branch-and-bound nodes explored
  f_t time_limit;               // Wall clock limit in seconds
  f_t tolerance;                // Zero test for reduced costs, ratios and infeasibility
  f_t pivot_tol;                // Pivot elements smaller than this are rejected
  f_t integer_tol;              // Tolerance on integrality violation
  i_t bland_switch;             // Consecutive zero-step pivots before switching to Bland's rule
  i_t iteration_log_frequency;  // number of pivots between log updates
  i_t node_log_frequency;       // number of nodes between log updates
  mutable logger_t log;
};

}  // namespace lpmip::linear_programming::simplex
