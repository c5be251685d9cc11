/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/types.hpp>

#include <limits>
#include <vector>

namespace lpmip::linear_programming::simplex {

template <typename i_t, typename f_t>
class lp_solution_t {
 public:
  explicit lp_solution_t(i_t n)
    : x(n),
      objective(std::numeric_limits<f_t>::quiet_NaN()),
      user_objective(std::numeric_limits<f_t>::quiet_NaN()),
      iterations(0)
  {
  }

  // Primal solution vector in the user's variables
  std::vector<f_t> x;
  // Minimized objective without the constant term
  f_t objective;
  f_t user_objective;
  int64_t iterations;
};

template <typename i_t, typename f_t>
class mip_solution_t {
 public:
  explicit mip_solution_t(i_t n)
    : x(n),
      objective(std::numeric_limits<f_t>::quiet_NaN()),
      lower_bound(-inf),
      nodes_explored(0),
      simplex_iterations(0),
      has_incumbent(false)
  {
  }

  void resize(i_t n) { x.resize(n); }

  void set_incumbent_solution(f_t primal_objective, const std::vector<f_t>& primal_solution)
  {
    x             = primal_solution;
    objective     = primal_objective;
    has_incumbent = true;
  }

  // Primal solution vector
  std::vector<f_t> x;
  f_t objective;
  f_t lower_bound;
  int64_t nodes_explored;
  int64_t simplex_iterations;
  bool has_incumbent;
};

}  // namespace lpmip::linear_programming::simplex
