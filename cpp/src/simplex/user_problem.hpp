/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/sparse_matrix.hpp>
#include <simplex/types.hpp>

#include <string>
#include <vector>

namespace lpmip::linear_programming::simplex {

enum class variable_type_t : int8_t {
  CONTINUOUS = 0,
  BINARY     = 1,
  INTEGER    = 2,
};

// A problem in the user's variables. The objective is always minimized; a maximization problem
// is stored with a negated objective and obj_scale = -1.
template <typename i_t, typename f_t>
struct user_problem_t {
  user_problem_t() : num_rows(0), num_cols(0), A(0, 0, 0), obj_constant(0.0), obj_scale(1.0) {}

  i_t num_rows;
  i_t num_cols;
  std::vector<f_t> objective;
  csr_matrix_t<i_t, f_t> A;
  std::vector<f_t> rhs;
  std::vector<char> row_sense;
  std::vector<f_t> lower;
  std::vector<f_t> upper;
  std::string problem_name;
  f_t obj_constant;
  f_t obj_scale;  // 1.0 for min, -1.0 for max
  std::vector<variable_type_t> var_types;
};

}  // namespace lpmip::linear_programming::simplex
