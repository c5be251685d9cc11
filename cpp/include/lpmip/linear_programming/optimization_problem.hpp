/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/linear_programming/constants.h>

#include <string>
#include <type_traits>
#include <vector>

namespace lpmip::linear_programming {

enum class var_t { CONTINUOUS = 0, INTEGER, BINARY };

/**
 * @brief A representation of a linear or mixed integer program.
 *
 * The problem is:
 *
 * minimize (or maximize) c^T x + offset
 * subject to  A_i x (<=, >=, =) b_i  for every constraint row i
 *             l <= x <= u
 *             x_j integer for every j whose type is INTEGER or BINARY
 *
 * The constraint matrix is stored in CSR format with zero coefficients omitted. Variables are
 * identified by their position, which is stable for the lifetime of the problem.
 *
 * @tparam i_t Integer type. int32_t is supported.
 * @tparam f_t Floating point type. double is supported.
 */
template <typename i_t, typename f_t>
class optimization_problem_t {
 public:
  static_assert(std::is_integral<i_t>::value,
                "'optimization_problem_t' accepts only integer types for indexes");
  static_assert(std::is_floating_point<f_t>::value,
                "'optimization_problem_t' accepts only floating point types for weights");

  optimization_problem_t();

  /**
   * @brief Create a problem with `n_variables` continuous variables bounded below by zero.
   */
  static optimization_problem_t continuous(i_t n_variables);

  /**
   * @brief Create a problem with `n_variables` binary variables.
   */
  static optimization_problem_t binary(i_t n_variables);

  /**
   * @brief Set the sense of optimization to maximize.
   * @note Setting before calling the solver is optional, default value if false
   * (minimize).
   */
  void set_maximize(bool maximize);

  /**
   * @brief Append a variable and return its index.
   *
   * A BINARY variable has its bounds clamped to [max(lower, 0), min(upper, 1)].
   */
  i_t add_variable(f_t lower, f_t upper, var_t type = var_t::CONTINUOUS);

  /**
   * @brief Append a sparse constraint row `sum values[k] * x[indices[k]] (sense) rhs`.
   *
   * Zero coefficients are dropped.
   *
   * @throws lpmip::logic_error if indices and values differ in size or the sense is not one of
   * 'L', 'G' or 'E'.
   */
  void add_constraint(const std::vector<i_t>& indices,
                      const std::vector<f_t>& values,
                      char sense,
                      f_t rhs);

  /**
   * @brief Append a constraint from a dense coefficient vector.
   *
   * @throws lpmip::logic_error if the vector length differs from the number of variables.
   */
  void add_row(const std::vector<f_t>& dense_values, char sense, f_t rhs);

  /**
   * @brief Set the constraint matrix (A) in CSR format. Replaces every existing row.
   *
   * @throws lpmip::logic_error if the offsets are not consistent with the other two arrays.
   */
  void set_csr_constraint_matrix(const f_t* A_values,
                                 i_t size_values,
                                 const i_t* A_indices,
                                 i_t size_indices,
                                 const i_t* A_offsets,
                                 i_t size_offsets);

  /**
   * @brief Set the constraint bounds (b / right-hand side) array.
   */
  void set_constraint_bounds(const f_t* b, i_t size);

  /**
   * @brief Set the row types ('L', 'G' or 'E') array.
   */
  void set_row_types(const char* row_types, i_t size);

  /**
   * @brief Set the objective coefficients (c) array.
   *
   * A problem without objective coefficients is solved as a square system of equalities.
   */
  void set_objective_coefficients(const f_t* c, i_t size);

  void set_objective_offset(f_t objective_offset);

  void set_variable_lower_bounds(const f_t* variable_lower_bounds, i_t size);
  void set_variable_upper_bounds(const f_t* variable_upper_bounds, i_t size);
  void set_variable_types(const var_t* variable_types, i_t size);

  void set_problem_name(const std::string& problem_name);

  /**
   * @brief Check the invariants of the problem.
   *
   * Every referenced variable exists, no variable appears twice in a row, every coefficient
   * and right-hand side is finite, no bound is NaN and lower <= upper for every variable.
   *
   * @throws lpmip::logic_error with error type ValidationError on the first violation.
   */
  void check_problem() const;

  i_t get_n_variables() const;
  i_t get_n_constraints() const;
  i_t get_nnz() const;
  i_t get_n_integers() const;
  const std::vector<f_t>& get_constraint_matrix_values() const;
  const std::vector<i_t>& get_constraint_matrix_indices() const;
  const std::vector<i_t>& get_constraint_matrix_offsets() const;
  const std::vector<f_t>& get_constraint_bounds() const;
  const std::vector<char>& get_row_types() const;
  const std::vector<f_t>& get_objective_coefficients() const;
  f_t get_objective_offset() const;
  const std::vector<f_t>& get_variable_lower_bounds() const;
  const std::vector<f_t>& get_variable_upper_bounds() const;
  const std::vector<var_t>& get_variable_types() const;
  bool get_sense() const;
  bool has_objective() const;
  bool empty() const;
  std::string get_problem_name() const;

 private:
  void resize_variables(i_t n_variables);
  void expect_variable_count(i_t size, const char* what);

  std::string problem_name_;
  bool maximize_{false};
  bool has_objective_{false};
  f_t objective_offset_{0};

  // One entry per variable
  std::vector<f_t> c_;
  std::vector<f_t> variable_lower_bounds_;
  std::vector<f_t> variable_upper_bounds_;
  std::vector<var_t> variable_types_;

  // CSR constraint matrix, one entry per row in b_ and row_types_
  std::vector<f_t> A_;
  std::vector<i_t> A_indices_;
  std::vector<i_t> A_offsets_;
  std::vector<f_t> b_;
  std::vector<char> row_types_;
};

}  // namespace lpmip::linear_programming
