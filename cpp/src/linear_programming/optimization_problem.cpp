/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <lpmip/error.hpp>
#include <lpmip/linear_programming/optimization_problem.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace lpmip::linear_programming {

namespace {

bool valid_row_type(char row_type)
{
  return row_type == LPMIP_LESS_THAN || row_type == LPMIP_GREATER_THAN || row_type == LPMIP_EQUAL;
}

}  // namespace

template <typename i_t, typename f_t>
optimization_problem_t<i_t, f_t>::optimization_problem_t() : A_offsets_{0}
{
}

template <typename i_t, typename f_t>
optimization_problem_t<i_t, f_t> optimization_problem_t<i_t, f_t>::continuous(i_t n_variables)
{
  optimization_problem_t<i_t, f_t> problem;
  for (i_t j = 0; j < n_variables; ++j) {
    problem.add_variable(0, LPMIP_INFINITY, var_t::CONTINUOUS);
  }
  return problem;
}

template <typename i_t, typename f_t>
optimization_problem_t<i_t, f_t> optimization_problem_t<i_t, f_t>::binary(i_t n_variables)
{
  optimization_problem_t<i_t, f_t> problem;
  for (i_t j = 0; j < n_variables; ++j) {
    problem.add_variable(0, 1, var_t::BINARY);
  }
  return problem;
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_maximize(bool maximize)
{
  maximize_ = maximize;
}

template <typename i_t, typename f_t>
i_t optimization_problem_t<i_t, f_t>::add_variable(f_t lower, f_t upper, var_t type)
{
  if (type == var_t::BINARY) {
    lower = std::max<f_t>(lower, 0);
    upper = std::min<f_t>(upper, 1);
  }
  c_.push_back(0);
  variable_lower_bounds_.push_back(lower);
  variable_upper_bounds_.push_back(upper);
  variable_types_.push_back(type);
  return static_cast<i_t>(c_.size()) - 1;
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::add_constraint(const std::vector<i_t>& indices,
                                                      const std::vector<f_t>& values,
                                                      char sense,
                                                      f_t rhs)
{
  lpmip_expects(indices.size() == values.size(),
                error_type_t::ValidationError,
                "Constraint has %zu indices but %zu values",
                indices.size(),
                values.size());
  lpmip_expects(valid_row_type(sense),
                error_type_t::ValidationError,
                "Invalid constraint sense '%c'",
                sense);
  for (size_t k = 0; k < indices.size(); ++k) {
    if (values[k] == 0.0) { continue; }
    A_indices_.push_back(indices[k]);
    A_.push_back(values[k]);
  }
  A_offsets_.push_back(static_cast<i_t>(A_.size()));
  b_.push_back(rhs);
  row_types_.push_back(sense);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::add_row(const std::vector<f_t>& dense_values,
                                               char sense,
                                               f_t rhs)
{
  lpmip_expects(static_cast<i_t>(dense_values.size()) == get_n_variables(),
                error_type_t::ValidationError,
                "Row has %zu coefficients but the problem has %d variables",
                dense_values.size(),
                static_cast<int>(get_n_variables()));
  std::vector<i_t> indices(dense_values.size());
  for (size_t j = 0; j < dense_values.size(); ++j) {
    indices[j] = static_cast<i_t>(j);
  }
  add_constraint(indices, dense_values, sense, rhs);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_csr_constraint_matrix(const f_t* A_values,
                                                                 i_t size_values,
                                                                 const i_t* A_indices,
                                                                 i_t size_indices,
                                                                 const i_t* A_offsets,
                                                                 i_t size_offsets)
{
  lpmip_expects(size_offsets >= 1,
                error_type_t::ValidationError,
                "A_offsets must contain at least one entry");
  lpmip_expects(size_values == size_indices,
                error_type_t::ValidationError,
                "A_values and A_indices must have the same size");
  lpmip_expects(A_offsets[0] == 0, error_type_t::ValidationError, "A_offsets[0] must be 0");
  lpmip_expects(A_offsets[size_offsets - 1] == size_values,
                error_type_t::ValidationError,
                "The last entry of A_offsets must equal the number of nonzeros");
  for (i_t i = 0; i + 1 < size_offsets; ++i) {
    lpmip_expects(A_offsets[i] <= A_offsets[i + 1],
                  error_type_t::ValidationError,
                  "A_offsets must be non-decreasing");
  }
  A_.assign(A_values, A_values + size_values);
  A_indices_.assign(A_indices, A_indices + size_indices);
  A_offsets_.assign(A_offsets, A_offsets + size_offsets);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_constraint_bounds(const f_t* b, i_t size)
{
  b_.assign(b, b + size);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_row_types(const char* row_types, i_t size)
{
  row_types_.assign(row_types, row_types + size);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_objective_coefficients(const f_t* c, i_t size)
{
  expect_variable_count(size, "objective coefficients");
  c_.assign(c, c + size);
  has_objective_ = true;
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_objective_offset(f_t objective_offset)
{
  objective_offset_ = objective_offset;
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_variable_lower_bounds(const f_t* variable_lower_bounds,
                                                                 i_t size)
{
  expect_variable_count(size, "variable lower bounds");
  variable_lower_bounds_.assign(variable_lower_bounds, variable_lower_bounds + size);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_variable_upper_bounds(const f_t* variable_upper_bounds,
                                                                 i_t size)
{
  expect_variable_count(size, "variable upper bounds");
  variable_upper_bounds_.assign(variable_upper_bounds, variable_upper_bounds + size);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_variable_types(const var_t* variable_types, i_t size)
{
  expect_variable_count(size, "variable types");
  variable_types_.assign(variable_types, variable_types + size);
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::set_problem_name(const std::string& problem_name)
{
  problem_name_ = problem_name;
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::resize_variables(i_t n_variables)
{
  c_.resize(n_variables, 0);
  variable_lower_bounds_.resize(n_variables, 0);
  variable_upper_bounds_.resize(n_variables, LPMIP_INFINITY);
  variable_types_.resize(n_variables, var_t::CONTINUOUS);
}

// The first per-variable array set on an empty problem defines the number of variables
template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::expect_variable_count(i_t size, const char* what)
{
  if (get_n_variables() == 0) {
    resize_variables(size);
    return;
  }
  lpmip_expects(size == get_n_variables(),
                error_type_t::ValidationError,
                "Size of %s (%d) does not match the number of variables (%d)",
                what,
                static_cast<int>(size),
                static_cast<int>(get_n_variables()));
}

template <typename i_t, typename f_t>
void optimization_problem_t<i_t, f_t>::check_problem() const
{
  const i_t n = get_n_variables();
  const i_t m = get_n_constraints();

  lpmip_expects(static_cast<i_t>(A_offsets_.size()) == m + 1,
                error_type_t::ValidationError,
                "Constraint matrix has %zu rows but %d constraint bounds were given",
                A_offsets_.size() - 1,
                static_cast<int>(m));
  lpmip_expects(static_cast<i_t>(row_types_.size()) == m,
                error_type_t::ValidationError,
                "%zu row types were given for %d constraints",
                row_types_.size(),
                static_cast<int>(m));

  std::vector<i_t> last_row(n, -1);
  for (i_t i = 0; i < m; ++i) {
    lpmip_expects(valid_row_type(row_types_[i]),
                  error_type_t::ValidationError,
                  "Invalid row type '%c' in constraint %d",
                  row_types_[i],
                  static_cast<int>(i));
    lpmip_expects(std::isfinite(b_[i]),
                  error_type_t::ValidationError,
                  "Right-hand side of constraint %d is not finite",
                  static_cast<int>(i));
    for (i_t p = A_offsets_[i]; p < A_offsets_[i + 1]; ++p) {
      const i_t j = A_indices_[p];
      lpmip_expects(j >= 0 && j < n,
                    error_type_t::ValidationError,
                    "Constraint %d references variable %d which does not exist",
                    static_cast<int>(i),
                    static_cast<int>(j));
      lpmip_expects(last_row[j] != i,
                    error_type_t::ValidationError,
                    "Variable %d appears twice in constraint %d",
                    static_cast<int>(j),
                    static_cast<int>(i));
      last_row[j] = i;
      lpmip_expects(std::isfinite(A_[p]),
                    error_type_t::ValidationError,
                    "Coefficient of variable %d in constraint %d is not finite",
                    static_cast<int>(j),
                    static_cast<int>(i));
    }
  }

  for (i_t j = 0; j < n; ++j) {
    const f_t lower = variable_lower_bounds_[j];
    const f_t upper = variable_upper_bounds_[j];
    lpmip_expects(!std::isnan(lower) && !std::isnan(upper),
                  error_type_t::ValidationError,
                  "Bound of variable %d is NaN",
                  static_cast<int>(j));
    lpmip_expects(lower <= upper,
                  error_type_t::ValidationError,
                  "Variable %d has lower bound %g greater than upper bound %g",
                  static_cast<int>(j),
                  lower,
                  upper);
    lpmip_expects(lower < std::numeric_limits<f_t>::infinity() &&
                    upper > -std::numeric_limits<f_t>::infinity(),
                  error_type_t::ValidationError,
                  "Variable %d has an empty domain",
                  static_cast<int>(j));
    lpmip_expects(std::isfinite(c_[j]),
                  error_type_t::ValidationError,
                  "Objective coefficient of variable %d is not finite",
                  static_cast<int>(j));
  }
  lpmip_expects(std::isfinite(objective_offset_),
                error_type_t::ValidationError,
                "Objective offset is not finite");
}

template <typename i_t, typename f_t>
i_t optimization_problem_t<i_t, f_t>::get_n_variables() const
{
  return static_cast<i_t>(c_.size());
}

template <typename i_t, typename f_t>
i_t optimization_problem_t<i_t, f_t>::get_n_constraints() const
{
  return static_cast<i_t>(b_.size());
}

template <typename i_t, typename f_t>
i_t optimization_problem_t<i_t, f_t>::get_nnz() const
{
  return static_cast<i_t>(A_.size());
}

template <typename i_t, typename f_t>
i_t optimization_problem_t<i_t, f_t>::get_n_integers() const
{
  return static_cast<i_t>(std::count_if(variable_types_.begin(),
                                        variable_types_.end(),
                                        [](var_t type) { return type != var_t::CONTINUOUS; }));
}

template <typename i_t, typename f_t>
const std::vector<f_t>& optimization_problem_t<i_t, f_t>::get_constraint_matrix_values() const
{
  return A_;
}

template <typename i_t, typename f_t>
const std::vector<i_t>& optimization_problem_t<i_t, f_t>::get_constraint_matrix_indices() const
{
  return A_indices_;
}

template <typename i_t, typename f_t>
const std::vector<i_t>& optimization_problem_t<i_t, f_t>::get_constraint_matrix_offsets() const
{
  return A_offsets_;
}

template <typename i_t, typename f_t>
const std::vector<f_t>& optimization_problem_t<i_t, f_t>::get_constraint_bounds() const
{
  return b_;
}

template <typename i_t, typename f_t>
const std::vector<char>& optimization_problem_t<i_t, f_t>::get_row_types() const
{
  return row_types_;
}

template <typename i_t, typename f_t>
const std::vector<f_t>& optimization_problem_t<i_t, f_t>::get_objective_coefficients() const
{
  return c_;
}

template <typename i_t, typename f_t>
f_t optimization_problem_t<i_t, f_t>::get_objective_offset() const
{
  return objective_offset_;
}

template <typename i_t, typename f_t>
const std::vector<f_t>& optimization_problem_t<i_t, f_t>::get_variable_lower_bounds() const
{
  return variable_lower_bounds_;
}

template <typename i_t, typename f_t>
const std::vector<f_t>& optimization_problem_t<i_t, f_t>::get_variable_upper_bounds() const
{
  return variable_upper_bounds_;
}

template <typename i_t, typename f_t>
const std::vector<var_t>& optimization_problem_t<i_t, f_t>::get_variable_types() const
{
  return variable_types_;
}

template <typename i_t, typename f_t>
bool optimization_problem_t<i_t, f_t>::get_sense() const
{
  return maximize_;
}

template <typename i_t, typename f_t>
bool optimization_problem_t<i_t, f_t>::has_objective() const
{
  return has_objective_;
}

template <typename i_t, typename f_t>
bool optimization_problem_t<i_t, f_t>::empty() const
{
  return c_.empty() && b_.empty();
}

template <typename i_t, typename f_t>
std::string optimization_problem_t<i_t, f_t>::get_problem_name() const
{
  return problem_name_;
}

#if LPMIP_INSTANTIATE_DOUBLE
template class optimization_problem_t<int, double>;
#endif

}  // namespace lpmip::linear_programming
