/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <lpmip/linear_programming/solver_solution.hpp>
#include <lpmip/logger.hpp>

#include <limits>
#include <utility>

namespace lpmip::linear_programming {

template <typename i_t, typename f_t>
solution_t<i_t, f_t>::solution_t(std::vector<f_t> solution,
                                 termination_status_t termination_status,
                                 bool has_incumbent,
                                 f_t objective,
                                 f_t solution_bound,
                                 f_t mip_gap,
                                 int64_t num_nodes,
                                 int64_t num_simplex_iterations,
                                 double total_solve_time)
  : x_(std::move(solution)),
    termination_status_(termination_status),
    error_status_("", error_type_t::Success),
    has_incumbent_(has_incumbent),
    objective_(objective),
    solution_bound_(solution_bound),
    mip_gap_(mip_gap),
    num_nodes_(num_nodes),
    num_simplex_iterations_(num_simplex_iterations),
    total_solve_time_(total_solve_time)
{
}

template <typename i_t, typename f_t>
solution_t<i_t, f_t>::solution_t(const lpmip::logic_error& error_status)
  : termination_status_(termination_status_t::NoTermination),
    error_status_(error_status),
    has_incumbent_(false),
    objective_(std::numeric_limits<f_t>::quiet_NaN()),
    solution_bound_(std::numeric_limits<f_t>::quiet_NaN()),
    mip_gap_(std::numeric_limits<f_t>::infinity()),
    num_nodes_(0),
    num_simplex_iterations_(0),
    total_solve_time_(0.0)
{
}

template <typename i_t, typename f_t>
const std::vector<f_t>& solution_t<i_t, f_t>::get_solution() const
{
  return x_;
}

template <typename i_t, typename f_t>
f_t solution_t<i_t, f_t>::get_objective_value() const
{
  return objective_;
}

template <typename i_t, typename f_t>
f_t solution_t<i_t, f_t>::get_solution_bound() const
{
  return solution_bound_;
}

template <typename i_t, typename f_t>
f_t solution_t<i_t, f_t>::get_mip_gap() const
{
  return mip_gap_;
}

template <typename i_t, typename f_t>
termination_status_t solution_t<i_t, f_t>::get_termination_status() const
{
  return termination_status_;
}

template <typename i_t, typename f_t>
std::string solution_t<i_t, f_t>::get_termination_status_string(
  termination_status_t termination_status)
{
  switch (termination_status) {
    case termination_status_t::Optimal: return "Optimal";
    case termination_status_t::Infeasible: return "Infeasible";
    case termination_status_t::Unbounded: return "Unbounded";
    case termination_status_t::IterationLimit: return "IterationLimit";
    case termination_status_t::TimeLimit: return "TimeLimit";
    case termination_status_t::NumericalError: return "NumericalError";
    case termination_status_t::NodeLimit: return "NodeLimit";
    case termination_status_t::NoTermination: return "NoTermination";
  }
  return std::string();
}

template <typename i_t, typename f_t>
std::string solution_t<i_t, f_t>::get_termination_status_string() const
{
  return get_termination_status_string(termination_status_);
}

template <typename i_t, typename f_t>
const lpmip::logic_error& solution_t<i_t, f_t>::get_error_status() const
{
  return error_status_;
}

template <typename i_t, typename f_t>
bool solution_t<i_t, f_t>::has_incumbent() const
{
  return has_incumbent_;
}

template <typename i_t, typename f_t>
int64_t solution_t<i_t, f_t>::get_num_nodes() const
{
  return num_nodes_;
}

template <typename i_t, typename f_t>
int64_t solution_t<i_t, f_t>::get_num_simplex_iterations() const
{
  return num_simplex_iterations_;
}

template <typename i_t, typename f_t>
double solution_t<i_t, f_t>::get_total_solve_time() const
{
  return total_solve_time_;
}

template <typename i_t, typename f_t>
void solution_t<i_t, f_t>::log_summary() const
{
  LPMIP_LOG_INFO("Termination Status: %s", get_termination_status_string().c_str());
  if (!has_incumbent_) { return; }
  LPMIP_LOG_INFO("Objective = %g", objective_);
  for (size_t j = 0; j < x_.size(); ++j) {
    LPMIP_LOG_INFO("x[%zu] = %g", j, x_[j]);
  }
}

#if LPMIP_INSTANTIATE_DOUBLE
template class solution_t<int, double>;
#endif

}  // namespace lpmip::linear_programming
