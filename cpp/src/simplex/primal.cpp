/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <simplex/primal.hpp>

#include <algorithm>
#include <cmath>

namespace lpmip::linear_programming::simplex {

namespace {

// Returns the entering column or -1 if no eligible column prices out negative
template <typename i_t, typename f_t>
i_t select_entering(const std::vector<f_t>& reduced_costs,
                    const std::vector<bool>& eligible,
                    const std::vector<bool>& rejected,
                    f_t tolerance,
                    bool bland)
{
  const i_t n       = static_cast<i_t>(reduced_costs.size());
  i_t entering      = -1;
  f_t most_negative = -tolerance;
  for (i_t j = 0; j < n; ++j) {
    if (!eligible[j] || rejected[j]) { continue; }
    if (reduced_costs[j] < most_negative) {
      entering      = j;
      most_negative = reduced_costs[j];
      if (bland) { break; }
    }
  }
  return entering;
}

// Rows that attain the minimum ratio for column q within tolerance, lowest row first. Only these
// rows keep the basis primal feasible when q enters.
template <typename i_t, typename f_t>
std::vector<i_t> ratio_test(const tableau_t<i_t, f_t>& tableau, i_t q, f_t tolerance)
{
  const i_t m   = tableau.num_rows();
  f_t min_ratio = inf;
  for (i_t i = 0; i < m; ++i) {
    const f_t a = tableau(i, q);
    if (a > tolerance) { min_ratio = std::min(min_ratio, tableau.rhs()[i] / a); }
  }

  std::vector<i_t> rows;
  if (min_ratio == inf) { return rows; }
  for (i_t i = 0; i < m; ++i) {
    const f_t a = tableau(i, q);
    if (a > tolerance && tableau.rhs()[i] / a <= min_ratio + tolerance) { rows.push_back(i); }
  }
  return rows;
}

}  // namespace

const char* lp_status_to_string(lp_status_t status)
{
  switch (status) {
    case lp_status_t::OPTIMAL: return "optimal";
    case lp_status_t::INFEASIBLE: return "infeasible";
    case lp_status_t::UNBOUNDED: return "unbounded";
    case lp_status_t::ITERATION_LIMIT: return "iteration limit";
    case lp_status_t::TIME_LIMIT: return "time limit";
    case lp_status_t::NUMERICAL_ISSUES: return "numerical issues";
    case lp_status_t::UNSET: return "unset";
  }
  return "unknown";
}

template <typename i_t, typename f_t>
lp_status_t primal_iterations(tableau_t<i_t, f_t>& tableau,
                              const std::vector<bool>& eligible,
                              const simplex_solver_settings_t<i_t, f_t>& settings,
                              const timer_t& timer,
                              int64_t& iterations)
{
  const i_t n    = tableau.num_cols();
  const f_t tol  = settings.tolerance;
  i_t zero_steps = 0;
  std::vector<bool> rejected(n, false);

  while (true) {
    const bool bland = zero_steps >= settings.bland_switch;
    std::fill(rejected.begin(), rejected.end(), false);

    bool pivoted    = false;
    bool priced_out = true;
    while (!pivoted) {
      const i_t q =
        select_entering<i_t, f_t>(tableau.reduced_costs(), eligible, rejected, tol, bland);
      if (q < 0) { break; }
      priced_out = false;

      const std::vector<i_t> candidates = ratio_test(tableau, q, tol);
      if (candidates.empty()) {
        settings.log.debug("Column %d has no positive entry\n", q);
        return lp_status_t::UNBOUNDED;
      }

      if (iterations >= settings.iteration_limit) { return lp_status_t::ITERATION_LIMIT; }
      if (timer.check_time_limit()) { return lp_status_t::TIME_LIMIT; }

      for (i_t r : candidates) {
        const f_t step = tableau.rhs()[r] / tableau(r, q);
        try {
          tableau.pivot(q, r);
        } catch (const degenerate_pivot_error& e) {
          settings.log.debug("%s\n", e.what());
          continue;
        }
        iterations++;
        pivoted    = true;
        zero_steps = step <= tol ? zero_steps + 1 : 0;
        if (settings.iteration_log_frequency > 0 &&
            iterations % settings.iteration_log_frequency == 0) {
          settings.log.printf("%8ld objective %+.8e time %.2f\n",
                              static_cast<long>(iterations),
                              tableau.objective(),
                              timer.elapsed_time());
        }
        break;
      }
      if (!pivoted) { rejected[q] = true; }
    }

    if (priced_out) { return lp_status_t::OPTIMAL; }
    if (!pivoted) {
      settings.log.printf("No entering column admits a stable pivot\n");
      return lp_status_t::NUMERICAL_ISSUES;
    }
  }
}

template <typename i_t, typename f_t>
lp_status_t primal_simplex(const lp_problem_t<i_t, f_t>& lp,
                           const simplex_solver_settings_t<i_t, f_t>& settings,
                           const timer_t& timer,
                           std::vector<f_t>& x,
                           f_t& objective,
                           int64_t& iterations)
{
  const i_t n = lp.num_cols;
  tableau_t<i_t, f_t> tableau(lp.A, lp.rhs, lp.basis, settings.pivot_tol);

  if (lp.num_artificial > 0) {
    // Phase 1: minimize the sum of the artificial variables
    std::vector<f_t> phase1_cost(n, 0.0);
    for (i_t j = n - lp.num_artificial; j < n; ++j) {
      phase1_cost[j] = 1.0;
    }
    tableau.set_objective(phase1_cost);
    std::vector<bool> all_columns(n, true);
    lp_status_t status = primal_iterations(tableau, all_columns, settings, timer, iterations);
    if (status == lp_status_t::UNBOUNDED) { return lp_status_t::NUMERICAL_ISSUES; }
    if (status != lp_status_t::OPTIMAL) { return status; }

    settings.log.debug("Phase 1 objective %e after %ld iterations\n",
                       tableau.objective(),
                       static_cast<long>(iterations));
    if (tableau.objective() > settings.tolerance) { return lp_status_t::INFEASIBLE; }

    // Drive the artificial variables that remain basic at zero out of the basis
    const f_t drive_tol = std::max(settings.tolerance, settings.pivot_tol);
    i_t i               = 0;
    while (i < tableau.num_rows()) {
      if (!lp.is_artificial(tableau.basis()[i])) {
        i++;
        continue;
      }
      i_t replacement = -1;
      for (i_t j = 0; j < n - lp.num_artificial; ++j) {
        if (std::abs(tableau(i, j)) > drive_tol) {
          replacement = j;
          break;
        }
      }
      if (replacement < 0) {
        settings.log.debug("Removing redundant row %d\n", i);
        tableau.remove_row(i);
        continue;
      }
      tableau.pivot(replacement, i);
      i++;
    }
  }

  // Phase 2: minimize the objective over the non-artificial columns
  std::vector<bool> eligible(n, true);
  for (i_t j = n - lp.num_artificial; j < n; ++j) {
    eligible[j] = false;
  }
  tableau.set_objective(lp.objective);
  lp_status_t status = primal_iterations(tableau, eligible, settings, timer, iterations);
  settings.log.debug("Phase 2 %s after %ld iterations\n",
                     lp_status_to_string(status),
                     static_cast<long>(iterations));
  if (status != lp_status_t::OPTIMAL) { return status; }

  x         = tableau.current_solution();
  objective = tableau.objective() + lp.obj_constant;
  return lp_status_t::OPTIMAL;
}

#ifdef LPMIP_INSTANTIATE_DOUBLE

template lp_status_t primal_iterations<int, double>(
  tableau_t<int, double>& tableau,
  const std::vector<bool>& eligible,
  const simplex_solver_settings_t<int, double>& settings,
  const timer_t& timer,
  int64_t& iterations);

template lp_status_t primal_simplex<int, double>(
  const lp_problem_t<int, double>& lp,
  const simplex_solver_settings_t<int, double>& settings,
  const timer_t& timer,
  std::vector<double>& x,
  double& objective,
  int64_t& iterations);

#endif

}  // namespace lpmip::linear_programming::simplex
