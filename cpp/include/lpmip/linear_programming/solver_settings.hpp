/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/linear_programming/constants.h>

#include <cstdint>
#include <limits>
#include <string>

namespace lpmip::linear_programming {

/**
 * @brief Settings accepted by `solve`.
 *
 * All numeric tolerances are absolute. `tolerance` is the zero test shared by every component
 * that compares reduced costs, ratios or bound violations.
 *
 * @tparam i_t Integer type. int32_t is supported.
 * @tparam f_t Floating point type. double is supported.
 */
template <typename i_t, typename f_t>
class solver_settings_t {
 public:
  solver_settings_t() = default;

  /**
   * @brief Set a parameter from its name (see constants.h) and a string value.
   *
   * @throw lpmip::logic_error if the name is unknown or the value cannot be parsed.
   */
  void set_parameter_from_string(const std::string& name, const std::string& value);

  /**
   * @brief Read back a parameter as a string.
   *
   * @throw lpmip::logic_error if the name is unknown.
   */
  std::string get_parameter_as_string(const std::string& name) const;

  f_t tolerance             = 1e-9;
  f_t pivot_tolerance       = 1e-9;
  f_t integrality_tolerance = 1e-6;
  int64_t iteration_limit   = 1000000;
  int64_t node_limit        = 100000;
  f_t time_limit            = std::numeric_limits<f_t>::infinity();
  bool log_to_console       = true;
  std::string log_file;
};

}  // namespace lpmip::linear_programming
