/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <lpmip/error.hpp>
#include <lpmip/linear_programming/solver_settings.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace lpmip::linear_programming {

namespace {

double parse_float(const std::string& name, const std::string& value)
{
  try {
    size_t pos      = 0;
    const double v  = std::stod(value, &pos);
    const bool full = pos == value.size();
    lpmip_expects(full,
                  error_type_t::ValidationError,
                  "Invalid value %s for parameter %s",
                  value.c_str(),
                  name.c_str());
    return v;
  } catch (const std::invalid_argument&) {
    lpmip_expects(false,
                  error_type_t::ValidationError,
                  "Invalid value %s for parameter %s",
                  value.c_str(),
                  name.c_str());
  } catch (const std::out_of_range&) {
    lpmip_expects(false,
                  error_type_t::ValidationError,
                  "Value %s out of range for parameter %s",
                  value.c_str(),
                  name.c_str());
  }
  return 0.0;
}

int64_t parse_int(const std::string& name, const std::string& value)
{
  try {
    size_t pos      = 0;
    const int64_t v = std::stoll(value, &pos);
    lpmip_expects(pos == value.size(),
                  error_type_t::ValidationError,
                  "Invalid value %s for parameter %s",
                  value.c_str(),
                  name.c_str());
    return v;
  } catch (const std::invalid_argument&) {
    lpmip_expects(false,
                  error_type_t::ValidationError,
                  "Invalid value %s for parameter %s",
                  value.c_str(),
                  name.c_str());
  } catch (const std::out_of_range&) {
    lpmip_expects(false,
                  error_type_t::ValidationError,
                  "Value %s out of range for parameter %s",
                  value.c_str(),
                  name.c_str());
  }
  return 0;
}

bool parse_bool(const std::string& name, const std::string& value)
{
  if (value == "true" || value == "1") { return true; }
  if (value == "false" || value == "0") { return false; }
  lpmip_expects(false,
                error_type_t::ValidationError,
                "Invalid value %s for parameter %s",
                value.c_str(),
                name.c_str());
  return false;
}

template <typename T>
std::string to_string(T value)
{
  std::ostringstream os;
  os << value;
  return os.str();
}

}  // namespace

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_parameter_from_string(const std::string& name,
                                                            const std::string& value)
{
  if (name == LPMIP_TOLERANCE) {
    tolerance = parse_float(name, value);
  } else if (name == LPMIP_PIVOT_TOLERANCE) {
    pivot_tolerance = parse_float(name, value);
  } else if (name == LPMIP_INTEGRALITY_TOLERANCE) {
    integrality_tolerance = parse_float(name, value);
  } else if (name == LPMIP_ITERATION_LIMIT) {
    iteration_limit = parse_int(name, value);
  } else if (name == LPMIP_NODE_LIMIT) {
    node_limit = parse_int(name, value);
  } else if (name == LPMIP_TIME_LIMIT) {
    time_limit = parse_float(name, value);
  } else if (name == LPMIP_LOG_TO_CONSOLE) {
    log_to_console = parse_bool(name, value);
  } else if (name == LPMIP_LOG_FILE) {
    log_file = value;
  } else {
    lpmip_expects(false, error_type_t::ValidationError, "Unknown parameter %s", name.c_str());
  }
}

template <typename i_t, typename f_t>
std::string solver_settings_t<i_t, f_t>::get_parameter_as_string(const std::string& name) const
{
  if (name == LPMIP_TOLERANCE) { return to_string(tolerance); }
  if (name == LPMIP_PIVOT_TOLERANCE) { return to_string(pivot_tolerance); }
  if (name == LPMIP_INTEGRALITY_TOLERANCE) { return to_string(integrality_tolerance); }
  if (name == LPMIP_ITERATION_LIMIT) { return to_string(iteration_limit); }
  if (name == LPMIP_NODE_LIMIT) { return to_string(node_limit); }
  if (name == LPMIP_TIME_LIMIT) { return to_string(time_limit); }
  if (name == LPMIP_LOG_TO_CONSOLE) { return log_to_console ? "true" : "false"; }
  if (name == LPMIP_LOG_FILE) { return log_file; }
  lpmip_expects(false, error_type_t::ValidationError, "Unknown parameter %s", name.c_str());
  return std::string();
}

#if LPMIP_INSTANTIATE_DOUBLE
template class solver_settings_t<int, double>;
#endif

}  // namespace lpmip::linear_programming
