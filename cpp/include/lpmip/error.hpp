/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */
#pragma once

#include <lpmip/linear_programming/constants.h>

#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace lpmip {

/**
 * @brief Error categories reported through lpmip::logic_error
 */
enum class error_type_t {
  Success         = LPMIP_SUCCESS,
  ValidationError = LPMIP_VALIDATION_ERROR,  // malformed problem or setting
  RuntimeError    = LPMIP_RUNTIME_ERROR      // the solver cannot proceed on valid input
};

inline const char* error_to_string(error_type_t error)
{
  switch (error) {
    case error_type_t::Success: return "Success";
    case error_type_t::ValidationError: return "ValidationError";
    case error_type_t::RuntimeError: return "RuntimeError";
  }
  return "UnknownError";
}

/**
 * @brief Exception thrown on invalid input or a violated solver precondition.
 *
 * `solve` never lets it escape: it is returned through `solution_t::get_error_status()`.
 * Throw it through lpmip_expects, LPMIP_EXPECTS or LPMIP_FAIL.
 */
class logic_error : public std::logic_error {
 public:
  logic_error(const std::string& message, error_type_t error_type)
    : std::logic_error(message), error_type_(error_type)
  {
  }

  error_type_t get_error_type() const noexcept { return error_type_; }

 private:
  error_type_t error_type_;
};

namespace detail {

inline std::string format_message(error_type_t error_type, const char* fmt, va_list args)
{
  char msg[2048];
  std::vsnprintf(msg, sizeof(msg), fmt, args);
  return std::string(error_to_string(error_type)) + ": " + msg;
}

[[noreturn]] inline void throw_error(error_type_t error_type, const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  const std::string msg = format_message(error_type, fmt, args);
  va_end(args);
  throw lpmip::logic_error(msg, error_type);
}

}  // namespace detail

/**
 * @brief Throws lpmip::logic_error of type `error_type` with a printf-style message when `cond`
 * is false. Used for errors in the caller's input.
 */
inline void lpmip_expects(bool cond, error_type_t error_type, const char* fmt, ...)
{
  if (cond) { return; }
  va_list args;
  va_start(args, fmt);
  const std::string msg = detail::format_message(error_type, fmt, args);
  va_end(args);
  throw lpmip::logic_error(msg, error_type);
}

/**
 * @brief Internal precondition check. Throws a RuntimeError lpmip::logic_error prefixed with the
 * source location. `fmt` must be a string literal.
 */
#define LPMIP_EXPECTS(cond, fmt, ...)                                                         \
  do {                                                                                        \
    if (!(cond)) {                                                                            \
      lpmip::detail::throw_error(                                                             \
        lpmip::error_type_t::RuntimeError, "%s:%d " fmt, __FILE__, __LINE__, ##__VA_ARGS__); \
    }                                                                                         \
  } while (0)

// Unconditional form of LPMIP_EXPECTS
#define LPMIP_FAIL(fmt, ...)       \
  lpmip::detail::throw_error(      \
    lpmip::error_type_t::RuntimeError, "%s:%d " fmt, __FILE__, __LINE__, ##__VA_ARGS__)

}  // namespace lpmip
