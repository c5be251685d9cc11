/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/logger.hpp>

#include <string>

#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace lpmip::linear_programming::simplex {

// Forwards solver messages to the default logger, prefixed and optionally muted
class logger_t {
 public:
  logger_t() : log(true) {}

  void printf(const char* fmt, ...)
  {
    if (!log) { return; }
    char buffer[1024];
    std::va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    strip_newline(buffer);
    LPMIP_LOG_INFO("%s%s", log_prefix.c_str(), buffer);
  }

  void debug([[maybe_unused]] const char* fmt, ...)
  {
    if (!log) { return; }
    char buffer[1024];
    std::va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    strip_newline(buffer);
    LPMIP_LOG_DEBUG("%s%s", log_prefix.c_str(), buffer);
  }

  bool log;
  std::string log_prefix;

 private:
  static void strip_newline(char* buffer)
  {
    size_t len = strlen(buffer);
    if (len > 0 && buffer[len - 1] == '\n') { buffer[len - 1] = '\0'; }
  }
};

}  // namespace lpmip::linear_programming::simplex
