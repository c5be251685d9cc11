/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */
#pragma once

#include <lpmip/logger.hpp>

#include <memory>
#include <string>
#include <vector>

namespace lpmip::linear_programming {

// Routes the default logger to the sinks requested by the solver settings and puts the previous
// sinks back when it goes out of scope
class init_logger_t {
 public:
  init_logger_t(const std::string& log_file, bool log_to_console)
    : saved_sinks_(lpmip::default_logger().sinks())
  {
    auto& sinks = lpmip::default_logger().sinks();
    if (!log_to_console) { sinks.clear(); }
    if (!log_file.empty()) {
      sinks.push_back(std::make_shared<rapids_logger::basic_file_sink_mt>(log_file, true));
    }
  }
  ~init_logger_t() { lpmip::default_logger().sinks() = saved_sinks_; }

  init_logger_t(const init_logger_t&)            = delete;
  init_logger_t& operator=(const init_logger_t&) = delete;

 private:
  std::vector<rapids_logger::sink_ptr> saved_sinks_;
};

}  // namespace lpmip::linear_programming
