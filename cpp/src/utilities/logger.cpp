/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <lpmip/logger.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace lpmip {

namespace {

rapids_logger::level_enum active_level()
{
#if LPMIP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_TRACE
  return rapids_logger::level_enum::trace;
#elif LPMIP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_DEBUG
  return rapids_logger::level_enum::debug;
#elif LPMIP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_WARN
  return rapids_logger::level_enum::warn;
#elif LPMIP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_ERROR
  return rapids_logger::level_enum::error;
#elif LPMIP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_CRITICAL
  return rapids_logger::level_enum::critical;
#elif LPMIP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_OFF
  return rapids_logger::level_enum::off;
#else
  return rapids_logger::level_enum::info;
#endif
}

}  // namespace

rapids_logger::sink_ptr default_sink()
{
  const char* filename = std::getenv("LPMIP_DEBUG_LOG_FILE");
  if (filename != nullptr) {
    return std::make_shared<rapids_logger::basic_file_sink_mt>(std::string(filename), true);
  }
  return std::make_shared<rapids_logger::ostream_sink_mt>(std::cerr);
}

rapids_logger::logger& default_logger()
{
  static rapids_logger::logger logger_ = [] {
    rapids_logger::logger logger_{"LPMIP", {default_sink()}};
    // Solver progress lines are printed bare, debug builds also show time and level
    if (active_level() <= rapids_logger::level_enum::debug) {
      logger_.set_pattern("[%H:%M:%S.%e] [%l] %v");
    } else {
      logger_.set_pattern("%v");
    }
    logger_.set_level(active_level());
    logger_.flush_on(rapids_logger::level_enum::debug);
    return logger_;
  }();
  return logger_;
}

}  // namespace lpmip
