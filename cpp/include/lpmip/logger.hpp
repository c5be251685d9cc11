/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/logger_macros.hpp>

#include <rapids_logger/logger.hpp>

namespace lpmip {

/**
 * @brief Sink installed when the logger is created: a file sink if the environment variable
 * `LPMIP_DEBUG_LOG_FILE` is set, stderr otherwise.
 */
rapids_logger::sink_ptr default_sink();

/**
 * @brief Process-wide logger named "LPMIP" used by the `LPMIP_LOG_*` macros.
 *
 * Its level follows `LPMIP_LOG_ACTIVE_LEVEL`. `solve` swaps its sinks for the duration of one call
 * according to the solver settings.
 */
rapids_logger::logger& default_logger();

}  // namespace lpmip
