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

namespace lpmip::linear_programming::simplex {

using float64_t = double;

constexpr float64_t inf = std::numeric_limits<float64_t>::infinity();

}  // namespace lpmip::linear_programming::simplex
