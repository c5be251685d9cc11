/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#ifndef LPMIP_CONSTANTS_H
#define LPMIP_CONSTANTS_H

#ifdef __cplusplus
#include <limits>
#else
#include <math.h>
#endif

#define LPMIP_INSTANTIATE_DOUBLE 1

/* @brief LP/MIP parameter string constants */
#define LPMIP_TOLERANCE             "tolerance"
#define LPMIP_PIVOT_TOLERANCE       "pivot_tolerance"
#define LPMIP_INTEGRALITY_TOLERANCE "integrality_tolerance"
#define LPMIP_ITERATION_LIMIT       "iteration_limit"
#define LPMIP_NODE_LIMIT            "node_limit"
#define LPMIP_TIME_LIMIT            "time_limit"
#define LPMIP_LOG_FILE              "log_file"
#define LPMIP_LOG_TO_CONSOLE        "log_to_console"

/* @brief LP/MIP termination status constants */
#define LPMIP_TERMINATION_STATUS_NO_TERMINATION  0
#define LPMIP_TERMINATION_STATUS_OPTIMAL         1
#define LPMIP_TERMINATION_STATUS_INFEASIBLE      2
#define LPMIP_TERMINATION_STATUS_UNBOUNDED       3
#define LPMIP_TERMINATION_STATUS_ITERATION_LIMIT 4
#define LPMIP_TERMINATION_STATUS_TIME_LIMIT      5
#define LPMIP_TERMINATION_STATUS_NUMERICAL_ERROR 6
#define LPMIP_TERMINATION_STATUS_NODE_LIMIT      7

/* @brief The constraint sense constants */
#define LPMIP_LESS_THAN    'L'
#define LPMIP_GREATER_THAN 'G'
#define LPMIP_EQUAL        'E'

/* @brief The infinity constant */
#ifdef __cplusplus
#define LPMIP_INFINITY std::numeric_limits<double>::infinity()
#else
#define LPMIP_INFINITY INFINITY
#endif

/* @brief Status codes constants */
#define LPMIP_SUCCESS          0
#define LPMIP_VALIDATION_ERROR 1
#define LPMIP_RUNTIME_ERROR    2

#endif  // LPMIP_CONSTANTS_H
