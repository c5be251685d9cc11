/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <lpmip/error.hpp>

#include <simplex/types.hpp>

#include <utility>
#include <vector>

namespace lpmip::linear_programming::simplex {

// Column-major dense matrix
template <typename i_t, typename f_t>
class dense_matrix_t {
 public:
  dense_matrix_t(i_t rows, i_t cols) : m(rows), n(cols), values(rows * cols, 0.0) {}

  void resize(i_t rows, i_t cols)
  {
    m = rows;
    n = cols;
    values.assign(rows * cols, 0.0);
  }

  f_t& operator()(i_t row, i_t col) { return values[col * m + row]; }

  f_t operator()(i_t row, i_t col) const { return values[col * m + row]; }

  // Delete a row, shifting the rows below it up by one
  void remove_row(i_t row)
  {
    LPMIP_EXPECTS(row >= 0 && row < m, "Row %d out of range", static_cast<int>(row));
    std::vector<f_t> compacted;
    compacted.reserve((m - 1) * n);
    for (i_t j = 0; j < n; j++) {
      for (i_t i = 0; i < m; i++) {
        if (i != row) { compacted.push_back(this->operator()(i, j)); }
      }
    }
    values = std::move(compacted);
    m--;
  }

  i_t m;
  i_t n;
  std::vector<f_t> values;
};

}  // namespace lpmip::linear_programming::simplex
