/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/types.hpp>

#include <vector>

namespace lpmip::linear_programming::simplex {

// Compressed sparse row matrix
template <typename i_t, typename f_t>
class csr_matrix_t {
 public:
  csr_matrix_t(i_t rows, i_t cols, i_t nz) : m(rows), n(cols), row_start(rows + 1, 0), j(nz), x(nz)
  {
  }

  // Append a row. The row indices must be distinct.
  void append_row(const std::vector<i_t>& indices, const std::vector<f_t>& values)
  {
    j.resize(row_start[m]);
    x.resize(row_start[m]);
    j.insert(j.end(), indices.begin(), indices.end());
    x.insert(x.end(), values.begin(), values.end());
    row_start.push_back(static_cast<i_t>(j.size()));
    m++;
  }

  i_t m;                       // number of rows
  i_t n;                       // number of columns
  std::vector<i_t> row_start;  // row pointers (size m + 1)
  std::vector<i_t> j;          // column indices, size nz_max
  std::vector<f_t> x;          // numerical values, size nz_max
};

}  // namespace lpmip::linear_programming::simplex
