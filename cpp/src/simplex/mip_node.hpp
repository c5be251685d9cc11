/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <simplex/logger.hpp>
#include <simplex/types.hpp>

#include <lpmip/error.hpp>

#include <cmath>
#include <utility>
#include <vector>

namespace lpmip::linear_programming::simplex {

enum class node_status_t : int {
  ACTIVE           = 0,  // Node still in the tree
  INTEGER_FEASIBLE = 1,  // Node has an integer feasible solution
  INFEASIBLE       = 2,  // Node is infeasible
  FATHOMED         = 3,  // Node objective is greater than the upper bound
  HAS_CHILDREN     = 4,  // Node has children to explore
  NUMERICAL        = 5,  // Encountered numerical issue when solving the LP relaxation
  ITERATION_LIMIT  = 6,  // Pivot limit reached during the LP relaxation
  TIME_LIMIT       = 7   // Time out during the LP relaxation
};

inline bool inactive_status(node_status_t status)
{
  return status != node_status_t::ACTIVE && status != node_status_t::HAS_CHILDREN;
}

// A node stores only the bound it changed. Parent and children are slots in the search tree.
template <typename i_t, typename f_t>
struct mip_node_t {
  node_status_t status{node_status_t::ACTIVE};
  f_t lower_bound{-inf};  // Relaxed objective of the parent
  i_t depth{0};
  i_t node_id{0};
  i_t parent{-1};
  i_t children[2]{-1, -1};
  i_t branch_var{-1};
  i_t branch_dir{-1};  // 0 down, 1 up
  f_t branch_var_lower{-inf};
  f_t branch_var_upper{inf};
  f_t fractional_val{0.0};
};

/**
 * @brief Branch-and-bound tree stored in a flat arena.
 *
 * Nodes refer to each other by slot index. When both children of a node are resolved their slots
 * are returned to the free list and the parent is resolved in turn, so a depth-first search keeps
 * only the nodes on the current path and their pending siblings.
 */
template <typename i_t, typename f_t>
class search_tree_t {
 public:
  search_tree_t() : num_nodes(0) {}

  i_t create_root(f_t root_lower_bound)
  {
    nodes.clear();
    free_slots.clear();
    const i_t root          = allocate();
    nodes[root].lower_bound = root_lower_bound;
    num_nodes               = 1;
    return root;
  }

  // Create the children x_j <= floor(v) and x_j >= ceil(v). `lower` and `upper` are the bounds
  // in effect at the parent.
  std::pair<i_t, i_t> branch(i_t parent_slot,
                             i_t branch_var,
                             f_t fractional_val,
                             f_t parent_objective,
                             const std::vector<f_t>& lower,
                             const std::vector<f_t>& upper,
                             logger_t& log)
  {
    i_t child_slots[2];
    for (i_t dir = 0; dir < 2; ++dir) {
      const i_t slot              = allocate();
      mip_node_t<i_t, f_t>& child = nodes[slot];
      child.lower_bound           = parent_objective;
      child.depth                 = nodes[parent_slot].depth + 1;
      child.node_id               = num_nodes++;
      child.parent                = parent_slot;
      child.branch_var            = branch_var;
      child.branch_dir            = dir;
      child.fractional_val        = fractional_val;
      child.branch_var_lower      = dir == 0 ? lower[branch_var] : std::ceil(fractional_val);
      child.branch_var_upper      = dir == 0 ? std::floor(fractional_val) : upper[branch_var];
      child_slots[dir]            = slot;
      log.debug("Node %d -> Node %d x%d %s %g\n",
                nodes[parent_slot].node_id,
                child.node_id,
                branch_var,
                dir == 0 ? "<=" : ">=",
                dir == 0 ? child.branch_var_upper : child.branch_var_lower);
    }
    nodes[parent_slot].children[0] = child_slots[0];
    nodes[parent_slot].children[1] = child_slots[1];
    nodes[parent_slot].status      = node_status_t::HAS_CHILDREN;
    return {child_slots[0], child_slots[1]};
  }

  // Apply the bounds changed on the path from the root to `slot`. The deepest change wins.
  void get_variable_bounds(i_t slot, std::vector<f_t>& lower, std::vector<f_t>& upper) const
  {
    std::vector<bool> fixed(lower.size(), false);
    for (i_t s = slot; s >= 0; s = nodes[s].parent) {
      const mip_node_t<i_t, f_t>& node = nodes[s];
      if (node.branch_var < 0 || fixed[node.branch_var]) { continue; }
      lower[node.branch_var] = node.branch_var_lower;
      upper[node.branch_var] = node.branch_var_upper;
      fixed[node.branch_var] = true;
    }
  }

  // Set the status of a node. Resolved subtrees are released back to the arena.
  void update_tree(i_t slot, node_status_t status)
  {
    nodes[slot].status = status;
    if (!inactive_status(status)) { return; }
    i_t parent_slot = nodes[slot].parent;
    while (parent_slot >= 0) {
      mip_node_t<i_t, f_t>& parent = nodes[parent_slot];
      if (!inactive_status(nodes[parent.children[0]].status) ||
          !inactive_status(nodes[parent.children[1]].status)) {
        break;
      }
      release(parent.children[0]);
      release(parent.children[1]);
      parent.children[0] = -1;
      parent.children[1] = -1;
      parent.status      = node_status_t::FATHOMED;
      parent_slot        = parent.parent;
    }
  }

  const mip_node_t<i_t, f_t>& operator[](i_t slot) const { return nodes[slot]; }

  // Number of slots currently holding a node
  i_t live_nodes() const
  {
    return static_cast<i_t>(nodes.size()) - static_cast<i_t>(free_slots.size());
  }

  i_t num_nodes;  // Nodes created so far, used as node ids

 private:
  i_t allocate()
  {
    if (!free_slots.empty()) {
      const i_t slot = free_slots.back();
      free_slots.pop_back();
      nodes[slot] = mip_node_t<i_t, f_t>{};
      return slot;
    }
    nodes.emplace_back();
    return static_cast<i_t>(nodes.size()) - 1;
  }

  void release(i_t slot)
  {
    LPMIP_EXPECTS(slot >= 0 && slot < static_cast<i_t>(nodes.size()),
                  "Releasing invalid node slot %d",
                  static_cast<int>(slot));
    free_slots.push_back(slot);
  }

  std::vector<mip_node_t<i_t, f_t>> nodes;
  std::vector<i_t> free_slots;
};

}  // namespace lpmip::linear_programming::simplex
