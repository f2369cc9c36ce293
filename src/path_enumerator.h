/*
 * Copyright (C) 2014-2018 Olzhas Rakhimov
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

/// @file
/// Lazy enumeration of all weighted paths of a logic tree.

#pragma once

#include <iterator>
#include <vector>

#include <boost/iterator/iterator_facade.hpp>

#include "logic_tree.h"

namespace tremor::lt {

/// One root-to-leaf path of the logic tree.
struct Path {
  /// The product of the branch weights.
  double weight = 1;
  /// Leaf copies of the chosen branches in the order of levels.
  /// Collapsed branch sets contribute their first branch with the weight of 1.
  std::vector<Branch> branches;
};

/// The range of all paths in depth-first order.
/// The enumeration is lazy (one path at a time)
/// and restartable (every begin() starts anew).
///
/// @pre The tree outlives the enumerator and its iterators.
class PathEnumerator {
 public:
  /// Iterator with an explicit stack of levels.
  class iterator : public boost::iterator_facade<iterator, const Path,
                                                 std::forward_iterator_tag> {
    friend class boost::iterator_core_access;

   public:
    /// Constructs the end iterator.
    iterator() = default;

    /// Starts the enumeration at the first path.
    ///
    /// @param[in] root  The root branch set of the tree.
    explicit iterator(const BranchSet* root);

   private:
    /// The position at one level of the tree.
    struct Level {
      const BranchSet* branch_set;  ///< The non-empty branch set.
      int index;  ///< The index of the current branch.

      /// @returns The number of branches to enumerate in the set.
      int size() const {
        return branch_set->collapsed()
                   ? 1
                   : static_cast<int>(branch_set->branches().size());
      }

      /// @returns The current branch.
      const Branch& branch() const {
        return branch_set->branches()[index];
      }

      /// @returns The contribution of the level into the path weight.
      double weight() const {
        return branch_set->collapsed() ? 1 : branch().weight();
      }

      /// @returns The childless copy of the branch with the level weight.
      Branch leaf() const {
        return Branch(branch().branch_id(), weight(), branch().value());
      }

      bool operator==(const Level& other) const {
        return branch_set == other.branch_set && index == other.index;
      }
    };

    /// Pushes the first branches of the levels down to a leaf.
    ///
    /// @param[in] branch_set  The branch set to start the descent.
    void Descend(const BranchSet* branch_set);

    /// Updates the current path from the stack of levels.
    void Update();

    /// Standard iterator functionality required by the facade facilities.
    /// @{
    void increment();
    bool equal(const iterator& other) const { return stack_ == other.stack_; }
    const Path& dereference() const { return path_; }
    /// @}

    std::vector<Level> stack_;  ///< Empty for the end iterator.
    Path path_;  ///< The path at the current position.
  };

  using const_iterator = iterator;  ///< The tree is immutable.

  /// @param[in] root  The root branch set of the tree.
  explicit PathEnumerator(const BranchSet& root) : root_(&root) {}

  /// The range begin and end iterators.
  /// @{
  iterator begin() const { return iterator(root_); }
  iterator end() const { return iterator(); }
  /// @}

 private:
  const BranchSet* root_;  ///< The root of the tree.
};

}  // namespace tremor::lt
