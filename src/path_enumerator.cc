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
/// Implementation of the depth-first path enumeration.

#include "path_enumerator.h"

#include <cassert>

namespace tremor::lt {

PathEnumerator::iterator::iterator(const BranchSet* root) {
  Descend(root);
  Update();
}

void PathEnumerator::iterator::Descend(const BranchSet* branch_set) {
  for (; branch_set; branch_set = stack_.back().branch().child()) {
    assert(!branch_set->branches().empty() && "Empty branch set.");
    stack_.push_back({branch_set, 0});
  }
}

void PathEnumerator::iterator::Update() {
  path_.weight = 1;
  path_.branches.clear();
  for (const Level& level : stack_) {
    path_.weight *= level.weight();
    path_.branches.push_back(level.leaf());
  }
}

void PathEnumerator::iterator::increment() {
  assert(!stack_.empty() && "Incrementing end iterator!");
  while (!stack_.empty() && stack_.back().index + 1 >= stack_.back().size())
    stack_.pop_back();
  if (!stack_.empty()) {
    ++stack_.back().index;
    Descend(stack_.back().branch().child());
  }
  Update();
}

}  // namespace tremor::lt
