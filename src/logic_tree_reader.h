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
/// Reader of logic trees from XML input files.

#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/noncopyable.hpp>

#include "logic_tree.h"
#include "xml.h"

namespace tremor::lt {

/// Builder of the logic tree from the branching levels of an input file.
///
/// Branch sets attach to the open leaves of the tree built so far:
/// the leaves listed with applyToBranches or all the open leaves.
/// Every attachment receives its own copy of the branch set,
/// so the result is a tree even if a branch set applies to many leaves.
/// The leaves of a branching level open only after the level is complete.
class LogicTreeReader : private boost::noncopyable {
 public:
  /// Reads and validates the logic tree.
  ///
  /// @param[in] xml_file  The path to the logic tree file.
  ///
  /// @throws IOError  The file is not accessible.
  /// @throws xml::ParseError  The file is not well-formed XML.
  /// @throws LogicTreeError  The logic tree is malformed.
  explicit LogicTreeReader(const std::string& xml_file);

  /// @returns The root branch set of the tree.
  std::unique_ptr<BranchSet> root() && { return std::move(root_); }

 private:
  /// Processes the branch sets of a single branching level.
  ///
  /// @param[in] branch_set_nodes  The XML elements of the branch sets.
  void ProcessLevel(const std::vector<xml::Element>& branch_set_nodes);

  /// Constructs the branch set with its branches from the XML element.
  std::unique_ptr<BranchSet> ConstructBranchSet(const xml::Element& node);

  /// Finds the open leaves for the branch set to attach.
  ///
  /// @param[in] node  The XML element of the branch set.
  ///
  /// @returns The leaves to receive the copies of the branch set.
  std::vector<Branch*> GetTargets(const xml::Element& node);

  /// Produces the error with the location of the XML element.
  LogicTreeError MakeError(const xml::Element& node,
                           const std::string& message) const {
    return LogicTreeError(node.line(), filename_, message);
  }

  std::string filename_;  ///< The file with the logic tree.
  std::unique_ptr<BranchSet> root_;  ///< The tree under construction.
  std::vector<Branch*> open_leaves_;  ///< The leaves to attach branch sets.
  std::unordered_set<std::string> branch_ids_;  ///< Unique over the file.
  std::unordered_set<std::string> branchset_ids_;  ///< Unique over the file.
};

}  // namespace tremor::lt
