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
/// Logic tree of branch sets and branches
/// representing epistemic uncertainties of seismic source models.

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "source.h"
#include "uncertainty.h"

namespace tremor::lt {

class BranchSet;

/// An alternative choice at a decision point of the logic tree.
/// Branches own their child branch sets,
/// so the copy of a branch is a deep copy of the subtree.
class Branch {
 public:
  /// @param[in] branch_id  The unique identifier within the branch set.
  /// @param[in] weight  The probability weight in (0, 1].
  /// @param[in] value  The parsed uncertainty value.
  /// @param[in] child  The optional branch set of the next level.
  Branch(std::string branch_id, double weight, UncertaintyValue value,
         std::unique_ptr<BranchSet> child = nullptr);

  /// Copies the branch together with its subtree.
  /// @{
  Branch(const Branch& other);
  Branch& operator=(const Branch& other);
  /// @}

  Branch(Branch&&) noexcept;  ///< Moves the subtree.
  Branch& operator=(Branch&&) noexcept;  ///< Moves the subtree.
  ~Branch();

  /// @returns The identifier of the branch.
  const std::string& branch_id() const { return branch_id_; }

  /// @returns The probability weight of the branch.
  double weight() const { return weight_; }

  /// @returns The uncertainty value of the branch.
  const UncertaintyValue& value() const { return value_; }

  /// @returns The branch set conditioned on this branch.
  ///          nullptr if the branch is a leaf.
  /// @{
  const BranchSet* child() const { return child_.get(); }
  BranchSet* child() { return child_.get(); }
  /// @}

  /// Attaches the next level branch set to this branch.
  ///
  /// @param[in] branch_set  The branch set to be owned by the branch.
  void child(std::unique_ptr<BranchSet> branch_set) {
    child_ = std::move(branch_set);
  }

 private:
  std::string branch_id_;
  double weight_;
  UncertaintyValue value_;
  std::unique_ptr<BranchSet> child_;
};

/// Applicability filters of branch sets.
/// The keys are the filter names of the input format:
/// applyToTectonicRegionType, applyToSourceType, applyToSources.
/// The source identifiers are separated by whitespace.
using Filters = std::map<std::string, std::string>;

/// The chosen branch set and the chosen value at one decision level.
using BsetValue = std::pair<const BranchSet*, const UncertaintyValue*>;

/// The branch-set and value pairs along one path of the tree.
using BsetValues = std::vector<BsetValue>;

/// Mutually exclusive alternatives of one decision point.
class BranchSet {
 public:
  /// @param[in] uncertainty_type  The type of the branch values.
  /// @param[in] branchset_id  The identifier for diagnostics.
  /// @param[in] filters  The applicability filters.
  /// @param[in] collapsed  Fan out the branches instead of sampling.
  BranchSet(UncertaintyType uncertainty_type, std::string branchset_id,
            Filters filters = {}, bool collapsed = false)
      : uncertainty_type_(uncertainty_type),
        branchset_id_(std::move(branchset_id)),
        filters_(std::move(filters)),
        collapsed_(collapsed) {}

  /// @returns The type of the uncertainty values of the branches.
  UncertaintyType uncertainty_type() const { return uncertainty_type_; }

  /// @returns The identifier of the branch set.
  const std::string& branchset_id() const { return branchset_id_; }

  /// @returns The applicability filters.
  const Filters& filters() const { return filters_; }

  /// @returns true if the branch set is collapsed.
  bool collapsed() const { return collapsed_; }

  /// @returns The branches in the order of definition.
  /// @{
  const std::vector<Branch>& branches() const { return branches_; }
  std::vector<Branch>& branches() { return branches_; }
  /// @}

  /// Appends a new alternative.
  ///
  /// @param[in] branch  The branch with a unique identifier.
  ///
  /// @throws DuplicateElementError  The branch identifier is taken.
  void Add(Branch branch);

  /// Finds the branch by its identifier.
  ///
  /// @param[in] branch_id  The identifier of the branch.
  ///
  /// @returns The branch with the identifier.
  ///
  /// @throws UndefinedElement  No such branch in the set.
  const Branch& Get(const std::string& branch_id) const;

  /// @copydoc Get
  const Branch& operator[](const std::string& branch_id) const {
    return Get(branch_id);
  }

  /// Tests the applicability of the branch set uncertainty to a source.
  /// All the filters must pass.
  ///
  /// @param[in] source  The source under consideration.
  ///
  /// @returns true if the source passes all the filters.
  ///
  /// @throws LogicError  The filter key or source type name is unknown.
  bool Applies(const model::Source& source) const;

  /// Collects the values chosen along the chain of branch identifiers.
  /// The walk stops at a leaf branch
  /// even if some identifiers remain unconsumed.
  ///
  /// @param[in] branch_ids  The identifiers of the chosen branches
  ///                        starting with this branch set.
  ///
  /// @returns The branch set and value pairs in the order of levels.
  ///
  /// @throws UndefinedElement  A branch identifier is not found.
  BsetValues GetBsetValues(const std::vector<std::string>& branch_ids) const;

  /// Draws one random path from this branch set to a leaf.
  /// Collapsed branch sets contribute their first branch without sampling.
  ///
  /// @param[in] seed  The seed for every level draw.
  ///
  /// @returns The chosen branches in the order of levels.
  std::vector<const Branch*> Sample(std::uint32_t seed) const;

 private:
  /// Tests the source against a single filter.
  bool Passes(const std::string& key, const std::string& value,
              const model::Source& source) const;

  UncertaintyType uncertainty_type_;
  std::string branchset_id_;
  Filters filters_;
  bool collapsed_;
  std::vector<Branch> branches_;
};

/// @returns The identifiers of the branches on the path.
/// @{
std::vector<std::string> GetBranchIds(const std::vector<const Branch*>& path);
std::vector<std::string> GetBranchIds(const std::vector<Branch>& path);
/// @}

}  // namespace tremor::lt
