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
/// Implementation of logic tree traversal primitives.

#include "logic_tree.h"

#include <cassert>

#include <algorithm>
#include <iterator>

#include "error.h"
#include "logger.h"
#include "random.h"
#include "xml.h"

namespace tremor::lt {

Branch::Branch(std::string branch_id, double weight, UncertaintyValue value,
               std::unique_ptr<BranchSet> child)
    : branch_id_(std::move(branch_id)),
      weight_(weight),
      value_(std::move(value)),
      child_(std::move(child)) {}

Branch::Branch(const Branch& other)
    : branch_id_(other.branch_id_),
      weight_(other.weight_),
      value_(other.value_),
      child_(other.child_ ? std::make_unique<BranchSet>(*other.child_)
                          : nullptr) {}

Branch& Branch::operator=(const Branch& other) {
  Branch copy(other);
  return *this = std::move(copy);
}

Branch::Branch(Branch&&) noexcept = default;
Branch& Branch::operator=(Branch&&) noexcept = default;
Branch::~Branch() = default;

void BranchSet::Add(Branch branch) {
  auto it = std::find_if(branches_.begin(), branches_.end(),
                         [&branch](const Branch& member) {
                           return member.branch_id() == branch.branch_id();
                         });
  if (it != branches_.end())
    TREMOR_THROW(DuplicateElementError())
        << errinfo_branch_id(branch.branch_id())
        << errinfo_branchset_id(branchset_id_);
  branches_.push_back(std::move(branch));
}

const Branch& BranchSet::Get(const std::string& branch_id) const {
  auto it = std::find_if(branches_.begin(), branches_.end(),
                         [&branch_id](const Branch& branch) {
                           return branch.branch_id() == branch_id;
                         });
  if (it == branches_.end())
    TREMOR_THROW(UndefinedElement())
        << errinfo_branch_id(branch_id) << errinfo_branchset_id(branchset_id_);
  return *it;
}

bool BranchSet::Applies(const model::Source& source) const {
  return std::all_of(filters_.begin(), filters_.end(),
                     [this, &source](const auto& filter) {
                       return Passes(filter.first, filter.second, source);
                     });
}

bool BranchSet::Passes(const std::string& key, const std::string& value,
                       const model::Source& source) const {
  if (key == "applyToTectonicRegionType")
    return source.tectonic_region_type() == value;

  if (key == "applyToSourceType") {
    if (value == "point")  // Area sources are not points for the filter.
      return dynamic_cast<const model::PointSource*>(&source) &&
             !dynamic_cast<const model::AreaSource*>(&source);
    if (value == "area")
      return dynamic_cast<const model::AreaSource*>(&source);
    if (value == "simpleFault")
      return dynamic_cast<const model::SimpleFaultSource*>(&source);
    if (value == "complexFault")
      return dynamic_cast<const model::ComplexFaultSource*>(&source);
    if (value == "characteristicFault")
      return dynamic_cast<const model::CharacteristicFaultSource*>(&source);
    TREMOR_THROW(LogicError("Unknown source type for the filter"))
        << errinfo_filter(key) << errinfo_value(value)
        << errinfo_branchset_id(branchset_id_);
  }

  if (key == "applyToSources") {
    std::vector<std::string_view> ids = xml::detail::split(value);
    return std::find(ids.begin(), ids.end(), source.source_id()) != ids.end();
  }

  TREMOR_THROW(LogicError("Unknown filter"))
      << errinfo_filter(key) << errinfo_branchset_id(branchset_id_);
}

BsetValues BranchSet::GetBsetValues(
    const std::vector<std::string>& branch_ids) const {
  BsetValues values;
  const BranchSet* branch_set = this;
  auto it = branch_ids.begin();
  for (; it != branch_ids.end() && branch_set; ++it) {
    const Branch& branch = branch_set->Get(*it);
    values.emplace_back(branch_set, &branch.value());
    branch_set = branch.child();
  }
  BLOG(WARNING, it != branch_ids.end())
      << "Branch set " << branchset_id_ << ": "
      << std::distance(it, branch_ids.end())
      << " branch ID(s) past the leaf are ignored, starting with " << *it;
  return values;
}

std::vector<const Branch*> BranchSet::Sample(std::uint32_t seed) const {
  std::vector<const Branch*> path;
  for (const BranchSet* branch_set = this; branch_set;
       branch_set = path.back()->child()) {
    assert(!branch_set->branches_.empty() && "Empty branch set.");
    path.push_back(branch_set->collapsed_
                       ? &branch_set->branches_.front()
                       : tremor::Sample(branch_set->branches_, 1, seed).front());
  }
  return path;
}

std::vector<std::string> GetBranchIds(const std::vector<const Branch*>& path) {
  std::vector<std::string> ids;
  for (const Branch* branch : path)
    ids.push_back(branch->branch_id());
  return ids;
}

std::vector<std::string> GetBranchIds(const std::vector<Branch>& path) {
  std::vector<std::string> ids;
  for (const Branch& branch : path)
    ids.push_back(branch.branch_id());
  return ids;
}

}  // namespace tremor::lt
