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
/// Implementation of source group transformations.

#include "apply_uncertainties.h"

#include <algorithm>
#include <memory>
#include <vector>

#include "error.h"
#include "logger.h"

namespace tremor::lt {

namespace {

/// Transforms a single source with the applicable uncertainties.
///
/// @param[in] bset_values  The branch set and value pairs of the path.
/// @param[in] applicable  The applicability of each pair to the source.
/// @param[in] source  The original source.
/// @param[in,out] changes  The counter of applied changes.
///
/// @returns The transformed copies of the source.
std::vector<std::unique_ptr<model::Source>> Transform(
    const BsetValues& bset_values, const std::vector<bool>& applicable,
    const model::Source& source, int* changes) {
  std::vector<std::unique_ptr<model::Source>> copies;
  std::unique_ptr<model::Source> working = source.Clone();
  model::Source* current = working.get();  // Owned by one of the above.

  for (int i = 0; i < bset_values.size(); ++i) {
    if (!applicable[i])
      continue;
    const auto& [branch_set, value] = bset_values[i];
    if (branch_set->collapsed()) {
      if (current->is_multi_surface())
        TREMOR_THROW(NotImplemented("Collapsing of multi-surface sources"))
            << model::errinfo_source_id(source.source_id())
            << errinfo_branchset_id(branch_set->branchset_id());
      for (const Branch& branch : branch_set->branches()) {
        std::unique_ptr<model::Source> copy = current->Clone();
        copy->scaling_rate(branch.weight());
        ApplyUncertainty(branch_set->uncertainty_type(), copy.get(),
                         branch.value());
        copies.push_back(std::move(copy));
      }
      *changes += branch_set->branches().size();
    } else {
      ApplyUncertainty(branch_set->uncertainty_type(), current, *value);
      if (copies.empty())
        copies.push_back(std::move(working));
      *changes += 1;
    }
  }
  return copies;
}

}  // namespace

model::SourceGroup ApplyUncertainties(const BsetValues& bset_values,
                                      const model::SourceGroup& group) {
  TIMER(DEBUG3, "Applying uncertainties");
  model::SourceGroup result(group.tectonic_region_type(), group.name());
  int changes = 0;
  for (const model::SourceGroup::SourcePtr& source : group) {
    std::vector<bool> applicable;
    for (const BsetValue& bset_value : bset_values)
      applicable.push_back(bset_value.first->Applies(*source));

    if (std::find(applicable.begin(), applicable.end(), true) ==
        applicable.end()) {
      result.Add(source);
      continue;
    }
    for (std::unique_ptr<model::Source>& copy :
         Transform(bset_values, applicable, *source, &changes))
      result.Add(std::move(copy));
  }
  result.AddChanges(changes);
  LOG(DEBUG3) << "Group " << group.tectonic_region_type() << ": "
              << group.sources().size() << " source(s) into "
              << result.sources().size() << " with " << changes
              << " change(s)";
  return result;
}

}  // namespace tremor::lt
