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
/// Implementation of the logic tree realizations.

#include "logic_tree_analysis.h"

#include <algorithm>
#include <cstdint>
#include <string>

#include <boost/algorithm/string/join.hpp>

#include "apply_uncertainties.h"
#include "error.h"
#include "ext/float_compare.h"
#include "logger.h"
#include "path_enumerator.h"

namespace tremor::core {

void LogicTreeAnalysis::Analyze() {
  CLOCK(analysis_clock);
  if (settings().num_samples()) {
    Sample();
  } else {
    Enumerate();
  }
  AddAnalysisTime(DUR(analysis_clock));
  LOG(DEBUG1) << "Produced " << realizations_.size() << " realizations in "
              << analysis_time();
}

void LogicTreeAnalysis::Enumerate() {
  TIMER(DEBUG2, "Enumerating paths");
  int limit = settings().limit_paths();
  for (const lt::Path& path : lt::PathEnumerator(root_)) {
    ++num_paths_;
    total_weight_ += path.weight;
    if (!limit || static_cast<int>(realizations_.size()) < limit)
      AddRealization(path.weight, lt::GetBranchIds(path.branches));
  }
  LOG(DEBUG2) << "The logic tree has " << num_paths_ << " paths";
  if (!ext::is_close(1, total_weight_, 1e-9))
    AddWarning("The path weights sum up to " + std::to_string(total_weight_));
  if (limit && num_paths_ > limit)
    AddWarning("Only " + std::to_string(limit) + " of " +
               std::to_string(num_paths_) + " paths are reported");
}

void LogicTreeAnalysis::Sample() {
  TIMER(DEBUG2, "Sampling paths");
  int num_samples = settings().num_samples();
  auto seed = static_cast<std::uint32_t>(settings().seed());
  for (int i = 0; i < num_samples; ++i) {
    std::vector<std::string> branch_ids =
        lt::GetBranchIds(root_.Sample(seed + i));
    LOG(DEBUG3) << "Realization " << i << ": "
                << boost::algorithm::join(branch_ids, "~");
    AddRealization(1.0 / num_samples, std::move(branch_ids));
  }
}

void LogicTreeAnalysis::AddRealization(double weight,
                                       std::vector<std::string> branch_ids) {
  int ordinal = realizations_.size();
  std::vector<model::SourceGroup> transformed;
  if (!groups_.empty()) {
    lt::BsetValues bset_values = root_.GetBsetValues(branch_ids);
    // Model choices select inputs instead of modifying sources.
    bset_values.erase(
        std::remove_if(bset_values.begin(), bset_values.end(),
                       [](const lt::BsetValue& bset_value) {
                         return !lt::IsApplicableToSources(
                             bset_value.first->uncertainty_type());
                       }),
        bset_values.end());
    for (const model::SourceGroup& group : groups_) {
      try {
        transformed.push_back(lt::ApplyUncertainties(bset_values, group));
      } catch (Error& err) {
        err << errinfo_realization(ordinal);
        throw;
      }
    }
  }
  realizations_.push_back(
      {ordinal, weight, std::move(branch_ids), std::move(transformed)});
}

}  // namespace tremor::core
