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
/// Realizations of logic trees over source models.

#pragma once

#include <string>
#include <vector>

#include "analysis.h"
#include "logic_tree.h"
#include "settings.h"
#include "source.h"

namespace tremor::core {

/// One realization of the logic tree.
struct Realization {
  int ordinal;  ///< The position of the realization starting from 0.
  double weight;  ///< The path weight or the equal weight of samples.
  std::vector<std::string> branch_ids;  ///< The chosen path.
  /// The source groups transformed with the path uncertainties.
  std::vector<model::SourceGroup> groups;
};

/// Enumeration or sampling of the logic tree realizations
/// with the transformations of the source model.
///
/// The number of samples from the settings selects the mode:
/// 0 for the full enumeration of paths, otherwise the sampling.
/// The sample with the ordinal i uses the seed (seed + i).
class LogicTreeAnalysis : public Analysis {
 public:
  /// @param[in] root  The root branch set of the logic tree.
  /// @param[in] groups  The source groups to transform (may be empty).
  /// @param[in] settings  The analysis settings.
  ///
  /// @pre The tree and groups outlive the analysis.
  LogicTreeAnalysis(const lt::BranchSet& root,
                    const std::vector<model::SourceGroup>& groups,
                    const Settings& settings)
      : Analysis(settings), root_(root), groups_(groups) {}

  /// Produces the realizations.
  ///
  /// @throws Error  The source transformation has failed.
  void Analyze() override;

  /// @returns The root branch set of the tree.
  const lt::BranchSet& root() const { return root_; }

  /// @returns The realizations in the order of production.
  const std::vector<Realization>& realizations() const {
    return realizations_;
  }

  /// @returns The total number of enumerated paths.
  ///          0 for the sampling mode.
  int num_paths() const { return num_paths_; }

  /// @returns The sum of the enumerated path weights.
  double total_weight() const { return total_weight_; }

 private:
  /// Adds the realization with the transformed groups.
  void AddRealization(double weight, std::vector<std::string> branch_ids);

  /// Enumerates all paths up to the limit on the reported paths.
  void Enumerate();

  /// Samples paths.
  void Sample();

  const lt::BranchSet& root_;  ///< The logic tree.
  const std::vector<model::SourceGroup>& groups_;  ///< The source model.
  std::vector<Realization> realizations_;  ///< The results.
  int num_paths_ = 0;  ///< The enumeration size.
  double total_weight_ = 0;  ///< The weight of the enumerated paths.
};

}  // namespace tremor::core
