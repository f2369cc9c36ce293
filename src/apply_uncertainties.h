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
/// Transformation of source groups with the uncertainties of a path.

#pragma once

#include "logic_tree.h"
#include "source.h"

namespace tremor::lt {

/// Applies the branch-set values chosen along one path onto a source group.
///
/// Sources with no applicable uncertainty are shared with the input group.
/// Other sources are deep-copied before any modification.
/// A non-collapsed uncertainty modifies the single working copy of the source.
/// A collapsed branch set fans the working copy out
/// into one copy per branch scaled with the branch weight.
///
/// @param[in] bset_values  The branch set and value pairs of the path.
/// @param[in] group  The input group, which is never modified.
///
/// @returns The new group with the transformed sources
///          and the count of the applied changes.
///
/// @throws NotImplemented  Collapsing a multi-surface source.
/// @throws LogicError  The uncertainty or filter is not applicable.
/// @throws IllegalOperation  The source does not support the modification.
/// @throws DomainError  The modification produces invalid values.
model::SourceGroup ApplyUncertainties(const BsetValues& bset_values,
                                      const model::SourceGroup& group);

}  // namespace tremor::lt
