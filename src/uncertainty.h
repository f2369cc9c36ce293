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
/// Uncertainty types of logic-tree branch sets,
/// the parsing of their values,
/// and the application of the values onto seismic sources.
///
/// Every uncertainty type has an entry in a static dispatch table
/// with a parser and an applier.
/// Unrecognized type strings map to the explicit unknown entry,
/// which parses a single floating-point value
/// and cannot be applied onto sources.

#pragma once

#include <cstdint>

#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "geo.h"
#include "source.h"
#include "xml.h"

namespace tremor::lt {

/// The kinds of uncertainties modeled with branch sets.
enum class UncertaintyType : std::uint8_t {
  kUnknown = 0,
  kGmpeModel,
  kSourceModel,
  kExtendModel,
  kMaxMagGRRelative,
  kBGRRelative,
  kMaxMagGRAbsolute,
  kAbGRAbsolute,
  kIncrementalMFDAbsolute,
  kSimpleFaultDipRelative,
  kSimpleFaultDipAbsolute,
  kSimpleFaultGeometryAbsolute,
  kComplexFaultGeometryAbsolute,
  kCharacteristicFaultGeometryAbsolute
};

/// The number of uncertainty types including the unknown.
const int kNumUncertaintyTypes = 14;

/// String representations of uncertainty types in the input format.
const char* const kUncertaintyTypeToString[] = {
    "unknown",
    "gmpeModel",
    "sourceModel",
    "extendModel",
    "maxMagGRRelative",
    "bGRRelative",
    "maxMagGRAbsolute",
    "abGRAbsolute",
    "incrementalMFDAbsolute",
    "simpleFaultDipRelative",
    "simpleFaultDipAbsolute",
    "simpleFaultGeometryAbsolute",
    "complexFaultGeometryAbsolute",
    "characteristicFaultGeometryAbsolute"};

static_assert(std::size(kUncertaintyTypeToString) == kNumUncertaintyTypes);

/// @param[in] name  The uncertainty type string.
///
/// @returns The uncertainty type.
///          The unknown type if the string is not recognized.
UncertaintyType GetUncertaintyType(std::string_view name);

/// @returns true if the values of the uncertainty type modify sources.
///          Model choices (source model, GMPE) are not applicable.
bool IsApplicableToSources(UncertaintyType type);

/// Replacement of evenly discretized magnitude-frequency distribution.
struct IncrementalMfdValue {
  double min_mag;  ///< The magnitude of the first bin.
  double bin_width;  ///< The magnitude bin width.
  std::vector<double> occurrence_rates;  ///< The rates per bin.
};

/// The parsed values of uncertainties.
/// The held type depends on the uncertainty type:
///   - double for relative changes, absolute scalars, and unknown types;
///   - std::string for model references;
///   - std::pair<double, double> for Gutenberg-Richter (a, b) pairs;
///   - IncrementalMfdValue for incremental MFD replacements;
///   - geometry types for fault geometry replacements.
using UncertaintyValue =
    std::variant<double, std::string, std::pair<double, double>,
                 IncrementalMfdValue, geo::SimpleFaultSurface,
                 geo::ComplexFaultSurface, geo::Surface>;

/// Parses the raw uncertainty value node into the typed value.
///
/// @param[in] type  The uncertainty type of the owning branch set.
/// @param[in] node  The uncertainty model node.
/// @param[in] filename  The file with the node for error messages.
///
/// @returns The value of the type designated for the uncertainty type.
///
/// @throws LogicTreeError  The node content is malformed.
UncertaintyValue ParseUncertainty(UncertaintyType type,
                                  const xml::Element& node,
                                  const std::string& filename);

/// Applies the uncertainty value onto the source or its MFD in place.
///
/// @param[in] type  The uncertainty type of the branch set.
/// @param[in,out] source  The source to be modified.
/// @param[in] value  The value parsed for the uncertainty type.
///
/// @throws LogicError  The uncertainty type is not applicable to sources.
/// @throws IllegalOperation  The source does not support the modification.
/// @throws DomainError  The modification produces invalid values.
void ApplyUncertainty(UncertaintyType type, model::Source* source,
                      const UncertaintyValue& value);

}  // namespace tremor::lt
