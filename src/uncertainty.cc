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
/// Implementation of uncertainty value parsing and application.

#include "uncertainty.h"

#include <algorithm>

#include "error.h"
#include "geometry_reader.h"
#include "logger.h"

namespace tremor::lt {

namespace {  // Value parsers.

/// Runs the parsing of a geometry sub-node
/// converting any value problems into a logic tree error for the node.
///
/// @param[in] node  The node under validation.
/// @param[in] filename  The file with the node.
/// @param[in] message  The message for the user.
/// @param[in] parse  The parser of the node.
///
/// @returns The result of the parser.
///
/// @throws LogicTreeError  The parser has failed on the node values.
template <class F>
auto Validated(const xml::Element& node, const std::string& filename,
               const char* message, F&& parse) {
  std::string reason;
  try {
    return parse();
  } catch (const ValidityError& err) {
    reason = err.what();
  } catch (const xml::ValidityError& err) {
    reason = err.what();
  }
  TREMOR_THROW(LogicTreeError(node.line(), filename, message))
      << errinfo_value(reason)
      << xml::errinfo_element(std::string(node.name()));
}

geo::SimpleFaultSurface GetSimpleFault(const xml::Element& node,
                                       const std::string& filename) {
  return Validated(node, filename, "'simpleFaultGeometry' node is not valid",
                   [&node] { return geo::ReadSimpleFault(node); });
}

geo::ComplexFaultSurface GetComplexFault(const xml::Element& node,
                                         const std::string& filename) {
  return Validated(node, filename, "'complexFaultGeometry' node is not valid",
                   [&node] { return geo::ReadComplexFault(node); });
}

geo::PlanarSurface GetPlanarSurface(const xml::Element& node,
                                    const std::string& filename) {
  return Validated(node, filename, "'planarFaultGeometry' node is not valid",
                   [&node] { return geo::ReadPlanarSurface(node); });
}

/// @returns The error for the malformed value of the node.
LogicTreeError ValueError(const xml::Element& node, const std::string& filename,
                          const char* message) {
  LogicTreeError err(node.line(), filename, message);
  err << errinfo_value(std::string(node.text()));
  return err;
}

UncertaintyValue ParseFloat(const xml::Element& node,
                            const std::string& filename) {
  try {
    return xml::detail::to<double>(node.text());
  } catch (const xml::ValidityError&) {
    TREMOR_THROW(ValueError(node, filename, "expected single float value"));
  }
}

UncertaintyValue ParseModel(const xml::Element& node,
                            const std::string& /*filename*/) {
  return std::string(node.text());
}

UncertaintyValue ParseAbPair(const xml::Element& node,
                             const std::string& filename) {
  const char* kMessage = "expected a pair of floats separated by space";
  std::vector<std::string_view> tokens = xml::detail::split(node.text());
  if (tokens.size() != 2)
    TREMOR_THROW(ValueError(node, filename, kMessage));
  try {
    return std::make_pair(xml::detail::to<double>(tokens[0]),
                          xml::detail::to<double>(tokens[1]));
  } catch (const xml::ValidityError&) {
    TREMOR_THROW(ValueError(node, filename, kMessage));
  }
}

UncertaintyValue ParseIncrementalMfd(const xml::Element& node,
                                     const std::string& filename) {
  xml::Element mfd_node = node.child("incrementalMFD").value_or(node);
  return Validated(mfd_node, filename, "'incrementalMFD' node is not valid",
                   [&mfd_node] {
                     return IncrementalMfdValue{
                         geo::RequireAttribute(mfd_node, "minMag"),
                         geo::RequireAttribute(mfd_node, "binWidth"),
                         geo::ReadNumbers(
                             geo::RequireChild(mfd_node, "occurRates").text())};
                   });
}

UncertaintyValue ParseSimpleFaultGeometry(const xml::Element& node,
                                          const std::string& filename) {
  return GetSimpleFault(node.child("simpleFaultGeometry").value_or(node),
                        filename);
}

UncertaintyValue ParseComplexFaultGeometry(const xml::Element& node,
                                           const std::string& filename) {
  return GetComplexFault(node.child("complexFaultGeometry").value_or(node),
                         filename);
}

UncertaintyValue ParseCharacteristicFaultGeometry(const xml::Element& node,
                                                  const std::string& filename) {
  std::optional<xml::Element> surface = node.child("surface");
  if (!surface || surface->children().empty())
    TREMOR_THROW(LogicTreeError(node.line(), filename,
                                "Surface geometry is missing"));
  std::vector<geo::SingleSurface> surfaces;
  for (const xml::Element& geometry : surface->children()) {
    std::string_view name = geometry.name();
    if (name == "simpleFaultGeometry") {
      surfaces.emplace_back(GetSimpleFault(geometry, filename));
    } else if (name == "complexFaultGeometry") {
      surfaces.emplace_back(GetComplexFault(geometry, filename));
    } else if (name == "planarSurface") {
      surfaces.emplace_back(GetPlanarSurface(geometry, filename));
    } else {
      TREMOR_THROW(LogicTreeError(geometry.line(), filename,
                                  "Surface geometry type not recognised"))
          << xml::errinfo_element(std::string(name));
    }
  }
  return geo::MakeSurface(std::move(surfaces));
}

}  // namespace

namespace {  // Value appliers.

/// @returns The magnitude-frequency distribution of the source.
///
/// @throws IllegalOperation  The source has no distribution.
model::Mfd& GetMfd(model::Source* source) {
  if (!source->mfd())
    TREMOR_THROW(IllegalOperation("The source has no MFD to modify"))
        << model::errinfo_source_id(source->source_id());
  return *source->mfd();
}

void ApplyDipRelative(model::Source* source, const UncertaintyValue& value) {
  source->Modify(model::AdjustDip{std::get<double>(value)});
}

void ApplyDipAbsolute(model::Source* source, const UncertaintyValue& value) {
  source->Modify(model::SetDip{std::get<double>(value)});
}

void ApplySimpleFaultGeometry(model::Source* source,
                              const UncertaintyValue& value) {
  source->Modify(model::SetSimpleFaultGeometry{
      std::get<geo::SimpleFaultSurface>(value)});
}

void ApplyComplexFaultGeometry(model::Source* source,
                               const UncertaintyValue& value) {
  source->Modify(model::SetComplexFaultGeometry{
      std::get<geo::ComplexFaultSurface>(value)});
}

void ApplyCharacteristicFaultGeometry(model::Source* source,
                                      const UncertaintyValue& value) {
  source->Modify(model::SetSurface{std::get<geo::Surface>(value)});
}

void ApplyAbAbsolute(model::Source* source, const UncertaintyValue& value) {
  auto [a_val, b_val] = std::get<std::pair<double, double>>(value);
  GetMfd(source).Modify(model::SetAB{a_val, b_val});
}

void ApplyBRelative(model::Source* source, const UncertaintyValue& value) {
  GetMfd(source).Modify(model::IncrementB{std::get<double>(value)});
}

void ApplyMaxMagRelative(model::Source* source,
                         const UncertaintyValue& value) {
  GetMfd(source).Modify(model::IncrementMaxMag{std::get<double>(value)});
}

void ApplyMaxMagAbsolute(model::Source* source,
                         const UncertaintyValue& value) {
  GetMfd(source).Modify(model::SetMaxMag{std::get<double>(value)});
}

void ApplyIncrementalMfd(model::Source* source,
                         const UncertaintyValue& value) {
  const auto& mfd = std::get<IncrementalMfdValue>(value);
  GetMfd(source).Modify(
      model::SetMfd{mfd.min_mag, mfd.bin_width, mfd.occurrence_rates});
}

/// The parser and applier of an uncertainty type.
struct Handler {
  /// Produces the typed value from the node.
  UncertaintyValue (*parse)(const xml::Element&, const std::string&);
  /// Modifies the source with the value.
  /// nullptr if the uncertainty does not apply to sources.
  void (*apply)(model::Source*, const UncertaintyValue&);
};

/// The dispatch table indexed by the uncertainty type.
const Handler kHandlers[] = {
    {&ParseFloat, nullptr},  // Unknown.
    {&ParseModel, nullptr},  // GMPE model.
    {&ParseModel, nullptr},  // Source model.
    {&ParseModel, nullptr},  // Extended model.
    {&ParseFloat, &ApplyMaxMagRelative},
    {&ParseFloat, &ApplyBRelative},
    {&ParseFloat, &ApplyMaxMagAbsolute},
    {&ParseAbPair, &ApplyAbAbsolute},
    {&ParseIncrementalMfd, &ApplyIncrementalMfd},
    {&ParseFloat, &ApplyDipRelative},
    {&ParseFloat, &ApplyDipAbsolute},
    {&ParseSimpleFaultGeometry, &ApplySimpleFaultGeometry},
    {&ParseComplexFaultGeometry, &ApplyComplexFaultGeometry},
    {&ParseCharacteristicFaultGeometry, &ApplyCharacteristicFaultGeometry}};

static_assert(std::size(kHandlers) == kNumUncertaintyTypes);

/// @returns The handler of the uncertainty type.
const Handler& GetHandler(UncertaintyType type) {
  return kHandlers[static_cast<int>(type)];
}

}  // namespace

UncertaintyType GetUncertaintyType(std::string_view name) {
  auto it = std::find(std::begin(kUncertaintyTypeToString),
                      std::end(kUncertaintyTypeToString), name);
  if (it == std::end(kUncertaintyTypeToString))
    return UncertaintyType::kUnknown;
  return static_cast<UncertaintyType>(
      std::distance(std::begin(kUncertaintyTypeToString), it));
}

bool IsApplicableToSources(UncertaintyType type) {
  return GetHandler(type).apply != nullptr;
}

UncertaintyValue ParseUncertainty(UncertaintyType type,
                                  const xml::Element& node,
                                  const std::string& filename) {
  return GetHandler(type).parse(node, filename);
}

void ApplyUncertainty(UncertaintyType type, model::Source* source,
                      const UncertaintyValue& value) {
  const Handler& handler = GetHandler(type);
  if (!handler.apply)
    TREMOR_THROW(LogicError("The uncertainty does not apply to sources"))
        << errinfo_uncertainty(
               kUncertaintyTypeToString[static_cast<int>(type)])
        << model::errinfo_source_id(source->source_id());
  LOG(DEBUG4) << "Applying "
              << kUncertaintyTypeToString[static_cast<int>(type)] << " to "
              << source->source_id();
  try {
    handler.apply(source, value);
  } catch (Error& err) {
    err << model::errinfo_source_id(source->source_id());
    throw;
  }
}

}  // namespace tremor::lt
