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
/// Reader of seismic source models from XML input files.

#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/noncopyable.hpp>

#include "source.h"
#include "xml.h"

namespace tremor::model {

/// The mesh spacing (km) for fault geometries without one.
const double kDefaultMeshSpacing = 5;

/// The discretization (km) for area sources without one.
const double kDefaultAreaDiscretization = 10;

/// The magnitude bin width for Gutenberg-Richter MFDs without one.
const double kDefaultBinWidth = 0.1;

/// Builder of source groups from source model files.
/// Sources outside of explicit source groups
/// are grouped by their tectonic region types
/// in the order of the first appearance.
class SourceModelReader : private boost::noncopyable {
 public:
  /// Reads and validates the source model.
  ///
  /// @param[in] xml_file  The path to the source model file.
  ///
  /// @throws IOError  The file is not accessible.
  /// @throws xml::ParseError  The file is not well-formed XML.
  /// @throws xml::ValidityError  The elements are missing or malformed.
  /// @throws ValidityError  The source values are invalid.
  explicit SourceModelReader(const std::string& xml_file);

  /// @returns The source groups of the model.
  std::vector<SourceGroup> groups() && { return std::move(groups_); }

 private:
  /// Adds the source into the group of its tectonic region type.
  void AddUngrouped(std::unique_ptr<Source> source);

  /// Constructs the source from the XML element.
  ///
  /// @param[in] node  The source element.
  /// @param[in] tectonic_region_type  The default from the group.
  ///
  /// @returns The source or nullptr if the element is not a source.
  std::unique_ptr<Source> ConstructSource(
      const xml::Element& node, const std::string& tectonic_region_type);

  /// Constructs the optional MFD of the source element.
  std::unique_ptr<Mfd> ConstructMfd(const xml::Element& source_node);

  std::string filename_;  ///< The file with the source model.
  std::vector<SourceGroup> groups_;  ///< The groups in the order of input.
  std::unordered_set<std::string> source_ids_;  ///< Unique over the file.
};

}  // namespace tremor::model
