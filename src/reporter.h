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
/// Reporter of logic tree analysis results.

#pragma once

#include <cstdio>

#include <string>

#include "logic_tree_analysis.h"
#include "source.h"
#include "xml_stream.h"

namespace tremor {

/// This class reports the realizations of logic trees in XML.
class Reporter {
 public:
  /// Reports the results of the analysis to the stream.
  ///
  /// @param[in] analysis  The complete analysis.
  /// @param[in,out] out  The output destination.
  /// @param[in] indent  Indent the XML elements.
  ///
  /// @throws IOError  The write operation has failed.
  void Report(const core::LogicTreeAnalysis& analysis, std::FILE* out,
              bool indent = true);

  /// Reports the results of the analysis into the file.
  ///
  /// @param[in] analysis  The complete analysis.
  /// @param[in] file  The path to the output file.
  /// @param[in] indent  Indent the XML elements.
  ///
  /// @throws IOError  The file cannot be opened or written.
  void Report(const core::LogicTreeAnalysis& analysis,
              const std::string& file, bool indent = true);

 private:
  /// Reports the software, settings, and tree information.
  void ReportInformation(const core::LogicTreeAnalysis& analysis,
                         xml::StreamElement* report);

  /// Reports the software name, version, and time of the report.
  void ReportSoftwareInformation(xml::StreamElement* information);

  /// Reports a single realization with its transformed groups.
  void ReportRealization(const core::Realization& realization,
                         xml::StreamElement* results);

  /// Reports the transformed sources of the group.
  void ReportGroup(const model::SourceGroup& group,
                   xml::StreamElement* parent);
};

}  // namespace tremor
