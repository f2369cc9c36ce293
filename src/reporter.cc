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
/// Implements Reporter class.

#include "reporter.h"

#include <cerrno>
#include <ctime>

#include <memory>

#include <boost/algorithm/string/join.hpp>
#include <boost/exception/errinfo_errno.hpp>
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/exception/errinfo_file_open_mode.hpp>

#include "error.h"
#include "logger.h"
#include "version.h"

namespace tremor {

void Reporter::Report(const core::LogicTreeAnalysis& analysis, std::FILE* out,
                      bool indent) {
  xml::Stream xml_stream(out, indent);
  xml::StreamElement report = xml_stream.root("report");
  ReportInformation(analysis, &report);

  if (analysis.realizations().empty())
    return;
  TIMER(DEBUG1, "Reporting realizations");
  xml::StreamElement results = report.AddChild("results");
  for (const core::Realization& realization : analysis.realizations())
    ReportRealization(realization, &results);
}

void Reporter::Report(const core::LogicTreeAnalysis& analysis,
                      const std::string& file, bool indent) {
  std::unique_ptr<std::FILE, decltype(&std::fclose)> fp(
      std::fopen(file.c_str(), "w"), &std::fclose);
  try {
    if (!fp) {
      TREMOR_THROW(IOError("Cannot open the output file for report."))
          << boost::errinfo_errno(errno) << boost::errinfo_file_open_mode("w");
    }
    Report(analysis, fp.get(), indent);
  } catch (IOError& err) {
    err << boost::errinfo_file_name(file);
    throw;
  }
}

void Reporter::ReportInformation(const core::LogicTreeAnalysis& analysis,
                                 xml::StreamElement* report) {
  xml::StreamElement information = report->AddChild("information");
  ReportSoftwareInformation(&information);

  const core::Settings& settings = analysis.settings();
  {
    xml::StreamElement method = information.AddChild("calculation-method");
    if (settings.num_samples()) {
      method.SetAttribute("name", "sampling")
          .SetAttribute("samples", settings.num_samples())
          .SetAttribute("seed", settings.seed());
    } else {
      method.SetAttribute("name", "enumeration");
      if (settings.limit_paths())
        method.SetAttribute("limit", settings.limit_paths());
    }
  }
  {
    xml::StreamElement tree = information.AddChild("logic-tree");
    tree.SetAttribute("root", analysis.root().branchset_id());
    if (!settings.num_samples()) {
      tree.SetAttribute("paths", analysis.num_paths())
          .SetAttribute("weight", analysis.total_weight());
    }
  }
  information.AddChild("performance")
      .AddChild("calculation-time")
      .AddText(analysis.analysis_time());

  if (!analysis.warnings().empty())
    information.AddChild("warning").AddText(analysis.warnings());
}

void Reporter::ReportSoftwareInformation(xml::StreamElement* information) {
  information->AddChild("software")
      .SetAttribute("name", "tremor")
      .SetAttribute("version", version::core());

  std::time_t current_time = std::time(nullptr);
  char iso_extended[20] = {};
  auto ret = std::strftime(iso_extended, sizeof(iso_extended),
                           "%Y-%m-%dT%H:%M:%S", std::gmtime(&current_time));
  if (ret)  // The user can set the wall-clock year beyond 10k.
    information->AddChild("time").AddText(iso_extended);
}

void Reporter::ReportRealization(const core::Realization& realization,
                                 xml::StreamElement* results) {
  xml::StreamElement element = results->AddChild("realization");
  element.SetAttribute("ordinal", realization.ordinal)
      .SetAttribute("weight", realization.weight)
      .SetAttribute("path", boost::algorithm::join(realization.branch_ids, "~"));
  for (const model::SourceGroup& group : realization.groups)
    ReportGroup(group, &element);
}

void Reporter::ReportGroup(const model::SourceGroup& group,
                           xml::StreamElement* parent) {
  xml::StreamElement element = parent->AddChild("source-group");
  element.SetAttribute("tectonic-region", group.tectonic_region_type());
  if (!group.name().empty())
    element.SetAttribute("name", group.name());
  element.SetAttribute("changes", group.changes())
      .SetAttribute("sources", static_cast<int>(group.sources().size()));
  for (const model::SourceGroup::SourcePtr& source : group) {
    element.AddChild("source")
        .SetAttribute("id", source->source_id())
        .SetAttribute("kind",
                      model::kSourceKindToString[static_cast<int>(
                          source->kind())])
        .SetAttribute("scaling-rate", source->scaling_rate());
  }
}

}  // namespace tremor
