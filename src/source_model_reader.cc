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
/// Implementation of the source model reader.

#include "source_model_reader.h"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

#include <boost/exception/errinfo_at_line.hpp>
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/exception/get_error_info.hpp>
#include <boost/filesystem.hpp>

#include "error.h"
#include "geometry_reader.h"
#include "logger.h"

namespace tremor::model {

namespace {

/// @returns The upper and lower seismogenic depths of the geometry.
std::pair<double, double> ReadDepths(const xml::Element& geometry) {
  return {geo::RequireChild(geometry, "upperSeismoDepth").text<double>(),
          geo::RequireChild(geometry, "lowerSeismoDepth").text<double>()};
}

}  // namespace

SourceModelReader::SourceModelReader(const std::string& xml_file)
    : filename_(xml_file) {
  TIMER(DEBUG1, "Reading the source model");
  if (!boost::filesystem::exists(xml_file))
    TREMOR_THROW(IOError("Input file doesn't exist."))
        << boost::errinfo_file_name(xml_file);

  xml::Document document(xml_file);
  xml::Element model = document.root();
  try {
    if (model.name() != "sourceModel")
      model = geo::RequireChild(model, "sourceModel");
  } catch (xml::ValidityError& err) {
    err << boost::errinfo_file_name(filename_);
    throw;
  }

  for (const xml::Element& node : model.children()) {
    if (node.name() != "sourceGroup") {
      std::unique_ptr<Source> source = ConstructSource(node, "");
      if (source) {
        AddUngrouped(std::move(source));
      } else {
        LOG(WARNING) << "Ignoring unknown element " << node.name()
                     << " on line " << node.line();
      }
      continue;
    }
    std::string trt(node.attribute("tectonicRegion"));
    SourceGroup group(trt, std::string(node.attribute("name")));
    for (const xml::Element& source_node : node.children()) {
      std::unique_ptr<Source> source = ConstructSource(source_node, trt);
      if (source) {
        group.Add(std::move(source));
      } else {
        LOG(WARNING) << "Ignoring unknown element " << source_node.name()
                     << " on line " << source_node.line();
      }
    }
    groups_.push_back(std::move(group));
  }
  LOG(DEBUG2) << "The source model has " << source_ids_.size()
              << " sources in " << groups_.size() << " groups";
}

void SourceModelReader::AddUngrouped(std::unique_ptr<Source> source) {
  auto it = std::find_if(groups_.begin(), groups_.end(),
                         [&source](const SourceGroup& group) {
                           return group.tectonic_region_type() ==
                                  source->tectonic_region_type();
                         });
  if (it == groups_.end()) {
    groups_.emplace_back(source->tectonic_region_type());
    it = std::prev(groups_.end());
  }
  it->Add(std::move(source));
}

std::unique_ptr<Source> SourceModelReader::ConstructSource(
    const xml::Element& node, const std::string& tectonic_region_type) {
  std::string_view kind = node.name();
  std::string id(node.attribute("id"));
  std::string name(node.attribute("name"));
  std::string trt(node.attribute("tectonicRegion"));
  if (trt.empty())
    trt = tectonic_region_type;

  std::unique_ptr<Source> source;
  try {
    if (kind == "pointSource") {
      xml::Element geometry = geo::RequireChild(node, "pointGeometry");
      auto [upper, lower] = ReadDepths(geometry);
      source = std::make_unique<PointSource>(id, name, trt, ConstructMfd(node),
                                             geo::ReadPoint(geometry), upper,
                                             lower);
    } else if (kind == "areaSource") {
      xml::Element geometry = geo::RequireChild(node, "areaGeometry");
      auto [upper, lower] = ReadDepths(geometry);
      source = std::make_unique<AreaSource>(
          id, name, trt, ConstructMfd(node), geo::ReadPolygon(geometry), upper,
          lower,
          geometry.attribute<double>("discretization")
              .value_or(kDefaultAreaDiscretization));
    } else if (kind == "simpleFaultSource") {
      source = std::make_unique<SimpleFaultSource>(
          id, name, trt, ConstructMfd(node),
          geo::ReadSimpleFault(geo::RequireChild(node, "simpleFaultGeometry"),
                               kDefaultMeshSpacing));
    } else if (kind == "complexFaultSource") {
      source = std::make_unique<ComplexFaultSource>(
          id, name, trt, ConstructMfd(node),
          geo::ReadComplexFault(
              geo::RequireChild(node, "complexFaultGeometry"),
              kDefaultMeshSpacing));
    } else if (kind == "characteristicFaultSource") {
      std::vector<geo::SingleSurface> surfaces;
      for (const xml::Element& geometry :
           geo::RequireChild(node, "surface").children()) {
        std::optional<geo::SingleSurface> surface =
            geo::ReadSingleSurface(geometry, kDefaultMeshSpacing);
        if (!surface)
          TREMOR_THROW(
              xml::ValidityError("Surface geometry type not recognised"))
              << xml::errinfo_element(std::string(geometry.name()))
              << boost::errinfo_at_line(geometry.line());
        surfaces.push_back(std::move(*surface));
      }
      if (surfaces.empty())
        TREMOR_THROW(xml::ValidityError("Surface geometry is missing"));
      source = std::make_unique<CharacteristicFaultSource>(
          id, name, trt, ConstructMfd(node),
          geo::MakeSurface(std::move(surfaces)));
    } else {
      return nullptr;
    }
    if (!source_ids_.insert(id).second)
      TREMOR_THROW(DuplicateElementError());
  } catch (Error& err) {
    err << model::errinfo_source_id(id)
        << boost::errinfo_file_name(filename_);
    if (!boost::get_error_info<boost::errinfo_at_line>(err))
      err << boost::errinfo_at_line(node.line());
    throw;
  }
  return source;
}

std::unique_ptr<Mfd> SourceModelReader::ConstructMfd(
    const xml::Element& source_node) {
  if (std::optional<xml::Element> node =
          source_node.child("truncGutenbergRichterMFD")) {
    return std::make_unique<TruncatedGRMfd>(
        geo::RequireAttribute(*node, "minMag"),
        geo::RequireAttribute(*node, "maxMag"),
        node->attribute<double>("binWidth").value_or(kDefaultBinWidth),
        geo::RequireAttribute(*node, "aValue"),
        geo::RequireAttribute(*node, "bValue"));
  }
  if (std::optional<xml::Element> node =
          source_node.child("incrementalMFD")) {
    return std::make_unique<EvenlyDiscretizedMfd>(
        geo::RequireAttribute(*node, "minMag"),
        geo::RequireAttribute(*node, "binWidth"),
        geo::ReadNumbers(geo::RequireChild(*node, "occurRates").text()));
  }
  return nullptr;
}

}  // namespace tremor::model
