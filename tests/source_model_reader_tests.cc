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

#include "source_model_reader.h"

#include <string>
#include <variant>
#include <vector>

#include <boost/exception/errinfo_file_name.hpp>
#include <boost/exception/get_error_info.hpp>

#include <catch2/catch.hpp>

#include "error.h"

namespace tremor::model::test {

namespace {

/// @returns The source groups read from the test input directory.
std::vector<SourceGroup> Read(const std::string& name) {
  return SourceModelReader("tests/input/source_model/" + name).groups();
}

/// @returns The identifiers of the group sources in the order of input.
std::vector<std::string> GetIds(const SourceGroup& group) {
  std::vector<std::string> ids;
  for (const SourceGroup::SourcePtr& source : group)
    ids.push_back(source->source_id());
  return ids;
}

}  // namespace

TEST_CASE("SourceModelReaderTest.UngroupedSources", "[source_model_reader]") {
  std::vector<SourceGroup> groups;
  REQUIRE_NOTHROW(groups = Read("mixed_sources.xml"));
  REQUIRE(groups.size() == 2);
  CHECK(groups[0].tectonic_region_type() == "Active Shallow Crust");
  CHECK(groups[0].name().empty());
  CHECK(GetIds(groups[0]) ==
        std::vector<std::string>{"src_1", "src_2", "fault_1"});
  CHECK(groups[1].tectonic_region_type() == "Stable Continental Crust");
  CHECK(GetIds(groups[1]) ==
        std::vector<std::string>{"complex_1", "char_1", "char_2"});
  CHECK(groups[0].changes() == 0);

  SECTION("Point") {
    const auto& point =
        dynamic_cast<const PointSource&>(*groups[0].sources()[0]);
    CHECK(point.kind() == SourceKind::kPoint);
    CHECK(point.name() == "Point Source");
    CHECK(point.location().longitude() == -122);
    CHECK(point.lower_seismogenic_depth() == 10);
    CHECK(point.scaling_rate() == 1);
    const auto* mfd = dynamic_cast<const TruncatedGRMfd*>(point.mfd());
    REQUIRE(mfd);
    CHECK(mfd->max_mag() == 6.5);
    CHECK(mfd->a_val() == -3.5);
    CHECK(mfd->bin_width() == kDefaultBinWidth);
  }

  SECTION("Area") {
    const auto& area =
        dynamic_cast<const AreaSource&>(*groups[0].sources()[1]);
    CHECK(area.kind() == SourceKind::kArea);
    CHECK(area.polygon().size() == 4);
    CHECK(area.area_discretization() == 5);
    const auto* mfd = dynamic_cast<const TruncatedGRMfd*>(area.mfd());
    REQUIRE(mfd);
    CHECK(mfd->bin_width() == 0.2);
    CHECK(mfd->b_val() == 0.9);
  }

  SECTION("Faults") {
    const auto& fault =
        dynamic_cast<const SimpleFaultSource&>(*groups[0].sources()[2]);
    CHECK(fault.geometry().dip == 45);
    CHECK(fault.geometry().spacing == kDefaultMeshSpacing);
    CHECK(fault.geometry().upper_seismogenic_depth == 10);

    const auto& complex =
        dynamic_cast<const ComplexFaultSource&>(*groups[1].sources()[0]);
    CHECK(complex.geometry().edges.size() == 3);
    CHECK(complex.geometry().edges.back().points().front().depth() == 20);
  }

  SECTION("Characteristic") {
    const Source& single = *groups[1].sources()[1];
    CHECK(single.kind() == SourceKind::kCharacteristicFault);
    CHECK_FALSE(single.is_multi_surface());
    const auto* mfd = dynamic_cast<const EvenlyDiscretizedMfd*>(single.mfd());
    REQUIRE(mfd);
    CHECK(mfd->min_mag() == 7.5);
    CHECK(mfd->occurrence_rates() == std::vector<double>{0.002, 0.001});

    const auto& multi = dynamic_cast<const CharacteristicFaultSource&>(
        *groups[1].sources()[2]);
    REQUIRE(multi.is_multi_surface());
    const auto& surfaces = std::get<geo::MultiSurface>(multi.surface());
    REQUIRE(surfaces.surfaces().size() == 2);
    CHECK(std::get<geo::PlanarSurface>(surfaces.surfaces().front()).spacing ==
          kDefaultMeshSpacing);
  }
}

TEST_CASE("SourceModelReaderTest.SourceGroups", "[source_model_reader]") {
  std::vector<SourceGroup> groups = Read("grouped_sources.xml");
  REQUIRE(groups.size() == 2);
  CHECK(groups[0].name() == "Group A");
  CHECK(groups[0].tectonic_region_type() == "Active Shallow Crust");
  CHECK(GetIds(groups[0]) == std::vector<std::string>{"p_1"});
  CHECK(groups[0].sources().front()->tectonic_region_type() ==
        "Active Shallow Crust");

  CHECK(groups[1].name() == "Group B");
  CHECK(GetIds(groups[1]) == std::vector<std::string>{"p_2"});
  CHECK_FALSE(groups[1].sources().front()->mfd());
}

TEST_CASE("SourceModelReaderTest.InputErrors", "[source_model_reader]") {
  CHECK_THROWS_AS(Read("nonexistent_file.xml"), IOError);
  CHECK_THROWS_AS(Read("../logic_tree/malformed.xml"), xml::ParseError);
  CHECK_THROWS_AS(Read("no_source_model.xml"), xml::ValidityError);
  CHECK_THROWS_AS(Read("missing_geometry.xml"), xml::ValidityError);
  CHECK_THROWS_AS(Read("missing_max_mag.xml"), xml::ValidityError);
  CHECK_THROWS_AS(Read("duplicate_source_id.xml"), DuplicateElementError);
}

TEST_CASE("SourceModelReaderTest.InvalidValues", "[source_model_reader]") {
  std::string dir = "tests/input/source_model/";
  const char* incorrect_inputs[] = {"invalid_depths.xml", "invalid_dip.xml",
                                    "invalid_longitude.xml"};
  for (const auto& input : incorrect_inputs) {
    CAPTURE(input);
    try {
      SourceModelReader reader(dir + input);
      FAIL("The invalid source is accepted");
    } catch (const DomainError& err) {
      const std::string* source_id =
          boost::get_error_info<errinfo_source_id>(err);
      REQUIRE(source_id);
      CHECK((*source_id == "p_1" || *source_id == "fault_1"));
      const std::string* file =
          boost::get_error_info<boost::errinfo_file_name>(err);
      REQUIRE(file);
      CHECK(*file == dir + input);
    }
  }
}

}  // namespace tremor::model::test
