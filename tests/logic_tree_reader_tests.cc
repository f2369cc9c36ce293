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

#include "logic_tree_reader.h"

#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <catch2/catch.hpp>

#include "error.h"
#include "path_enumerator.h"

namespace tremor::lt::test {

namespace {

/// @returns The root of the logic tree read from the test input directory.
std::unique_ptr<BranchSet> Read(const std::string& name) {
  return LogicTreeReader("tests/input/logic_tree/" + name).root();
}

/// @returns The number of paths in the tree.
int CountPaths(const BranchSet& root) {
  PathEnumerator paths(root);
  return std::distance(paths.begin(), paths.end());
}

}  // namespace

TEST_CASE("LogicTreeReaderTest.TwoLevels", "[logic_tree_reader]") {
  std::unique_ptr<BranchSet> root;
  REQUIRE_NOTHROW(root = Read("two_levels.xml"));
  CHECK(root->branchset_id() == "bs1");
  CHECK(root->uncertainty_type() == UncertaintyType::kSourceModel);
  REQUIRE(root->branches().size() == 2);

  const Branch& b1 = root->Get("b1");
  CHECK(b1.weight() == 0.6);
  CHECK(std::get<std::string>(b1.value()) == "source_model_1.xml");
  REQUIRE(b1.child());
  CHECK(b1.child()->uncertainty_type() == UncertaintyType::kMaxMagGRRelative);
  CHECK(std::get<double>(b1.child()->Get("c1").value()) == 0.2);
  CHECK(std::get<double>(b1.child()->Get("c2").value()) == -0.2);

  CHECK_FALSE(root->Get("b2").child());
  CHECK(CountPaths(*root) == 3);
}

TEST_CASE("LogicTreeReaderTest.ThreeLevels", "[logic_tree_reader]") {
  auto root = Read("three_levels.xml");
  const BranchSet* left = root->Get("b1").child();
  const BranchSet* right = root->Get("b2").child();
  REQUIRE(left);
  REQUIRE(right);
  CHECK(left != right);  // Each attachment is a copy.
  CHECK(left->branchset_id() == "bs2");
  CHECK(left->filters() ==
        Filters{{"applyToTectonicRegionType", "Active Shallow Crust"}});

  // The level applies to the c1 leaves under both source models.
  for (const BranchSet* branch_set : {left, right}) {
    const BranchSet* last = branch_set->Get("c1").child();
    REQUIRE(last);
    CHECK(last->uncertainty_type() == UncertaintyType::kMaxMagGRAbsolute);
    CHECK(last->filters() == Filters{{"applyToSources", "src_1 src_2"}});
    CHECK(last->Get("d2").weight() == 0.75);
    CHECK_FALSE(branch_set->Get("c2").child());
  }
  CHECK(left->Get("c1").child() != right->Get("c1").child());
  CHECK(CountPaths(*root) == 6);
}

TEST_CASE("LogicTreeReaderTest.Collapsed", "[logic_tree_reader]") {
  auto root = Read("collapsed.xml");
  const BranchSet* ab_set = root->Get("b1").child();
  REQUIRE(ab_set);
  CHECK(ab_set->collapsed());
  CHECK(ab_set->filters() == Filters{{"applyToSourceType", "area"}});
  auto ab = std::get<std::pair<double, double>>(ab_set->Get("ab2").value());
  CHECK(ab.first == 4.2);
  CHECK(ab.second == 0.9);

  // Top-level branch sets are levels of their own.
  REQUIRE(ab_set->Get("ab1").child());
  REQUIRE(ab_set->Get("ab2").child());
  CHECK_FALSE(root->collapsed());

  PathEnumerator paths(*root);
  auto it = paths.begin();
  REQUIRE(it != paths.end());
  CHECK(GetBranchIds(it->branches) ==
        std::vector<std::string>{"b1", "ab1", "m1"});
  CHECK(it->weight == Approx(0.4));
  ++it;
  REQUIRE(it != paths.end());
  CHECK(GetBranchIds(it->branches) ==
        std::vector<std::string>{"b1", "ab1", "m2"});
  CHECK(it->weight == Approx(0.6));
  CHECK(++it == paths.end());
}

TEST_CASE("LogicTreeReaderTest.Geometries", "[logic_tree_reader]") {
  auto root = Read("geometries.xml");
  CHECK(root->uncertainty_type() ==
        UncertaintyType::kSimpleFaultGeometryAbsolute);
  const auto& fault =
      std::get<geo::SimpleFaultSurface>(root->Get("sf2").value());
  CHECK(fault.trace.size() == 3);
  CHECK(fault.dip == 45);
  CHECK(fault.spacing == 2);

  const BranchSet* surfaces = root->Get("sf1").child();
  REQUIRE(surfaces);
  const auto& planar = std::get<geo::Surface>(surfaces->Get("cf1").value());
  CHECK_FALSE(geo::IsMultiSurface(planar));
  const auto& multi = std::get<geo::Surface>(surfaces->Get("cf2").value());
  REQUIRE(geo::IsMultiSurface(multi));
  CHECK(std::get<geo::MultiSurface>(multi).surfaces().size() == 2);

  const BranchSet* mfds = surfaces->Get("cf2").child();
  REQUIRE(mfds);
  const auto& mfd = std::get<IncrementalMfdValue>(mfds->Get("mfd1").value());
  CHECK(mfd.min_mag == 8.0);
  CHECK(mfd.occurrence_rates.size() == 3);
  CHECK(CountPaths(*root) == 4);
}

TEST_CASE("LogicTreeReaderTest.InputErrors", "[logic_tree_reader]") {
  CHECK_THROWS_AS(Read("nonexistent_file.xml"), IOError);
  CHECK_THROWS_AS(Read("malformed.xml"), xml::ParseError);
}

TEST_CASE("LogicTreeReaderTest.InvalidTrees", "[logic_tree_reader]") {
  const char* incorrect_inputs[] = {"weights_not_one.xml",
                                    "weight_out_of_range.xml",
                                    "bad_weight.xml",
                                    "missing_weight.xml",
                                    "duplicate_branch_id.xml",
                                    "duplicate_across_levels.xml",
                                    "missing_branchset_id.xml",
                                    "unknown_uncertainty.xml",
                                    "unknown_source_type.xml",
                                    "root_apply_to_branches.xml",
                                    "undefined_apply_to_branch.xml",
                                    "bad_collapsed.xml",
                                    "empty_branch_set.xml",
                                    "bad_float.xml",
                                    "bad_ab_pair.xml",
                                    "invalid_simple_fault.xml",
                                    "unknown_surface.xml",
                                    "no_branch_sets.xml",
                                    "unexpected_node.xml"};
  for (const auto& input : incorrect_inputs) {
    CAPTURE(input);
    CHECK_THROWS_AS(Read(input), LogicTreeError);
  }
}

TEST_CASE("LogicTreeReaderTest.ErrorLocation", "[logic_tree_reader]") {
  std::string file = "tests/input/logic_tree/weights_not_one.xml";
  try {
    LogicTreeReader reader(file);
    FAIL("Invalid weights are accepted");
  } catch (const LogicTreeError& err) {
    std::string message = err.what();
    CHECK(message.find("filename '" + file + "', line ") == 0);
    CHECK(message.find("don't sum up to 1.0") != std::string::npos);
  }
}

}  // namespace tremor::lt::test
