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

#include "path_enumerator.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include "utility.h"

namespace tremor::lt::test {

namespace {

/// @returns The weights and joined identifiers of all paths.
std::vector<std::pair<double, std::string>> Collect(const BranchSet& root) {
  std::vector<std::pair<double, std::string>> result;
  for (const Path& path : PathEnumerator(root)) {
    std::string ids;
    for (const std::string& id : GetBranchIds(path.branches))
      ids += (ids.empty() ? "" : "~") + id;
    result.emplace_back(path.weight, ids);
  }
  return result;
}

/// @returns The sum of the path weights.
double TotalWeight(const BranchSet& root) {
  double total = 0;
  for (const Path& path : PathEnumerator(root))
    total += path.weight;
  return total;
}

}  // namespace

TEST_CASE("PathEnumeratorTest.TwoLevels", "[path_enumerator]") {
  auto root = utility::MakeTwoLevelTree();
  auto paths = Collect(*root);
  REQUIRE(paths.size() == 3);
  CHECK(paths[0].first == Approx(0.42));
  CHECK(paths[0].second == "b1~c1");
  CHECK(paths[1].first == Approx(0.18));
  CHECK(paths[1].second == "b1~c2");
  CHECK(paths[2].first == Approx(0.40));
  CHECK(paths[2].second == "b2");
  CHECK(TotalWeight(*root) == Approx(1.0).epsilon(1e-9));
}

TEST_CASE("PathEnumeratorTest.SingleBranch", "[path_enumerator]") {
  BranchSet root(UncertaintyType::kSourceModel, "bs");
  root.Add(Branch("only", 1.0, std::string("model.xml")));
  auto paths = Collect(root);
  REQUIRE(paths.size() == 1);
  CHECK(paths[0].first == 1.0);
  CHECK(paths[0].second == "only");
}

TEST_CASE("PathEnumeratorTest.Restartable", "[path_enumerator]") {
  auto root = utility::MakeTwoLevelTree();
  PathEnumerator enumerator(*root);
  CHECK(std::distance(enumerator.begin(), enumerator.end()) == 3);
  CHECK(std::distance(enumerator.begin(), enumerator.end()) == 3);

  PathEnumerator::iterator it = enumerator.begin();
  PathEnumerator::iterator copy = it;
  ++it;
  CHECK(it != copy);
  CHECK(copy == enumerator.begin());
  CHECK(GetBranchIds(copy->branches) ==
        std::vector<std::string>{"b1", "c1"});
  CHECK(GetBranchIds(it->branches) == std::vector<std::string>{"b1", "c2"});
}

TEST_CASE("PathEnumeratorTest.CollapsedLevel", "[path_enumerator]") {
  auto collapsed = std::make_unique<BranchSet>(
      UncertaintyType::kAbGRAbsolute, "bs2", Filters{}, true);
  collapsed->Add(Branch("ab1", 0.3, std::make_pair(4.0, 1.0)));
  collapsed->Add(Branch("ab2", 0.7, std::make_pair(4.2, 0.9)));

  auto last = std::make_unique<BranchSet>(UncertaintyType::kMaxMagGRRelative,
                                          "bs3");
  last->Add(Branch("m1", 0.4, 0.1));
  last->Add(Branch("m2", 0.6, -0.1));
  collapsed->branches().front().child(std::move(last));

  BranchSet root(UncertaintyType::kSourceModel, "bs1");
  root.Add(Branch("b1", 1.0, std::string("model.xml"), std::move(collapsed)));

  auto paths = Collect(root);
  REQUIRE(paths.size() == 2);
  CHECK(paths[0].first == Approx(0.4));
  CHECK(paths[0].second == "b1~ab1~m1");
  CHECK(paths[1].first == Approx(0.6));
  CHECK(paths[1].second == "b1~ab1~m2");
  CHECK(TotalWeight(root) == Approx(1.0).epsilon(1e-9));

  for (const Path& path : PathEnumerator(root)) {
    REQUIRE(path.branches.size() == 3);
    CHECK(path.branches[1].weight() == 1.0);
    CHECK_FALSE(path.branches[1].child());
    double product = 1;
    for (const Branch& branch : path.branches)
      product *= branch.weight();
    CHECK(product == Approx(path.weight));
  }
}

TEST_CASE("PathEnumeratorTest.WideTree", "[path_enumerator]") {
  // Three levels with every branch extended by a copy of the next level.
  BranchSet third(UncertaintyType::kBGRRelative, "bs3");
  third.Add(Branch("d1", 0.2, 0.1));
  third.Add(Branch("d2", 0.3, 0.0));
  third.Add(Branch("d3", 0.5, -0.1));

  BranchSet second(UncertaintyType::kMaxMagGRRelative, "bs2");
  second.Add(Branch("c1", 0.25, 0.2));
  second.Add(Branch("c2", 0.75, -0.2));
  for (Branch& branch : second.branches())
    branch.child(std::make_unique<BranchSet>(third));

  BranchSet root(UncertaintyType::kSourceModel, "bs1");
  root.Add(Branch("b1", 0.1, std::string("a.xml")));
  root.Add(Branch("b2", 0.9, std::string("b.xml")));
  for (Branch& branch : root.branches())
    branch.child(std::make_unique<BranchSet>(second));

  auto paths = Collect(root);
  REQUIRE(paths.size() == 12);
  CHECK(paths.front().second == "b1~c1~d1");
  CHECK(paths.front().first == Approx(0.1 * 0.25 * 0.2));
  CHECK(paths.back().second == "b2~c2~d3");
  CHECK(paths.back().first == Approx(0.9 * 0.75 * 0.5));
  CHECK(TotalWeight(root) == Approx(1.0).epsilon(1e-9));
}

}  // namespace tremor::lt::test
