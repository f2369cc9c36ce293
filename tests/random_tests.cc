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

#include "random.h"

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

namespace tremor::test {

namespace {

/// Weighted object with a plain numeric weight.
struct Choice {
  double weight() const { return weight_; }

  std::string name;
  double weight_;
};

/// Weighted object with a structured weight.
struct StructuredChoice {
  const std::map<std::string, double>& weight() const { return weights; }

  std::string name;
  std::map<std::string, double> weights;
};

}  // namespace

TEST_CASE("RandomTest.Deterministic", "[random]") {
  std::vector<Choice> choices = {{"a", 0.2}, {"b", 0.5}, {"c", 0.3}};
  std::vector<const Choice*> first = Sample(choices, 100, 42);
  std::vector<const Choice*> second = Sample(choices, 100, 42);
  REQUIRE(first.size() == 100);
  CHECK(first == second);
  CHECK(Sample(choices, 100, 43) != first);
  CHECK(Sample(choices, 0, 42).empty());
}

TEST_CASE("RandomTest.Convergence", "[random]") {
  std::vector<Choice> choices = {{"a", 0.1}, {"b", 0.6}, {"c", 0.3}};
  const int kNumSamples = 100000;
  std::map<std::string, int> counts;
  for (const Choice* choice : Sample(choices, kNumSamples, 7))
    ++counts[choice->name];
  for (const Choice& choice : choices) {
    INFO("Choice: " + choice.name);
    CHECK(static_cast<double>(counts[choice.name]) / kNumSamples ==
          Approx(choice.weight()).margin(0.01));
  }
}

TEST_CASE("RandomTest.StructuredWeight", "[random]") {
  std::vector<StructuredChoice> choices = {
      {"zero", {{"weight", 0.0}, {"other", 1.0}}},
      {"one", {{"weight", 1.0}, {"other", 0.0}}}};
  for (const StructuredChoice* choice : Sample(choices, 50, 1))
    CHECK(choice->name == "one");
}

TEST_CASE("RandomTest.DiscreteGenerator", "[random]") {
  Random rng(123);
  std::vector<double> weights = {0, 0, 1};
  CHECK(rng.DiscreteGenerator(weights.begin(), weights.end()) == 2);
}

TEST_CASE("RandomTest.LargeSeed", "[random]") {
  std::vector<Choice> choices = {{"a", 0.5}, {"b", 0.5}};
  std::uint32_t seed = std::numeric_limits<std::uint32_t>::max();
  CHECK(Sample(choices, 10, seed) == Sample(choices, 10, seed));
}

}  // namespace tremor::test
