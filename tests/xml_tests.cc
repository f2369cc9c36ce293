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

#include "xml.h"

#include <string>
#include <string_view>
#include <vector>

#include <boost/range/algorithm/count_if.hpp>
#include <boost/range/distance.hpp>

#include <catch2/catch.hpp>

#include "error.h"

namespace tremor::xml::test {

TEST_CASE("XmlTest.Split", "[xml]") {
  using Tokens = std::vector<std::string_view>;
  CHECK(detail::split("") == Tokens{});
  CHECK(detail::split(" \n\t ") == Tokens{});
  CHECK(detail::split("one") == Tokens{"one"});
  CHECK(detail::split("  one two\n\tthree ") ==
        Tokens{"one", "two", "three"});
}

TEST_CASE("XmlTest.To", "[xml]") {
  CHECK(detail::to<int>("-12") == -12);
  CHECK(detail::to<double>("1e3") == 1000);
  CHECK(detail::to<bool>("true"));
  CHECK_FALSE(detail::to<bool>("0"));
  CHECK_THROWS_AS(detail::to<int>(""), ValidityError);
  CHECK_THROWS_AS(detail::to<int>("1.5"), ValidityError);
  CHECK_THROWS_AS(detail::to<int>("2147483648"), ValidityError);
  CHECK_THROWS_AS(detail::to<double>("1e400"), ValidityError);
  CHECK_THROWS_AS(detail::to<double>("0.5 "), ValidityError);
  CHECK_THROWS_AS(detail::to<bool>("yes"), ValidityError);
}

TEST_CASE("XmlTest.Document", "[xml]") {
  CHECK_THROWS_AS(Document("tests/input/nonexistent_file.xml"), IOError);
  CHECK_THROWS_AS(Document("tests/input/logic_tree/malformed.xml"),
                  ParseError);
  CHECK_NOTHROW(Document("tests/input/xml_elements.xml"));
}

TEST_CASE("XmlTest.Element", "[xml]") {
  Document document("tests/input/xml_elements.xml");
  Element root = document.root();
  CHECK(root.name() == "root");
  CHECK(root.line() == 2);
  CHECK(boost::distance(root.children()) == 5);
  CHECK(boost::distance(root.children("value")) == 2);
  CHECK(boost::distance(root.children("missing")) == 0);
  CHECK_FALSE(root.child("missing"));
  REQUIRE(root.child());
  CHECK(root.child()->name() == "numbers");

  SECTION("Attributes") {
    Element numbers = *root.child("numbers");
    CHECK(numbers.has_attribute("empty"));
    CHECK_FALSE(numbers.has_attribute("missing"));
    CHECK(numbers.attribute("int") == "42");
    CHECK(numbers.attribute("missing").empty());
    CHECK(numbers.attribute<int>("int") == 42);
    CHECK(numbers.attribute<int>("negative") == -7);
    CHECK(numbers.attribute<double>("double") == 0.25);
    CHECK(numbers.attribute<bool>("bool") == true);
    CHECK_FALSE(numbers.attribute<int>("empty"));
    CHECK_FALSE(numbers.attribute<double>("missing"));
    CHECK_THROWS_AS(numbers.attribute<int>("overflow"), ValidityError);
    CHECK_THROWS_AS(numbers.attribute<double>("text"), ValidityError);
  }

  SECTION("Text") {
    CHECK(root.child("label")->text() == "surrounded by spaces");
    CHECK(root.child("nested")->text().empty());
    auto value_range = root.children("value");
    std::vector<Element> values(value_range.begin(), value_range.end());
    REQUIRE(values.size() == 2);
    CHECK(values.front().text<double>() == 0.75);
    CHECK_THROWS_AS(values.back().text<double>(), ValidityError);
    CHECK(boost::count_if(root.children(), [](const Element& element) {
            return !element.text().empty();
          }) == 3);
  }
}

}  // namespace tremor::xml::test
