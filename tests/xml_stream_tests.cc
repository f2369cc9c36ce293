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

#include "xml_stream.h"

#include <cstdio>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include <boost/filesystem.hpp>

#include <catch2/catch.hpp>

namespace fs = boost::filesystem;

namespace tremor::xml::test {

namespace {

/// Temporary file removed at the scope exit.
class TempFile {
 public:
  TempFile()
      : path_(fs::temp_directory_path() /
              ("tremor_xml_test-" + fs::unique_path().string())) {}
  ~TempFile() { fs::remove(path_); }

  std::string string() const { return path_.string(); }

  /// @returns The content of the file.
  std::string Read() const {
    std::stringstream str_stream;
    str_stream << std::ifstream(string()).rdbuf();
    return str_stream.str();
  }

 private:
  fs::path path_;
};

using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

}  // namespace

TEST_CASE("XmlStreamTest.ctor", "[xml_stream]") {
  CHECK_NOTHROW(Stream(stderr));
  CHECK_NOTHROW(Stream(stderr, false));
  CHECK_THROWS_AS(Stream(stderr).root(""), StreamError);
  CHECK_NOTHROW(Stream(stderr).root("report"));
  Stream xml_stream(stderr);
  CHECK_NOTHROW(xml_stream.root("report"));
  CHECK_THROWS_AS(xml_stream.root("results"), StreamError);
}

TEST_CASE("XmlStreamTest.Element", "[xml_stream]") {
  Stream xml_stream(stderr);
  StreamElement root = xml_stream.root("report");

  SECTION("Set attribute") {
    CHECK_THROWS_AS(root.SetAttribute("", "value"), StreamError);
    CHECK_NOTHROW(root.SetAttribute("root", "bs1"));
    CHECK_NOTHROW(root.SetAttribute("name", ""));
    CHECK_NOTHROW(root.SetAttribute("paths", 3));
    CHECK_NOTHROW(root.SetAttribute("weight", 0.42));
  }

  SECTION("Add text") {
    CHECK_NOTHROW(root.AddText("text"));
    CHECK_NOTHROW(root.AddText(7));
    CHECK_NOTHROW(root.AddText(std::string("string")));
  }

  SECTION("Add child") {
    CHECK_THROWS_AS(root.AddChild(""), StreamError);
    CHECK_NOTHROW(root.AddChild("realization"));
  }

  SECTION("Text locks the element") {
    CHECK_NOTHROW(root.AddText("text"));
    CHECK_THROWS_AS(root.SetAttribute("attr", "value"), StreamError);
    CHECK_THROWS_AS(root.AddChild("source"), StreamError);
    CHECK_NOTHROW(root.AddText(" and continuation"));
  }

  SECTION("Children lock the element") {
    CHECK_NOTHROW(root.AddChild("source"));
    CHECK_THROWS_AS(root.SetAttribute("attr", "value"), StreamError);
    CHECK_THROWS_AS(root.AddText("text"), StreamError);
    CHECK_NOTHROW(root.AddChild("source"));
  }

  SECTION("Inactive parent") {
    {
      StreamElement child = root.AddChild("realization");
      CHECK_THROWS_AS(root.SetAttribute("attr", "value"), StreamError);
      CHECK_THROWS_AS(root.AddText("text"), StreamError);
      CHECK_THROWS_AS(root.AddChild("realization"), StreamError);
      CHECK_NOTHROW(child.SetAttribute("ordinal", 0));
      CHECK_NOTHROW(child.AddChild("source-group"));
    }
    CHECK_NOTHROW(root.AddChild("realization"));
  }
}

TEST_CASE("XmlStreamTest.Full", "[xml_stream]") {
  TempFile temp_file;
  INFO("XML temp file: " + temp_file.string());
  const char content[] =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<realization ordinal=\"1\" weight=\"0.18\" path=\"b1~c2\">\n"
      "  <empty/>\n"
      "  <source-group tectonic-region=\"Active Shallow Crust\">\n"
      "    <source id=\"src&amp;1\" collapsed=\"true\"/>\n"
      "    <source id=\"&lt;src2>\" collapsed=\"false\"/>\n"
      "  </source-group>\n"
      "  <note>quote &quot; and amp &amp;</note>\n"
      "</realization>\n";
  {
    FilePtr fp(std::fopen(temp_file.string().c_str(), "w"), &std::fclose);
    REQUIRE(fp);
    Stream xml_stream(fp.get());
    StreamElement root = xml_stream.root("realization");
    root.SetAttribute("ordinal", 1)
        .SetAttribute("weight", 0.18)
        .SetAttribute("path", "b1~c2");
    root.AddChild("empty");
    {
      StreamElement group = root.AddChild("source-group");
      group.SetAttribute("tectonic-region", "Active Shallow Crust");
      group.AddChild("source")
          .SetAttribute("id", "src&1")
          .SetAttribute("collapsed", true);
      group.AddChild("source")
          .SetAttribute("id", "<src2>")
          .SetAttribute("collapsed", false);
    }
    root.AddChild("note").AddText("quote \" and ").AddText("amp &");
  }
  CHECK(temp_file.Read() == content);
}

TEST_CASE("XmlStreamTest.NoIndent", "[xml_stream]") {
  TempFile temp_file;
  const char content[] =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<report>\n"
      "<information>\n"
      "<calculation-time>1.5</calculation-time>\n"
      "</information>\n"
      "</report>\n";
  {
    FilePtr fp(std::fopen(temp_file.string().c_str(), "w"), &std::fclose);
    REQUIRE(fp);
    Stream xml_stream(fp.get(), false);
    StreamElement root = xml_stream.root("report");
    root.AddChild("information").AddChild("calculation-time").AddText(1.5);
  }
  CHECK(temp_file.Read() == content);
}

}  // namespace tremor::xml::test
