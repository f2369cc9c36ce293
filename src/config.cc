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
/// Implementation of configuration facilities.

#include "config.h"

#include <optional>

#include <boost/exception/errinfo_at_line.hpp>
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/filesystem.hpp>

#include "error.h"

namespace fs = boost::filesystem;

namespace tremor {

namespace {  // Path normalization helpers.

/// @returns The absolute path in the generic format.
std::string normalize(std::string_view file_path, const fs::path& base_path) {
  return fs::absolute(std::string(file_path), base_path).generic_string();
}

}  // namespace

Config::Config(const std::string& config_file) {
  if (fs::exists(config_file) == false) {
    TREMOR_THROW(IOError("The configuration file does not exist."))
        << boost::errinfo_file_name(config_file);
  }

  xml::Document document(config_file);
  xml::Element root = document.root();
  if (root.name() != "tremor")
    TREMOR_THROW(xml::ValidityError("The configuration root must be 'tremor'"))
        << xml::errinfo_element(std::string(root.name()))
        << boost::errinfo_file_name(config_file);
  fs::path base_path = fs::absolute(config_file).parent_path();

  std::optional<xml::Element> logic_tree = root.child("logic-tree");
  if (!logic_tree || logic_tree->text().empty())
    TREMOR_THROW(xml::ValidityError("The logic tree file is not specified"))
        << xml::errinfo_element("logic-tree")
        << boost::errinfo_file_name(config_file);
  logic_tree_file_ = normalize(logic_tree->text(), base_path);

  if (std::optional<xml::Element> model = root.child("source-model"))
    source_model_file_ = normalize(model->text(), base_path);

  if (std::optional<xml::Element> out = root.child("output-path"))
    output_path_ = normalize(out->text(), base_path);

  try {
    GatherOptions(root);
  } catch (Error& err) {
    err << boost::errinfo_file_name(config_file);
    throw;
  }
}

void Config::GatherOptions(const xml::Element& root) {
  std::optional<xml::Element> options_element = root.child("options");
  if (!options_element)
    return;
  for (const xml::Element& option_group : options_element->children()) {
    try {
      std::string_view name = option_group.name();
      if (name == "sampling") {
        if (std::optional<int> number = option_group.attribute<int>("number"))
          settings_.num_samples(*number);
        if (std::optional<int> seed = option_group.attribute<int>("seed"))
          settings_.seed(*seed);

      } else if (name == "limits") {
        if (std::optional<int> paths = option_group.attribute<int>("paths"))
          settings_.limit_paths(*paths);
      }
    } catch (SettingsError& err) {
      err << boost::errinfo_at_line(option_group.line());
      throw;
    }
  }
}

}  // namespace tremor
