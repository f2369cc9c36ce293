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
/// Configuration management facilities
/// to make various setups for logic tree processing possible.

#pragma once

#include <string>

#include <boost/filesystem/path.hpp>

#include "settings.h"
#include "xml.h"

namespace tremor {

/// This class processes configuration files for logic tree processing.
/// The class contains all the setup and state
/// to initialize the processing.
class Config {
 public:
  /// Reads and validates the configurations.
  ///
  /// All relative paths in the configuration are resolved
  /// with respect to the location of the original configuration file.
  ///
  /// @param[in] config_file  The path to an XML file with configurations.
  ///
  /// @throws xml::ValidityError  The configurations have problems.
  /// @throws SettingsError  Settings values contain errors.
  /// @throws IOError  The file is not accessible.
  explicit Config(const std::string& config_file);

  /// @returns The normalized, absolute path to the logic tree file.
  const std::string& logic_tree_file() const { return logic_tree_file_; }

  /// @returns The normalized, absolute path to the source model file.
  ///          Empty string if no source model is given.
  const std::string& source_model_file() const { return source_model_file_; }

  /// @returns The settings for the processing.
  const core::Settings& settings() const { return settings_; }

  /// @returns The output destination path (absolute, normalized).
  ///          Empty string if no path has been set.
  const std::string& output_path() const { return output_path_; }

 private:
  /// Gathers options for the processing.
  ///
  /// @param[in] root  The root XML element.
  void GatherOptions(const xml::Element& root);

  std::string logic_tree_file_;  ///< The logic tree input.
  std::string source_model_file_;  ///< The optional source model input.
  core::Settings settings_;  ///< Settings for the processing.
  std::string output_path_;  ///< The output destination.
};

}  // namespace tremor
