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
/// Out-of-line parts of the Tremor exceptions.

#include "error.h"

#include <boost/exception/errinfo_at_line.hpp>
#include <boost/exception/errinfo_file_name.hpp>

namespace tremor::lt {

namespace {

/// libxml2 reports 0 for nodes without a known line.
std::optional<int> KnownLine(std::optional<int> line) {
  if (line && *line > 0)
    return line;
  return {};
}

/// Formats the user-facing message of logic tree errors.
std::string FormatMessage(std::optional<int> line, const std::string& filename,
                          const std::string& message) {
  line = KnownLine(line);
  return "filename '" + filename + "', line " +
         (line ? std::to_string(*line) : std::string("?")) + ": " + message;
}

}  // namespace

LogicTreeError::LogicTreeError(std::optional<int> line,
                               const std::string& filename,
                               const std::string& message)
    : ValidityError(FormatMessage(line, filename, message)) {
  *this << boost::errinfo_file_name(filename);
  if (std::optional<int> known_line = KnownLine(line))
    *this << boost::errinfo_at_line(*known_line);
}

}  // namespace tremor::lt
