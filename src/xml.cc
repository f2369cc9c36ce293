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
/// XML facility expensive wrappers implemented out-of-line.

#include "xml.h"

#include <cerrno>

#include <boost/exception/errinfo_errno.hpp>
#include <boost/exception/errinfo_file_open_mode.hpp>

namespace tremor::xml {

std::vector<std::string_view> detail::split(const std::string_view& text) {
  const char* kSpaces = " \t\n\r";
  std::vector<std::string_view> tokens;
  std::string_view::size_type pos = text.find_first_not_of(kSpaces);
  while (pos != std::string_view::npos) {
    std::string_view::size_type end = text.find_first_of(kSpaces, pos);
    if (end == std::string_view::npos)
      end = text.size();
    tokens.push_back(text.substr(pos, end - pos));
    pos = text.find_first_not_of(kSpaces, end);
  }
  return tokens;
}

Document::Document(const std::string& file_path) : doc_(nullptr, &xmlFreeDoc) {
  xmlResetLastError();
  doc_.reset(xmlReadFile(file_path.c_str(), nullptr, kParserOptions));
  const xmlError* xml_error = xmlGetLastError();
  if (xml_error) {
    if (xml_error->domain == XML_FROM_IO) {
      TREMOR_THROW(IOError(xml_error->message))
          << boost::errinfo_file_name(file_path) << boost::errinfo_errno(errno)
          << boost::errinfo_file_open_mode("r");
    }
    TREMOR_THROW(detail::GetError<ParseError>(xml_error));
  }
  if (!doc_)
    TREMOR_THROW(ParseError("The XML document is empty"))
        << boost::errinfo_file_name(file_path);
}

}  // namespace tremor::xml
