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
/// Version information from the build configuration.

#include "version.h"

#include <boost/version.hpp>
#include <libxml/xmlversion.h>

#ifndef TREMOR_VERSION
#error "The build must define TREMOR_VERSION."
#endif

#ifndef TREMOR_BUILD_TYPE
#define TREMOR_BUILD_TYPE "unknown"
#endif

namespace tremor::version {

const char* core() { return TREMOR_VERSION; }

const char* build() { return TREMOR_BUILD_TYPE; }

const char* boost() { return BOOST_LIB_VERSION; }

const char* xml() { return LIBXML_DOTTED_VERSION; }

}  // namespace tremor::version
