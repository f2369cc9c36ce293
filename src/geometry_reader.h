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
/// Reading of geographic values from GML-flavored XML elements.
///
/// The readers throw value errors without the XML location;
/// the callers attach the context of their input format.

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "geo.h"
#include "xml.h"

namespace tremor::geo {

/// @param[in] text  Whitespace separated numbers.
///
/// @returns The numbers in the order of appearance.
///
/// @throws xml::ValidityError  A token is not a number.
std::vector<double> ReadNumbers(std::string_view text);

/// @param[in] node  The element with the required child of the given name.
/// @param[in] name  The name of the child element.
///
/// @returns The first child element with the name.
///
/// @throws xml::ValidityError  The element is missing.
xml::Element RequireChild(const xml::Element& node, std::string_view name);

/// @param[in] node  The element with the required numeric attribute.
/// @param[in] name  The name of the attribute.
///
/// @returns The value of the attribute.
///
/// @throws xml::ValidityError  The attribute is missing or malformed.
double RequireAttribute(const xml::Element& node, const char* name);

/// Reads the point from Point/pos child (longitude latitude).
///
/// @throws ValidityError  The coordinates are malformed or out of range.
Point ReadPoint(const xml::Element& node);

/// Reads the line from LineString/posList child.
///
/// @param[in] node  The parent of the line string.
/// @param[in] dimension  2 for (lon, lat) or 3 for (lon, lat, depth).
///
/// @throws ValidityError  The coordinates are malformed or out of range.
Line ReadLine(const xml::Element& node, int dimension);

/// Reads the 2D outline from Polygon/exterior/LinearRing/posList child.
///
/// @throws ValidityError  The coordinates are malformed or out of range.
std::vector<Point> ReadPolygon(const xml::Element& node);

/// Reads the mesh spacing from the "spacing" attribute.
///
/// @param[in] node  The geometry element.
/// @param[in] default_spacing  The value for the missing attribute.
///
/// @throws ValidityError  The spacing is missing or not positive.
double ReadSpacing(const xml::Element& node,
                   std::optional<double> default_spacing = {});

/// Reads simpleFaultGeometry elements.
///
/// @throws ValidityError  The geometry is malformed.
SimpleFaultSurface ReadSimpleFault(const xml::Element& node,
                                   std::optional<double> default_spacing = {});

/// Reads complexFaultGeometry elements
/// with the 3D top, intermediate, and bottom edges.
///
/// @throws ValidityError  The geometry is malformed.
ComplexFaultSurface ReadComplexFault(
    const xml::Element& node, std::optional<double> default_spacing = {});

/// Reads planarSurface elements with lon/lat/depth corner attributes.
///
/// @throws ValidityError  The corners are malformed or above the surface.
PlanarSurface ReadPlanarSurface(const xml::Element& node,
                                std::optional<double> default_spacing = {});

/// Reads a single fault geometry element of any supported kind.
///
/// @returns None if the element is not a fault geometry.
///
/// @throws ValidityError  The geometry is malformed.
std::optional<SingleSurface> ReadSingleSurface(
    const xml::Element& node, std::optional<double> default_spacing = {});

}  // namespace tremor::geo
