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
/// Implementation of the geometry readers.

#include "geometry_reader.h"

#include <string>

#include "error.h"

namespace tremor::geo {

std::vector<double> ReadNumbers(std::string_view text) {
  std::vector<double> numbers;
  for (std::string_view token : xml::detail::split(text))
    numbers.push_back(xml::detail::to<double>(token));
  return numbers;
}

xml::Element RequireChild(const xml::Element& node, std::string_view name) {
  std::optional<xml::Element> child = node.child(name);
  if (!child)
    TREMOR_THROW(xml::ValidityError("Missing element"))
        << xml::errinfo_element(std::string(name));
  return *child;
}

double RequireAttribute(const xml::Element& node, const char* name) {
  std::optional<double> value = node.attribute<double>(name);
  if (!value)
    TREMOR_THROW(xml::ValidityError("Missing attribute"))
        << xml::errinfo_attribute(name)
        << xml::errinfo_element(std::string(node.name()));
  return *value;
}

namespace {

/// Converts the flat coordinates into points.
///
/// @throws DomainError  The coordinates are incomplete or out of range
///                      or the depths are negative.
std::vector<Point> ReadPoints(const xml::Element& pos_list, int dimension) {
  std::vector<double> coords = ReadNumbers(pos_list.text());
  if (coords.empty() || coords.size() % dimension)
    TREMOR_THROW(DomainError("Incomplete coordinates in the position list"))
        << errinfo_value(std::string(pos_list.text()));
  std::vector<Point> points;
  for (auto it = coords.begin(); it != coords.end(); it += dimension) {
    double depth = dimension == 3 ? it[2] : 0;
    if (depth < 0)
      TREMOR_THROW(DomainError("The depth cannot be negative"))
          << errinfo_value(std::to_string(depth));
    points.emplace_back(it[0], it[1], depth);
  }
  return points;
}

}  // namespace

Point ReadPoint(const xml::Element& node) {
  std::vector<Point> points =
      ReadPoints(RequireChild(RequireChild(node, "Point"), "pos"), 2);
  if (points.size() != 1)
    TREMOR_THROW(DomainError("Expected a single point position"));
  return points.front();
}

Line ReadLine(const xml::Element& node, int dimension) {
  return Line(ReadPoints(
      RequireChild(RequireChild(node, "LineString"), "posList"), dimension));
}

std::vector<Point> ReadPolygon(const xml::Element& node) {
  xml::Element ring = RequireChild(
      RequireChild(RequireChild(node, "Polygon"), "exterior"), "LinearRing");
  std::vector<Point> polygon = ReadPoints(RequireChild(ring, "posList"), 2);
  if (polygon.size() < 3)
    TREMOR_THROW(DomainError("A polygon requires three or more points"));
  return polygon;
}

double ReadSpacing(const xml::Element& node,
                   std::optional<double> default_spacing) {
  std::optional<double> spacing = node.attribute<double>("spacing");
  if (!spacing)
    spacing = default_spacing;
  if (!spacing)
    return RequireAttribute(node, "spacing");
  if (*spacing <= 0)
    TREMOR_THROW(DomainError("The mesh spacing must be positive"))
        << errinfo_value(std::to_string(*spacing));
  return *spacing;
}

SimpleFaultSurface ReadSimpleFault(const xml::Element& node,
                                   std::optional<double> default_spacing) {
  return {ReadLine(node, 2),
          RequireChild(node, "upperSeismoDepth").text<double>(),
          RequireChild(node, "lowerSeismoDepth").text<double>(),
          RequireChild(node, "dip").text<double>(),
          ReadSpacing(node, default_spacing)};
}

ComplexFaultSurface ReadComplexFault(const xml::Element& node,
                                     std::optional<double> default_spacing) {
  std::vector<Line> edges;
  for (const xml::Element& edge : node.children())
    edges.push_back(ReadLine(edge, 3));
  if (edges.size() < 2)
    TREMOR_THROW(DomainError("The fault requires top and bottom edges"));
  return {std::move(edges), ReadSpacing(node, default_spacing)};
}

PlanarSurface ReadPlanarSurface(const xml::Element& node,
                                std::optional<double> default_spacing) {
  auto read_corner = [&node](const char* name) {
    xml::Element corner = RequireChild(node, name);
    double depth = RequireAttribute(corner, "depth");
    if (depth < 0)
      TREMOR_THROW(DomainError("The corner depth cannot be negative"))
          << errinfo_value(std::to_string(depth));
    return Point(RequireAttribute(corner, "lon"),
                 RequireAttribute(corner, "lat"), depth);
  };
  return {read_corner("topLeft"), read_corner("topRight"),
          read_corner("bottomRight"), read_corner("bottomLeft"),
          ReadSpacing(node, default_spacing)};
}

std::optional<SingleSurface> ReadSingleSurface(
    const xml::Element& node, std::optional<double> default_spacing) {
  std::string_view name = node.name();
  if (name == "simpleFaultGeometry")
    return ReadSimpleFault(node, default_spacing);
  if (name == "complexFaultGeometry")
    return ReadComplexFault(node, default_spacing);
  if (name == "planarSurface")
    return ReadPlanarSurface(node, default_spacing);
  return {};
}

}  // namespace tremor::geo
