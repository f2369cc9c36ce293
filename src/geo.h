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
/// Geographic value types for seismic source geometries.
/// Only the construction and validation of the values are provided;
/// geodetic computations are outside of this library.

#pragma once

#include <variant>
#include <vector>

namespace tremor::geo {

/// The Earth radius in km used to bound point depths.
const double kEarthRadius = 6371.0;

/// Geographical point in terms of longitude, latitude, and depth.
class Point {
 public:
  /// @param[in] longitude  Decimal degrees in [-180, 180].
  /// @param[in] latitude  Decimal degrees in [-90, 90].
  /// @param[in] depth  Depth in km (positive below the surface).
  ///
  /// @throws DomainError  Any coordinate is out of range.
  Point(double longitude, double latitude, double depth = 0);

  double longitude() const { return longitude_; }  ///< Degrees.
  double latitude() const { return latitude_; }  ///< Degrees.
  double depth() const { return depth_; }  ///< Kilometers.

 private:
  double longitude_;
  double latitude_;
  double depth_;
};

/// Polyline defined by an ordered sequence of points.
class Line {
 public:
  /// @param[in] points  One or more points of the line.
  ///
  /// @throws DomainError  The line has no points.
  explicit Line(std::vector<Point> points);

  /// @returns The non-empty points of the line.
  const std::vector<Point>& points() const { return points_; }

  /// @returns The number of points in the line.
  int size() const { return points_.size(); }

 private:
  std::vector<Point> points_;
};

/// Fault surface from a surface trace, seismogenic depths, and dip.
struct SimpleFaultSurface {
  Line trace;  ///< The fault trace on the surface.
  double upper_seismogenic_depth;  ///< In km.
  double lower_seismogenic_depth;  ///< In km.
  double dip;  ///< In degrees (0, 90].
  double spacing;  ///< The mesh spacing in km.
};

/// Fault surface from the top, intermediate, and bottom edges.
struct ComplexFaultSurface {
  std::vector<Line> edges;  ///< Two or more edges from the top.
  double spacing;  ///< The mesh spacing in km.
};

/// Rectangular planar surface defined by its corners.
struct PlanarSurface {
  Point top_left;  ///< The corner on the top edge.
  Point top_right;  ///< The corner on the top edge.
  Point bottom_right;  ///< The corner on the bottom edge.
  Point bottom_left;  ///< The corner on the bottom edge.
  double spacing;  ///< The mesh spacing in km.
};

/// The surfaces that can be combined into a multi-surface.
using SingleSurface =
    std::variant<SimpleFaultSurface, ComplexFaultSurface, PlanarSurface>;

/// Composite of two or more single surfaces.
class MultiSurface {
 public:
  /// @param[in] surfaces  The component surfaces.
  ///
  /// @throws DomainError  Fewer than two surfaces are given.
  explicit MultiSurface(std::vector<SingleSurface> surfaces);

  /// @returns The component surfaces.
  const std::vector<SingleSurface>& surfaces() const { return surfaces_; }

 private:
  std::vector<SingleSurface> surfaces_;
};

/// Any surface of characteristic fault sources.
using Surface = std::variant<SimpleFaultSurface, ComplexFaultSurface,
                             PlanarSurface, MultiSurface>;

/// @returns true if the surface is a composite of sub-surfaces.
inline bool IsMultiSurface(const Surface& surface) {
  return std::holds_alternative<MultiSurface>(surface);
}

/// Builds a surface from one or more single surfaces.
///
/// @param[in] surfaces  The non-empty list of surfaces.
///
/// @returns The only surface or a multi-surface of all the surfaces.
Surface MakeSurface(std::vector<SingleSurface> surfaces);

}  // namespace tremor::geo
