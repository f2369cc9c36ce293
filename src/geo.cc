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
/// Validation of geographic values.

#include "geo.h"

#include <cassert>

#include <string>

#include "error.h"

namespace tremor::geo {

Point::Point(double longitude, double latitude, double depth)
    : longitude_(longitude), latitude_(latitude), depth_(depth) {
  if (longitude < -180 || longitude > 180)
    TREMOR_THROW(DomainError("Longitude is outside of [-180, 180]"))
        << errinfo_value(std::to_string(longitude));
  if (latitude < -90 || latitude > 90)
    TREMOR_THROW(DomainError("Latitude is outside of [-90, 90]"))
        << errinfo_value(std::to_string(latitude));
  if (depth >= kEarthRadius)
    TREMOR_THROW(DomainError("The depth must be less than the Earth radius"))
        << errinfo_value(std::to_string(depth));
}

Line::Line(std::vector<Point> points) : points_(std::move(points)) {
  if (points_.empty())
    TREMOR_THROW(DomainError("A line requires at least one point"));
}

MultiSurface::MultiSurface(std::vector<SingleSurface> surfaces)
    : surfaces_(std::move(surfaces)) {
  if (surfaces_.size() < 2)
    TREMOR_THROW(DomainError("A multi-surface requires two or more surfaces"))
        << errinfo_value(std::to_string(surfaces_.size()));
}

Surface MakeSurface(std::vector<SingleSurface> surfaces) {
  assert(!surfaces.empty());
  if (surfaces.size() > 1)
    return MultiSurface(std::move(surfaces));
  return std::visit([](auto& surface) -> Surface { return std::move(surface); },
                    surfaces.front());
}

}  // namespace tremor::geo
