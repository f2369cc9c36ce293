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
/// Implementation of source constructions and modifications.

#include "source.h"

#include <string>

#include "error.h"

namespace tremor::model {

namespace {

/// @throws DomainError  The seismogenic depths are not ordered.
void ValidateDepths(double upper_depth, double lower_depth) {
  if (upper_depth < 0 || upper_depth >= lower_depth)
    TREMOR_THROW(DomainError("The seismogenic depths must be [upper < lower]"))
        << errinfo_value(std::to_string(upper_depth) + " " +
                         std::to_string(lower_depth));
}

/// @throws DomainError  The dip angle is outside of (0, 90].
void ValidateDip(double dip) {
  if (dip <= 0 || dip > 90)
    TREMOR_THROW(DomainError("The dip must be in (0, 90]"))
        << errinfo_value(std::to_string(dip));
}

/// @throws DomainError  The mesh spacing is not positive.
void ValidateSpacing(double spacing) {
  if (spacing <= 0)
    TREMOR_THROW(DomainError("The mesh spacing must be positive"))
        << errinfo_value(std::to_string(spacing));
}

void Validate(const geo::SimpleFaultSurface& geometry) {
  if (geometry.trace.size() < 2)
    TREMOR_THROW(DomainError("The fault trace requires two or more points"));
  ValidateDepths(geometry.upper_seismogenic_depth,
                 geometry.lower_seismogenic_depth);
  ValidateDip(geometry.dip);
  ValidateSpacing(geometry.spacing);
}

void Validate(const geo::ComplexFaultSurface& geometry) {
  if (geometry.edges.size() < 2)
    TREMOR_THROW(DomainError("The fault requires the top and bottom edges"));
  ValidateSpacing(geometry.spacing);
}

}  // namespace

Source::Source(std::string source_id, std::string name,
               std::string tectonic_region_type, std::unique_ptr<Mfd> mfd)
    : source_id_(std::move(source_id)),
      name_(std::move(name)),
      tectonic_region_type_(std::move(tectonic_region_type)),
      mfd_(std::move(mfd)) {
  if (source_id_.empty())
    TREMOR_THROW(LogicError("The source identifier cannot be empty"));
}

Source::Source(const Source& other)
    : source_id_(other.source_id_),
      name_(other.name_),
      tectonic_region_type_(other.tectonic_region_type_),
      mfd_(other.mfd_ ? other.mfd_->Clone() : nullptr),
      scaling_rate_(other.scaling_rate_) {}

void Source::Modify(const SourceModification& modification) {
  try {
    std::visit([this](const auto& op) { this->Apply(op); }, modification);
  } catch (Error& err) {
    err << errinfo_source_id(source_id_);
    throw;
  }
}

void Source::Unsupported(const char* operation) const {
  TREMOR_THROW(IllegalOperation(std::string("Modification '") + operation +
                                "' is not supported by " +
                                kSourceKindToString[static_cast<int>(kind())] +
                                " sources"))
      << errinfo_operation(operation);
}

PointSource::PointSource(std::string source_id, std::string name,
                         std::string tectonic_region_type,
                         std::unique_ptr<Mfd> mfd, geo::Point location,
                         double upper_seismogenic_depth,
                         double lower_seismogenic_depth)
    : PointSource(std::move(source_id), std::move(name),
                  std::move(tectonic_region_type), std::move(mfd),
                  std::vector<geo::Point>{location}, upper_seismogenic_depth,
                  lower_seismogenic_depth) {}

PointSource::PointSource(std::string source_id, std::string name,
                         std::string tectonic_region_type,
                         std::unique_ptr<Mfd> mfd,
                         std::vector<geo::Point> footprint,
                         double upper_seismogenic_depth,
                         double lower_seismogenic_depth)
    : Source(std::move(source_id), std::move(name),
             std::move(tectonic_region_type), std::move(mfd)),
      footprint_(std::move(footprint)),
      upper_seismogenic_depth_(upper_seismogenic_depth),
      lower_seismogenic_depth_(lower_seismogenic_depth) {
  if (footprint_.empty())
    TREMOR_THROW(DomainError("The source location is missing"))
        << errinfo_source_id(this->source_id());
  ValidateDepths(upper_seismogenic_depth_, lower_seismogenic_depth_);
}

AreaSource::AreaSource(std::string source_id, std::string name,
                       std::string tectonic_region_type,
                       std::unique_ptr<Mfd> mfd,
                       std::vector<geo::Point> polygon,
                       double upper_seismogenic_depth,
                       double lower_seismogenic_depth,
                       double area_discretization)
    : PointSource(std::move(source_id), std::move(name),
                  std::move(tectonic_region_type), std::move(mfd),
                  std::move(polygon), upper_seismogenic_depth,
                  lower_seismogenic_depth),
      area_discretization_(area_discretization) {
  if (footprint().size() < 3)
    TREMOR_THROW(DomainError("The area polygon requires three or more points"))
        << errinfo_source_id(this->source_id());
  if (area_discretization_ <= 0)
    TREMOR_THROW(DomainError("The area discretization must be positive"))
        << errinfo_value(std::to_string(area_discretization_))
        << errinfo_source_id(this->source_id());
}

SimpleFaultSource::SimpleFaultSource(std::string source_id, std::string name,
                                     std::string tectonic_region_type,
                                     std::unique_ptr<Mfd> mfd,
                                     geo::SimpleFaultSurface geometry)
    : Source(std::move(source_id), std::move(name),
             std::move(tectonic_region_type), std::move(mfd)),
      geometry_(std::move(geometry)) {
  Validate(geometry_);
}

void SimpleFaultSource::Apply(const AdjustDip& op) {
  ValidateDip(geometry_.dip + op.increment);
  geometry_.dip += op.increment;
}

void SimpleFaultSource::Apply(const SetDip& op) {
  ValidateDip(op.dip);
  geometry_.dip = op.dip;
}

void SimpleFaultSource::Apply(const SetSimpleFaultGeometry& op) {
  Validate(op.geometry);
  geometry_ = op.geometry;
}

ComplexFaultSource::ComplexFaultSource(std::string source_id, std::string name,
                                       std::string tectonic_region_type,
                                       std::unique_ptr<Mfd> mfd,
                                       geo::ComplexFaultSurface geometry)
    : Source(std::move(source_id), std::move(name),
             std::move(tectonic_region_type), std::move(mfd)),
      geometry_(std::move(geometry)) {
  Validate(geometry_);
}

void ComplexFaultSource::Apply(const SetComplexFaultGeometry& op) {
  Validate(op.geometry);
  geometry_ = op.geometry;
}

CharacteristicFaultSource::CharacteristicFaultSource(
    std::string source_id, std::string name, std::string tectonic_region_type,
    std::unique_ptr<Mfd> mfd, geo::Surface surface)
    : Source(std::move(source_id), std::move(name),
             std::move(tectonic_region_type), std::move(mfd)),
      surface_(std::move(surface)) {}

void CharacteristicFaultSource::Apply(const SetSurface& op) {
  surface_ = op.surface;
}

}  // namespace tremor::model
