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
/// Seismic sources, source groups,
/// and the modifications the sources accept.

#pragma once

#include <cstdint>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "geo.h"
#include "mfd.h"

namespace tremor::model {

/// Increments the fault dip angle.
struct AdjustDip {
  static constexpr const char* kName = "adjust_dip";  ///< Operation name.
  double increment;  ///< The signed increment in degrees.
};

/// Replaces the fault dip angle.
struct SetDip {
  static constexpr const char* kName = "set_dip";  ///< Operation name.
  double dip;  ///< The new dip in degrees.
};

/// Replaces the geometry with fault trace, depths, dip, and spacing.
struct SetSimpleFaultGeometry {
  static constexpr const char* kName = "set_geometry";  ///< Operation name.
  geo::SimpleFaultSurface geometry;  ///< The new geometry.
};

/// Replaces the geometry with fault edges and spacing.
struct SetComplexFaultGeometry {
  static constexpr const char* kName = "set_geometry";  ///< Operation name.
  geo::ComplexFaultSurface geometry;  ///< The new geometry.
};

/// Replaces the geometry with a pre-built surface or multi-surface.
struct SetSurface {
  static constexpr const char* kName = "set_geometry";  ///< Operation name.
  geo::Surface surface;  ///< The new surface.
};

/// All the modifications of the sources themselves.
/// The distribution modifications go to the source MFD.
using SourceModification =
    std::variant<AdjustDip, SetDip, SetSimpleFaultGeometry,
                 SetComplexFaultGeometry, SetSurface>;

/// The concrete types of sources.
enum class SourceKind : std::uint8_t {
  kPoint = 0,
  kArea,
  kSimpleFault,
  kComplexFault,
  kCharacteristicFault
};

/// String representations of the source kinds.
const char* const kSourceKindToString[] = {
    "point", "area", "simpleFault", "complexFault", "characteristicFault"};

/// Abstract base for seismic sources.
///
/// Copies are deep:
/// the magnitude-frequency distribution is never shared between sources.
class Source {
 public:
  /// @param[in] source_id  The unique identifier of the source.
  /// @param[in] name  The human readable name.
  /// @param[in] tectonic_region_type  The tectonic region of the source.
  /// @param[in] mfd  The optional magnitude-frequency distribution.
  ///
  /// @throws LogicError  The identifier is empty.
  Source(std::string source_id, std::string name,
         std::string tectonic_region_type, std::unique_ptr<Mfd> mfd);

  virtual ~Source() = default;

  Source& operator=(const Source&) = delete;

  /// @returns The concrete type of the source.
  virtual SourceKind kind() const = 0;

  /// @returns An independent deep copy of this source.
  virtual std::unique_ptr<Source> Clone() const = 0;

  /// @returns true if the source geometry is a composite of surfaces.
  virtual bool is_multi_surface() const { return false; }

  const std::string& source_id() const { return source_id_; }
  const std::string& name() const { return name_; }
  const std::string& tectonic_region_type() const {
    return tectonic_region_type_;
  }

  /// @returns The magnitude-frequency distribution.
  ///          nullptr if the source has no distribution.
  /// @{
  const Mfd* mfd() const { return mfd_.get(); }
  Mfd* mfd() { return mfd_.get(); }
  /// @}

  /// @returns The rate scaling factor of the source (1 by default).
  double scaling_rate() const { return scaling_rate_; }

  /// @param[in] factor  The rate scaling factor.
  void scaling_rate(double factor) { scaling_rate_ = factor; }

  /// Applies a named modification with its parameters.
  ///
  /// @param[in] modification  The operation and parameters.
  ///
  /// @throws IllegalOperation  The modification is not supported.
  /// @throws DomainError  The result would be an invalid source.
  void Modify(const SourceModification& modification);

 protected:
  /// Deep copy for Clone implementations.
  Source(const Source& other);

  /// Modification handlers.
  /// The default implementations reject the operation.
  /// @{
  virtual void Apply(const AdjustDip& op) { Unsupported(op.kName); }
  virtual void Apply(const SetDip& op) { Unsupported(op.kName); }
  virtual void Apply(const SetSimpleFaultGeometry& op) {
    Unsupported(op.kName);
  }
  virtual void Apply(const SetComplexFaultGeometry& op) {
    Unsupported(op.kName);
  }
  virtual void Apply(const SetSurface& op) { Unsupported(op.kName); }
  /// @}

 private:
  /// @throws IllegalOperation  Always for the given operation name.
  [[noreturn]] void Unsupported(const char* operation) const;

  std::string source_id_;
  std::string name_;
  std::string tectonic_region_type_;
  std::unique_ptr<Mfd> mfd_;
  double scaling_rate_ = 1;
};

/// Point source with a single epicenter location.
class PointSource : public Source {
 public:
  /// @param[in] location  The epicenter.
  /// @param[in] upper_seismogenic_depth  In km.
  /// @param[in] lower_seismogenic_depth  In km.
  ///
  /// @throws DomainError  The depths are not ordered.
  PointSource(std::string source_id, std::string name,
              std::string tectonic_region_type, std::unique_ptr<Mfd> mfd,
              geo::Point location, double upper_seismogenic_depth,
              double lower_seismogenic_depth);

  SourceKind kind() const override { return SourceKind::kPoint; }

  std::unique_ptr<Source> Clone() const override {
    return std::unique_ptr<Source>(new PointSource(*this));
  }

  /// @returns The location of the point or the first polygon vertex.
  const geo::Point& location() const { return footprint_.front(); }

  double upper_seismogenic_depth() const { return upper_seismogenic_depth_; }
  double lower_seismogenic_depth() const { return lower_seismogenic_depth_; }

 protected:
  PointSource(const PointSource&) = default;

  /// Constructs a point-like source with a multi-point footprint.
  PointSource(std::string source_id, std::string name,
              std::string tectonic_region_type, std::unique_ptr<Mfd> mfd,
              std::vector<geo::Point> footprint,
              double upper_seismogenic_depth, double lower_seismogenic_depth);

  /// @returns The points outlining the source.
  const std::vector<geo::Point>& footprint() const { return footprint_; }

 private:
  std::vector<geo::Point> footprint_;  ///< Non-empty outline.
  double upper_seismogenic_depth_;
  double lower_seismogenic_depth_;
};

/// Area source as a collection of point sources in a polygon.
class AreaSource : public PointSource {
 public:
  /// @param[in] polygon  Three or more polygon vertices.
  /// @param[in] area_discretization  The positive grid spacing in km.
  ///
  /// @throws DomainError  The polygon or discretization is invalid.
  AreaSource(std::string source_id, std::string name,
             std::string tectonic_region_type, std::unique_ptr<Mfd> mfd,
             std::vector<geo::Point> polygon, double upper_seismogenic_depth,
             double lower_seismogenic_depth, double area_discretization);

  SourceKind kind() const override { return SourceKind::kArea; }

  std::unique_ptr<Source> Clone() const override {
    return std::unique_ptr<Source>(new AreaSource(*this));
  }

  /// @returns The polygon vertices.
  const std::vector<geo::Point>& polygon() const { return footprint(); }

  double area_discretization() const { return area_discretization_; }

 protected:
  AreaSource(const AreaSource&) = default;

 private:
  double area_discretization_;
};

/// Fault source defined by a surface trace, depths, and dip.
class SimpleFaultSource : public Source {
 public:
  /// @param[in] geometry  The fault geometry.
  ///
  /// @throws DomainError  The geometry is invalid.
  SimpleFaultSource(std::string source_id, std::string name,
                    std::string tectonic_region_type, std::unique_ptr<Mfd> mfd,
                    geo::SimpleFaultSurface geometry);

  SourceKind kind() const override { return SourceKind::kSimpleFault; }

  std::unique_ptr<Source> Clone() const override {
    return std::unique_ptr<Source>(new SimpleFaultSource(*this));
  }

  const geo::SimpleFaultSurface& geometry() const { return geometry_; }

 protected:
  SimpleFaultSource(const SimpleFaultSource&) = default;

  void Apply(const AdjustDip& op) override;
  void Apply(const SetDip& op) override;
  void Apply(const SetSimpleFaultGeometry& op) override;

 private:
  geo::SimpleFaultSurface geometry_;
};

/// Fault source defined by its edges.
class ComplexFaultSource : public Source {
 public:
  /// @param[in] geometry  The fault geometry.
  ///
  /// @throws DomainError  The geometry is invalid.
  ComplexFaultSource(std::string source_id, std::string name,
                     std::string tectonic_region_type,
                     std::unique_ptr<Mfd> mfd,
                     geo::ComplexFaultSurface geometry);

  SourceKind kind() const override { return SourceKind::kComplexFault; }

  std::unique_ptr<Source> Clone() const override {
    return std::unique_ptr<Source>(new ComplexFaultSource(*this));
  }

  const geo::ComplexFaultSurface& geometry() const { return geometry_; }

 protected:
  ComplexFaultSource(const ComplexFaultSource&) = default;

  void Apply(const SetComplexFaultGeometry& op) override;

 private:
  geo::ComplexFaultSurface geometry_;
};

/// Fault source rupturing its whole surface at once.
class CharacteristicFaultSource : public Source {
 public:
  /// @param[in] surface  The single or multi-surface of the fault.
  CharacteristicFaultSource(std::string source_id, std::string name,
                            std::string tectonic_region_type,
                            std::unique_ptr<Mfd> mfd, geo::Surface surface);

  SourceKind kind() const override {
    return SourceKind::kCharacteristicFault;
  }

  std::unique_ptr<Source> Clone() const override {
    return std::unique_ptr<Source>(new CharacteristicFaultSource(*this));
  }

  bool is_multi_surface() const override {
    return geo::IsMultiSurface(surface_);
  }

  const geo::Surface& surface() const { return surface_; }

 protected:
  CharacteristicFaultSource(const CharacteristicFaultSource&) = default;

  void Apply(const SetSurface& op) override;

 private:
  geo::Surface surface_;
};

/// Group of sources sharing the same tectonic region type.
/// The sources are immutable and can be shared among groups.
class SourceGroup {
 public:
  /// Shared immutable source.
  using SourcePtr = std::shared_ptr<const Source>;

  /// @param[in] tectonic_region_type  The tectonic region of the group.
  /// @param[in] name  The optional name of the group.
  explicit SourceGroup(std::string tectonic_region_type,
                       std::string name = "")
      : tectonic_region_type_(std::move(tectonic_region_type)),
        name_(std::move(name)) {}

  const std::string& tectonic_region_type() const {
    return tectonic_region_type_;
  }
  const std::string& name() const { return name_; }

  /// @returns The sources in the order of addition.
  const std::vector<SourcePtr>& sources() const { return sources_; }

  /// @param[in] source  The source to append to the group.
  void Add(SourcePtr source) { sources_.push_back(std::move(source)); }

  /// @returns The number of modifications applied to produce this group.
  int changes() const { return changes_; }

  /// @param[in] count  The number of new modifications.
  void AddChanges(int count) { changes_ += count; }

  /// Iteration over the group sources.
  /// @{
  auto begin() const { return sources_.begin(); }
  auto end() const { return sources_.end(); }
  /// @}

 private:
  std::string tectonic_region_type_;
  std::string name_;
  std::vector<SourcePtr> sources_;
  int changes_ = 0;
};

}  // namespace tremor::model
