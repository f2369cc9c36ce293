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
/// Magnitude-frequency distributions of seismic sources
/// and the modifications they accept.

#pragma once

#include <memory>
#include <variant>
#include <vector>

namespace tremor::model {

/// Sets the Gutenberg-Richter a and b values.
struct SetAB {
  static constexpr const char* kName = "set_ab";  ///< Operation name.
  double a_val;  ///< The new a value.
  double b_val;  ///< The new b value.
};

/// Increments the Gutenberg-Richter b value.
struct IncrementB {
  static constexpr const char* kName = "increment_b";  ///< Operation name.
  double value;  ///< The signed increment.
};

/// Increments the maximum magnitude.
struct IncrementMaxMag {
  static constexpr const char* kName = "increment_max_mag";  ///< Op name.
  double value;  ///< The signed increment.
};

/// Replaces the maximum magnitude.
struct SetMaxMag {
  static constexpr const char* kName = "set_max_mag";  ///< Operation name.
  double value;  ///< The new maximum magnitude.
};

/// Replaces the discretized occurrence rates.
struct SetMfd {
  static constexpr const char* kName = "set_mfd";  ///< Operation name.
  double min_mag;  ///< The magnitude of the first bin.
  double bin_width;  ///< The magnitude bin width.
  std::vector<double> occurrence_rates;  ///< The rates per bin.
};

/// All the modifications of magnitude-frequency distributions.
using MfdModification =
    std::variant<SetAB, IncrementB, IncrementMaxMag, SetMaxMag, SetMfd>;

/// Abstract base for magnitude-frequency distributions.
/// Each concrete distribution supports only some modifications;
/// the rest are reported as illegal operations.
class Mfd {
 public:
  virtual ~Mfd() = default;

  /// @returns The type name of the distribution for messages.
  virtual const char* kind() const = 0;

  /// @returns A deep copy of this distribution.
  virtual std::unique_ptr<Mfd> Clone() const = 0;

  /// Applies a named modification with its parameters.
  ///
  /// @param[in] modification  The operation and parameters.
  ///
  /// @throws IllegalOperation  The modification is not supported.
  /// @throws DomainError  The result would be an invalid distribution.
  void Modify(const MfdModification& modification);

 protected:
  /// Modification handlers.
  /// The default implementations reject the operation.
  /// @{
  virtual void Apply(const SetAB& op) { Unsupported(op.kName); }
  virtual void Apply(const IncrementB& op) { Unsupported(op.kName); }
  virtual void Apply(const IncrementMaxMag& op) { Unsupported(op.kName); }
  virtual void Apply(const SetMaxMag& op) { Unsupported(op.kName); }
  virtual void Apply(const SetMfd& op) { Unsupported(op.kName); }
  /// @}

 private:
  /// @throws IllegalOperation  Always for the given operation name.
  [[noreturn]] void Unsupported(const char* operation) const;
};

/// Truncated Gutenberg-Richter distribution.
class TruncatedGRMfd : public Mfd {
 public:
  /// @param[in] min_mag  The minimum magnitude.
  /// @param[in] max_mag  The maximum magnitude.
  /// @param[in] bin_width  The magnitude bin width.
  /// @param[in] a_val  The cumulative a value.
  /// @param[in] b_val  The positive b value.
  ///
  /// @throws DomainError  The parameters are invalid.
  TruncatedGRMfd(double min_mag, double max_mag, double bin_width,
                 double a_val, double b_val);

  const char* kind() const override { return "truncGutenbergRichterMFD"; }

  std::unique_ptr<Mfd> Clone() const override {
    return std::make_unique<TruncatedGRMfd>(*this);
  }

  double min_mag() const { return min_mag_; }
  double max_mag() const { return max_mag_; }
  double bin_width() const { return bin_width_; }
  double a_val() const { return a_val_; }
  double b_val() const { return b_val_; }

 protected:
  void Apply(const SetAB& op) override;
  void Apply(const IncrementB& op) override;
  void Apply(const IncrementMaxMag& op) override;
  void Apply(const SetMaxMag& op) override;

 private:
  /// @throws DomainError  The parameters are invalid.
  static void Validate(double min_mag, double max_mag, double bin_width,
                       double b_val);

  double min_mag_;
  double max_mag_;
  double bin_width_;
  double a_val_;
  double b_val_;
};

/// Incremental distribution with explicit rates for evenly spaced bins.
class EvenlyDiscretizedMfd : public Mfd {
 public:
  /// @param[in] min_mag  The magnitude of the first bin.
  /// @param[in] bin_width  The positive bin width.
  /// @param[in] occurrence_rates  Non-empty non-negative rates.
  ///
  /// @throws DomainError  The parameters are invalid.
  EvenlyDiscretizedMfd(double min_mag, double bin_width,
                       std::vector<double> occurrence_rates);

  const char* kind() const override { return "incrementalMFD"; }

  std::unique_ptr<Mfd> Clone() const override {
    return std::make_unique<EvenlyDiscretizedMfd>(*this);
  }

  double min_mag() const { return min_mag_; }
  double bin_width() const { return bin_width_; }
  const std::vector<double>& occurrence_rates() const {
    return occurrence_rates_;
  }

 protected:
  void Apply(const SetMfd& op) override;

 private:
  /// @throws DomainError  The parameters are invalid.
  static void Validate(double bin_width, const std::vector<double>& rates);

  double min_mag_;
  double bin_width_;
  std::vector<double> occurrence_rates_;
};

}  // namespace tremor::model
