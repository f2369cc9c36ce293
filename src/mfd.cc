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
/// Implementation of magnitude-frequency distribution modifications.

#include "mfd.h"

#include <algorithm>
#include <string>

#include "error.h"

namespace tremor::model {

void Mfd::Modify(const MfdModification& modification) {
  std::visit([this](const auto& op) { this->Apply(op); }, modification);
}

void Mfd::Unsupported(const char* operation) const {
  TREMOR_THROW(IllegalOperation(std::string("Modification '") + operation +
                                "' is not supported by " + kind()))
      << errinfo_operation(operation);
}

TruncatedGRMfd::TruncatedGRMfd(double min_mag, double max_mag,
                               double bin_width, double a_val, double b_val)
    : min_mag_(min_mag),
      max_mag_(max_mag),
      bin_width_(bin_width),
      a_val_(a_val),
      b_val_(b_val) {
  Validate(min_mag_, max_mag_, bin_width_, b_val_);
}

void TruncatedGRMfd::Validate(double min_mag, double max_mag,
                              double bin_width, double b_val) {
  if (bin_width <= 0)
    TREMOR_THROW(DomainError("The bin width must be positive"))
        << errinfo_value(std::to_string(bin_width));
  if (min_mag < 0 || min_mag >= max_mag)
    TREMOR_THROW(DomainError("The magnitude range must be [min < max]"))
        << errinfo_value(std::to_string(min_mag) + " " +
                         std::to_string(max_mag));
  if (b_val <= 0)
    TREMOR_THROW(DomainError("The b value must be positive"))
        << errinfo_value(std::to_string(b_val));
}

void TruncatedGRMfd::Apply(const SetAB& op) {
  Validate(min_mag_, max_mag_, bin_width_, op.b_val);
  a_val_ = op.a_val;
  b_val_ = op.b_val;
}

void TruncatedGRMfd::Apply(const IncrementB& op) {
  Validate(min_mag_, max_mag_, bin_width_, b_val_ + op.value);
  b_val_ += op.value;
}

void TruncatedGRMfd::Apply(const IncrementMaxMag& op) {
  Validate(min_mag_, max_mag_ + op.value, bin_width_, b_val_);
  max_mag_ += op.value;
}

void TruncatedGRMfd::Apply(const SetMaxMag& op) {
  Validate(min_mag_, op.value, bin_width_, b_val_);
  max_mag_ = op.value;
}

EvenlyDiscretizedMfd::EvenlyDiscretizedMfd(double min_mag, double bin_width,
                                           std::vector<double> occurrence_rates)
    : min_mag_(min_mag),
      bin_width_(bin_width),
      occurrence_rates_(std::move(occurrence_rates)) {
  Validate(bin_width_, occurrence_rates_);
}

void EvenlyDiscretizedMfd::Validate(double bin_width,
                                    const std::vector<double>& rates) {
  if (bin_width <= 0)
    TREMOR_THROW(DomainError("The bin width must be positive"))
        << errinfo_value(std::to_string(bin_width));
  if (rates.empty())
    TREMOR_THROW(DomainError("The occurrence rates are missing"));
  if (std::any_of(rates.begin(), rates.end(),
                  [](double rate) { return rate < 0; }))
    TREMOR_THROW(DomainError("The occurrence rates cannot be negative"));
}

void EvenlyDiscretizedMfd::Apply(const SetMfd& op) {
  Validate(op.bin_width, op.occurrence_rates);
  min_mag_ = op.min_mag;
  bin_width_ = op.bin_width;
  occurrence_rates_ = op.occurrence_rates;
}

}  // namespace tremor::model
