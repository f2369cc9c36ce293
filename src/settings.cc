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
/// Implementation of Settings Builder.

#include "settings.h"

#include <string>

#include "error.h"

namespace tremor::core {

Settings& Settings::num_samples(int n) {
  if (n < 0)
    TREMOR_THROW(SettingsError("The number of samples cannot be negative."))
        << errinfo_value(std::to_string(n));

  num_samples_ = n;
  return *this;
}

Settings& Settings::seed(int s) {
  if (s < 0)
    TREMOR_THROW(SettingsError("The seed for PRNG cannot be negative."))
        << errinfo_value(std::to_string(s));

  seed_ = s;
  return *this;
}

Settings& Settings::limit_paths(int n) {
  if (n < 0)
    TREMOR_THROW(SettingsError("The limit on paths cannot be negative."))
        << errinfo_value(std::to_string(n));

  limit_paths_ = n;
  return *this;
}

}  // namespace tremor::core
