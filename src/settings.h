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
/// Builder for settings.

#pragma once

namespace tremor::core {

/// Builder for logic tree processing settings.
/// Processing facilities are guaranteed not to throw or fail
/// with an instance of this class.
class Settings {
 public:
  /// @returns The number of sampled realizations.
  ///          0 for the full enumeration of paths.
  int num_samples() const { return num_samples_; }

  /// Sets the number of realizations to sample.
  ///
  /// @param[in] n  A non-negative number (0 to enumerate all paths).
  ///
  /// @returns Reference to this object.
  ///
  /// @throws SettingsError  The number is negative.
  Settings& num_samples(int n);

  /// @returns The seed of the pseudo-random number generator.
  int seed() const { return seed_; }

  /// Sets the seed for the pseudo-random number generator.
  ///
  /// @param[in] s  A non-negative number.
  ///
  /// @returns Reference to this object.
  ///
  /// @throws SettingsError  The number is negative.
  Settings& seed(int s);

  /// @returns The limit on the number of enumerated paths to report.
  ///          0 for no limit.
  int limit_paths() const { return limit_paths_; }

  /// Sets the limit on the reported paths of the enumeration.
  ///
  /// @param[in] n  A non-negative number (0 for no limit).
  ///
  /// @returns Reference to this object.
  ///
  /// @throws SettingsError  The number is negative.
  Settings& limit_paths(int n);

 private:
  int num_samples_ = 0;  ///< The number of realizations.
  int seed_ = 42;  ///< The seed for the sampling.
  int limit_paths_ = 0;  ///< The limit on the enumeration report.
};

}  // namespace tremor::core
