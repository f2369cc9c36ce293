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
/// Contains helpers for reproducible random sampling.

#pragma once

#include <cassert>
#include <cstdint>

#include <random>
#include <vector>

namespace tremor {

/// Wrapper of the random engine and distributions.
/// Each sampling session owns its own instance,
/// so concurrent sessions with different seeds never interfere.
///
/// The values passed to the member functions are asserted
/// to be in the correct form.
class Random {
 public:
  /// @param[in] seed  The seed for the underlying engine.
  explicit Random(std::uint32_t seed) noexcept : rng_(seed) {}

  /// RNG from a discrete distribution.
  ///
  /// @tparam Iterator  Input iterator of weights returning double.
  ///
  /// @param[in] first  The begin of the weights.
  /// @param[in] last  The sentinel end of the weights.
  ///
  /// @returns The index of the sampled weight in [0, last - first).
  ///
  /// @pre The weights are non-negative with a positive sum.
  template <class Iterator>
  int DiscreteGenerator(Iterator first, Iterator last) noexcept {
    assert(first != last);
    return std::discrete_distribution<int>(first, last)(rng_);
  }

 private:
  std::mt19937 rng_;  ///< The random number generator.
};

namespace detail {  // Weight extraction from weighted objects.

/// Plain numeric weights.
inline double weight_of(double weight) noexcept { return weight; }

/// Structured weights carrying the value under "weight" key.
template <class T>
auto weight_of(const T& weight) -> decltype(double(weight.at("weight"))) {
  return weight.at("weight");
}

}  // namespace detail

/// Takes random samples of a sequence of weighted objects.
///
/// @tparam T  The object type with ``weight()`` member function
///            returning a number or a map-like value with "weight" entry.
///
/// @param[in] weighted_objects  The non-empty sequence of objects.
///                              The weights must sum up to 1.
/// @param[in] num_samples  The number of samples (with replacement).
/// @param[in] seed  The random seed.
///
/// @returns The pointers to the sampled objects in the sampled order.
///          The same seed and objects always produce the same result.
template <class T>
std::vector<const T*> Sample(const std::vector<T>& weighted_objects,
                             int num_samples, std::uint32_t seed) {
  assert(!weighted_objects.empty() && num_samples >= 0);
  std::vector<double> weights;
  weights.reserve(weighted_objects.size());
  for (const T& object : weighted_objects)
    weights.push_back(detail::weight_of(object.weight()));

  Random rng(seed);
  std::vector<const T*> samples;
  samples.reserve(num_samples);
  for (int i = 0; i < num_samples; ++i)
    samples.push_back(
        &weighted_objects[rng.DiscreteGenerator(weights.begin(),
                                                weights.end())]);
  return samples;
}

}  // namespace tremor
