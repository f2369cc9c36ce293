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

#include "settings.h"

#include <catch2/catch.hpp>

#include "error.h"

namespace tremor::core::test {

TEST_CASE("SettingsTest.Defaults", "[settings]") {
  Settings s;
  CHECK(s.num_samples() == 0);
  CHECK(s.seed() == 42);
  CHECK(s.limit_paths() == 0);
}

TEST_CASE("SettingsTest.IncorrectSetup", "[settings]") {
  Settings s;
  CHECK_THROWS_AS(s.num_samples(-1), SettingsError);
  CHECK_THROWS_AS(s.seed(-1), SettingsError);
  CHECK_THROWS_AS(s.limit_paths(-10), SettingsError);
  // The failed calls leave the values intact.
  CHECK(s.num_samples() == 0);
  CHECK(s.seed() == 42);
  CHECK(s.limit_paths() == 0);
}

TEST_CASE("SettingsTest.CorrectSetup", "[settings]") {
  Settings s;
  CHECK_NOTHROW(s.num_samples(0));
  CHECK_NOTHROW(s.num_samples(1000));
  CHECK_NOTHROW(s.seed(0));
  CHECK_NOTHROW(s.seed(123));
  CHECK_NOTHROW(s.limit_paths(0));
  CHECK_NOTHROW(s.limit_paths(10));

  s.num_samples(7).seed(11).limit_paths(3);
  CHECK(s.num_samples() == 7);
  CHECK(s.seed() == 11);
  CHECK(s.limit_paths() == 3);
}

}  // namespace tremor::core::test
