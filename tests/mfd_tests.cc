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

#include "mfd.h"

#include <memory>
#include <vector>

#include <boost/exception/get_error_info.hpp>

#include <catch2/catch.hpp>

#include "error.h"

namespace tremor::model::test {

TEST_CASE("MfdTest.TruncatedGRValidity", "[mfd]") {
  CHECK_NOTHROW(TruncatedGRMfd(5.0, 6.5, 0.1, -3.5, 1.0));
  CHECK_THROWS_AS(TruncatedGRMfd(5.0, 6.5, 0, -3.5, 1.0), DomainError);
  CHECK_THROWS_AS(TruncatedGRMfd(6.5, 6.5, 0.1, -3.5, 1.0), DomainError);
  CHECK_THROWS_AS(TruncatedGRMfd(7.0, 6.5, 0.1, -3.5, 1.0), DomainError);
  CHECK_THROWS_AS(TruncatedGRMfd(-1.0, 6.5, 0.1, -3.5, 1.0), DomainError);
  CHECK_THROWS_AS(TruncatedGRMfd(5.0, 6.5, 0.1, -3.5, 0), DomainError);
}

TEST_CASE("MfdTest.TruncatedGRModifications", "[mfd]") {
  TruncatedGRMfd mfd(5.0, 6.5, 0.1, -3.5, 1.0);

  mfd.Modify(SetAB{-3.0, 0.9});
  CHECK(mfd.a_val() == -3.0);
  CHECK(mfd.b_val() == 0.9);

  mfd.Modify(IncrementB{0.2});
  CHECK(mfd.b_val() == Approx(1.1));

  mfd.Modify(IncrementMaxMag{0.5});
  CHECK(mfd.max_mag() == Approx(7.0));

  mfd.Modify(SetMaxMag{6.0});
  CHECK(mfd.max_mag() == 6.0);

  SECTION("Invalid results leave the distribution intact") {
    CHECK_THROWS_AS(mfd.Modify(IncrementB{-5}), DomainError);
    CHECK(mfd.b_val() == Approx(1.1));
    CHECK_THROWS_AS(mfd.Modify(SetMaxMag{4.0}), DomainError);
    CHECK_THROWS_AS(mfd.Modify(IncrementMaxMag{-1.0}), DomainError);
    CHECK(mfd.max_mag() == 6.0);
    CHECK_THROWS_AS(mfd.Modify(SetAB{-3.0, -1.0}), DomainError);
    CHECK(mfd.a_val() == -3.0);
  }

  SECTION("Unsupported modification") {
    try {
      mfd.Modify(SetMfd{5.0, 0.1, {0.1}});
      FAIL("The modification must be rejected");
    } catch (const IllegalOperation& err) {
      const char* const* operation =
          boost::get_error_info<errinfo_operation>(err);
      REQUIRE(operation);
      CHECK(std::string(*operation) == "set_mfd");
    }
  }
}

TEST_CASE("MfdTest.EvenlyDiscretized", "[mfd]") {
  CHECK_THROWS_AS(EvenlyDiscretizedMfd(5.0, 0.1, {}), DomainError);
  CHECK_THROWS_AS(EvenlyDiscretizedMfd(5.0, -0.1, {0.1}), DomainError);
  CHECK_THROWS_AS(EvenlyDiscretizedMfd(5.0, 0.1, {0.1, -0.1}), DomainError);

  EvenlyDiscretizedMfd mfd(5.0, 0.1, {0.1, 0.01});
  mfd.Modify(SetMfd{6.0, 0.2, {0.3, 0.2, 0.1}});
  CHECK(mfd.min_mag() == 6.0);
  CHECK(mfd.bin_width() == 0.2);
  CHECK(mfd.occurrence_rates() == std::vector<double>{0.3, 0.2, 0.1});

  CHECK_THROWS_AS(mfd.Modify(SetMfd{6.0, 0.2, {}}), DomainError);
  CHECK(mfd.occurrence_rates().size() == 3);
  for (const MfdModification& op :
       {MfdModification(SetAB{1, 1}), MfdModification(IncrementB{0.1}),
        MfdModification(IncrementMaxMag{0.1}),
        MfdModification(SetMaxMag{7})}) {
    CHECK_THROWS_AS(mfd.Modify(op), IllegalOperation);
  }
}

TEST_CASE("MfdTest.Clone", "[mfd]") {
  TruncatedGRMfd mfd(5.0, 6.5, 0.1, -3.5, 1.0);
  std::unique_ptr<Mfd> copy = mfd.Clone();
  copy->Modify(SetMaxMag{7.5});
  CHECK(mfd.max_mag() == 6.5);
  CHECK(static_cast<TruncatedGRMfd&>(*copy).max_mag() == 7.5);
  CHECK(std::string(copy->kind()) == "truncGutenbergRichterMFD");
}

}  // namespace tremor::model::test
