/*
    ABC - augmented bonding curve sale engine
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "decimalplaces.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

namespace abc
{
namespace
{

TEST (DecimalPlacesTests, Units)
{
  const DecimalPlaces places(2, 8);
  EXPECT_EQ (places.GetSupply (), 2);
  EXPECT_EQ (places.GetReserve (), 8);
  EXPECT_EQ (places.SupplyUnit (), 100);
  EXPECT_EQ (places.ReserveUnit (), 100'000'000);
}

TEST (DecimalPlacesTests, ToFixedDomain)
{
  const DecimalPlaces places(2, 8);
  EXPECT_EQ (places.FromSupply (150), BigInt ("1500000000000000000"));
  EXPECT_EQ (places.FromReserve (150), BigInt ("1500000000000"));
  EXPECT_EQ (places.FromSupply (0), 0);
}

TEST (DecimalPlacesTests, FromFixedDomainRoundsDown)
{
  const DecimalPlaces places(2, 8);
  EXPECT_EQ (places.ToSupply (BigInt ("1509999999999999999")), 150);
  EXPECT_EQ (places.ToReserve (BigInt ("1500000000009")), 150);
  EXPECT_EQ (places.ToReserve (BigInt ("9999999999")), 0);
}

TEST (DecimalPlacesTests, RoundTripIsExact)
{
  const DecimalPlaces places(6, 18);
  for (const Amount a : {Amount (0), Amount (1), Amount (123'456'789),
                         MAX_AMOUNT})
    {
      EXPECT_EQ (places.ToSupply (places.FromSupply (a)), a);
      EXPECT_EQ (places.ToReserve (places.FromReserve (a)), a);
    }
}

TEST (DecimalPlacesTests, Overflow)
{
  const DecimalPlaces places(0, 0);
  const BigInt tooLarge = (BigInt (MAX_AMOUNT) + 1) * Decimal::One ();
  try
    {
      places.ToSupply (tooLarge);
      FAIL () << "Expected overflow error";
    }
  catch (const SaleError& exc)
    {
      EXPECT_EQ (exc.GetCode (), ErrorCode::ARITHMETIC_OVERFLOW);
    }
}

TEST (DecimalPlacesTests, MaximumDecimals)
{
  DecimalPlaces (18, 18);
  DecimalPlaces (0, 18);

  for (const auto& p : {std::make_pair (19u, 8u), std::make_pair (2u, 19u),
                        std::make_pair (255u, 255u)})
    try
      {
        DecimalPlaces (p.first, p.second);
        FAIL () << "Expected config error for " << p.first << ", " << p.second;
      }
    catch (const SaleError& exc)
      {
        EXPECT_EQ (exc.GetCode (), ErrorCode::CONFIG);
      }
}

TEST (DecimalPlacesTests, Equality)
{
  EXPECT_TRUE (DecimalPlaces (2, 8) == DecimalPlaces (2, 8));
  EXPECT_FALSE (DecimalPlaces (2, 8) == DecimalPlaces (8, 2));
}

} // anonymous namespace
} // namespace abc
