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

#include "decimal.hpp"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <sstream>

namespace abc
{
namespace
{

/**
 * Constructs a decimal value given in hundredths, e.g. 35 for 0.35.
 */
Decimal
Hundredths (const unsigned n)
{
  return Decimal::FromAtomics (Amount (Decimal::One () / 100) * n);
}

TEST (DecimalTests, ZeroAndOne)
{
  EXPECT_TRUE (Decimal ().IsZero ());
  EXPECT_EQ (Decimal ().ToString (), "0");
  EXPECT_EQ (Hundredths (100).GetAtomics (), Amount (Decimal::One ()));
  EXPECT_FALSE (Hundredths (100).IsZero ());
}

TEST (DecimalTests, ToString)
{
  EXPECT_EQ (Decimal::FromAtomics (1).ToString (), "0.000000000000000001");
  EXPECT_EQ (Decimal::FromAtomics (Amount (Decimal::One ()) * 2).ToString (),
             "2");
  EXPECT_EQ (Decimal::FromAtomics (Amount (Decimal::One ()) / 10).ToString (),
             "0.1");
  EXPECT_EQ (Decimal::FromAtomics (Amount (Decimal::One ()) * 3 / 2)
                .ToString (),
             "1.5");
}

TEST (DecimalTests, TrailingZerosAreStripped)
{
  EXPECT_EQ (Hundredths (35).ToString (), "0.35");
  EXPECT_EQ (Hundredths (1'205).ToString (), "12.05");
  EXPECT_EQ (Hundredths (700).ToString (), "7");
  EXPECT_EQ (Hundredths (10).ToString (), "0.1");
}

TEST (DecimalTests, Range)
{
  Decimal d;
  ASSERT_TRUE (Decimal::FromBigAtomics (BigInt (MAX_AMOUNT), d));
  EXPECT_EQ (d.GetAtomics (), MAX_AMOUNT);
  EXPECT_FALSE (Decimal::FromBigAtomics (BigInt (MAX_AMOUNT) + 1, d));
  EXPECT_FALSE (Decimal::FromBigAtomics (-1, d));
}

TEST (DecimalTests, Comparison)
{
  EXPECT_TRUE (Hundredths (10) < Hundredths (20));
  EXPECT_TRUE (Hundredths (20) <= Hundredths (20));
  EXPECT_FALSE (Hundredths (100) < Hundredths (99));
  EXPECT_EQ (Hundredths (100), Decimal::FromAtomics (Amount (Decimal::One ())));
  EXPECT_NE (Hundredths (100), Hundredths (101));
}

TEST (DecimalTests, Streaming)
{
  std::ostringstream out;
  out << Hundredths (250);
  EXPECT_EQ (out.str (), "2.5");
}

} // anonymous namespace
} // namespace abc
