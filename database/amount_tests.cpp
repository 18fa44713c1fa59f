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

#include "amount.hpp"

#include <gtest/gtest.h>

namespace abc
{
namespace
{

TEST (AmountTests, CheckedAdd)
{
  Amount res = 42;
  ASSERT_TRUE (CheckedAdd (10, 20, res));
  EXPECT_EQ (res, 30);

  ASSERT_TRUE (CheckedAdd (MAX_AMOUNT - 5, 5, res));
  EXPECT_EQ (res, MAX_AMOUNT);

  res = 42;
  EXPECT_FALSE (CheckedAdd (MAX_AMOUNT - 5, 6, res));
  EXPECT_FALSE (CheckedAdd (MAX_AMOUNT, MAX_AMOUNT, res));
  EXPECT_EQ (res, 42);
}

TEST (AmountTests, CheckedSub)
{
  Amount res = 42;
  ASSERT_TRUE (CheckedSub (20, 20, res));
  EXPECT_EQ (res, 0);
  ASSERT_TRUE (CheckedSub (MAX_AMOUNT, 1, res));
  EXPECT_EQ (res + 1, MAX_AMOUNT);

  res = 42;
  EXPECT_FALSE (CheckedSub (19, 20, res));
  EXPECT_FALSE (CheckedSub (0, MAX_AMOUNT, res));
  EXPECT_EQ (res, 42);
}

TEST (AmountTests, BigToAmount)
{
  Amount res = 42;
  ASSERT_TRUE (BigToAmount (BigInt (MAX_AMOUNT), res));
  EXPECT_EQ (res, MAX_AMOUNT);
  ASSERT_TRUE (BigToAmount (0, res));
  EXPECT_EQ (res, 0);

  res = 42;
  EXPECT_FALSE (BigToAmount (BigInt (MAX_AMOUNT) + 1, res));
  EXPECT_FALSE (BigToAmount (-1, res));
  EXPECT_EQ (res, 42);
}

TEST (AmountTests, Pow10)
{
  EXPECT_EQ (Pow10 (0), 1);
  EXPECT_EQ (Pow10 (3), 1'000);
  EXPECT_EQ (Pow10 (18), BigInt ("1000000000000000000"));
}

TEST (AmountTests, StringRoundTrip)
{
  EXPECT_EQ (AmountToString (0), "0");
  EXPECT_EQ (AmountToString (1'234'567), "1234567");
  EXPECT_EQ (AmountToString (MAX_AMOUNT),
             "340282366920938463463374607431768211455");

  Amount a;
  ASSERT_TRUE (AmountFromString ("340282366920938463463374607431768211455",
                                 a));
  EXPECT_EQ (a, MAX_AMOUNT);
}

TEST (AmountTests, FromStringLeadingZeros)
{
  Amount a;
  ASSERT_TRUE (AmountFromString ("010", a));
  EXPECT_EQ (a, 10);
  ASSERT_TRUE (AmountFromString ("0", a));
  EXPECT_EQ (a, 0);
}

TEST (AmountTests, FromStringInvalid)
{
  Amount a;
  for (const std::string str : {"", "-1", "+1", " 1", "1 ", "0x10", "1.5",
                                "1e5", "abc",
                                "340282366920938463463374607431768211456",
                                "1000000000000000000000000000000000000000"})
    EXPECT_FALSE (AmountFromString (str, a)) << str;
}

} // anonymous namespace
} // namespace abc
