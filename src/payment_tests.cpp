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

#include "payment.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace abc
{
namespace
{

TEST (MustPayTests, Valid)
{
  EXPECT_EQ (MustPay ({Coin ("satoshi", 42)}, "satoshi"), 42);
  EXPECT_EQ (MustPay ({Coin ("satoshi", MAX_AMOUNT)}, "satoshi"), MAX_AMOUNT);
}

TEST (MustPayTests, NoFunds)
{
  auto msg = ExpectSaleError (ErrorCode::PAYMENT, [] ()
    {
      MustPay ({}, "satoshi");
    });
  EXPECT_EQ (msg, "no funds sent");

  msg = ExpectSaleError (ErrorCode::PAYMENT, [] ()
    {
      MustPay ({Coin ("satoshi", 0)}, "satoshi");
    });
  EXPECT_EQ (msg, "no funds sent");
}

TEST (MustPayTests, MultipleDenoms)
{
  const auto msg = ExpectSaleError (ErrorCode::PAYMENT, [] ()
    {
      MustPay ({Coin ("satoshi", 1), Coin ("satoshi", 2)}, "satoshi");
    });
  EXPECT_EQ (msg, "sent more than one denomination");
}

TEST (MustPayTests, WrongDenom)
{
  const auto msg = ExpectSaleError (ErrorCode::PAYMENT, [] ()
    {
      MustPay ({Coin ("wei", 10)}, "satoshi");
    });
  EXPECT_EQ (msg, "must send denomination 'satoshi', got 'wei'");
}

TEST (NonpayableTests, Works)
{
  Nonpayable ({});
  ExpectSaleError (ErrorCode::PAYMENT, [] ()
    {
      Nonpayable ({Coin ("satoshi", 1)});
    });
}

} // anonymous namespace
} // namespace abc
