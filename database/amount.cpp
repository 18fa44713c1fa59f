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

#include <glog/logging.h>

#include <limits>

namespace abc
{

namespace
{

/**
 * Maximum number of digits we accept when parsing an amount.  2^128 has
 * 39 decimal digits; anything longer is out of range for sure and we
 * do not even need to look at it.
 */
constexpr size_t MAX_AMOUNT_DIGITS = 39;

} // anonymous namespace

const Amount MAX_AMOUNT = std::numeric_limits<Amount>::max ();

bool
CheckedAdd (const Amount& a, const Amount& b, Amount& res)
{
  if (a > MAX_AMOUNT - b)
    {
      VLOG (1) << "Overflow in " << a << " + " << b;
      return false;
    }

  res = a + b;
  return true;
}

bool
CheckedSub (const Amount& a, const Amount& b, Amount& res)
{
  if (b > a)
    {
      VLOG (1) << "Underflow in " << a << " - " << b;
      return false;
    }

  res = a - b;
  return true;
}

bool
BigToAmount (const BigInt& val, Amount& res)
{
  if (val < 0 || val > BigInt (MAX_AMOUNT))
    {
      VLOG (1) << "Value out of amount range: " << val;
      return false;
    }

  res = Amount (val);
  return true;
}

BigInt
Pow10 (const unsigned exp)
{
  return boost::multiprecision::pow (BigInt (10), exp);
}

std::string
AmountToString (const Amount& a)
{
  return a.str ();
}

bool
AmountFromString (const std::string& str, Amount& a)
{
  if (str.empty () || str.size () > MAX_AMOUNT_DIGITS)
    return false;

  /* We parse the digits manually rather than using the string constructor
     of BigInt, as the latter treats leading zeros as octal prefix.  */
  BigInt val = 0;
  for (const char c : str)
    {
      if (c < '0' || c > '9')
        return false;
      val *= 10;
      val += static_cast<int> (c - '0');
    }

  return BigToAmount (val, a);
}

} // namespace abc
