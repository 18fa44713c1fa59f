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

namespace abc
{

constexpr unsigned Decimal::PLACES;

bool
Decimal::FromBigAtomics (const BigInt& a, Decimal& res)
{
  Amount val;
  if (!BigToAmount (a, val))
    return false;

  res = Decimal (val);
  return true;
}

BigInt
Decimal::One ()
{
  return Pow10 (PLACES);
}

std::string
Decimal::ToString () const
{
  const BigInt one = One ();
  const BigInt intPart = BigInt (atomics) / one;
  const BigInt fracPart = BigInt (atomics) % one;

  std::string res = intPart.str ();
  if (fracPart == 0)
    return res;

  std::string frac = fracPart.str ();
  CHECK_LE (frac.size (), PLACES);
  frac = std::string (PLACES - frac.size (), '0') + frac;
  while (frac.back () == '0')
    frac.pop_back ();

  res += '.';
  res += frac;
  return res;
}

std::ostream&
operator<< (std::ostream& out, const Decimal& d)
{
  out << d.ToString ();
  return out;
}

} // namespace abc
