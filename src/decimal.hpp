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

#ifndef ABC_DECIMAL_HPP
#define ABC_DECIMAL_HPP

#include "database/amount.hpp"

#include <ostream>
#include <string>

namespace abc
{

/**
 * Unsigned fixed-point number with 18 decimal places.  The value is stored
 * as "atomics", i.e. the number multiplied by 10^18, in an Amount.  This is
 * used for spot prices and as the canonical domain for normalised token
 * amounts.
 */
class Decimal
{

private:

  /** The value times 10^PLACES.  */
  Amount atomics;

  explicit Decimal (const Amount& a)
    : atomics(a)
  {}

public:

  /** Number of decimal places.  */
  static constexpr unsigned PLACES = 18;

  /** Constructs a zero value.  */
  Decimal ()
    : atomics(0)
  {}

  Decimal (const Decimal&) = default;
  Decimal& operator= (const Decimal&) = default;

  /**
   * Constructs a value directly from the atomics.
   */
  static Decimal
  FromAtomics (const Amount& a)
  {
    return Decimal (a);
  }

  /**
   * Constructs a value from atomics given as BigInt.  Returns false if
   * that is out of range.
   */
  static bool FromBigAtomics (const BigInt& a, Decimal& res);

  /** Returns 10^PLACES, i.e. the atomics value of one.  */
  static BigInt One ();

  const Amount&
  GetAtomics () const
  {
    return atomics;
  }

  bool
  IsZero () const
  {
    return atomics == 0;
  }

  /**
   * Formats the value as decimal string, without trailing zeros after
   * the decimal point (and without the point for integers).
   */
  std::string ToString () const;

  friend bool
  operator== (const Decimal& a, const Decimal& b)
  {
    return a.atomics == b.atomics;
  }

  friend bool
  operator!= (const Decimal& a, const Decimal& b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const Decimal& a, const Decimal& b)
  {
    return a.atomics < b.atomics;
  }

  friend bool
  operator<= (const Decimal& a, const Decimal& b)
  {
    return a.atomics <= b.atomics;
  }

};

std::ostream& operator<< (std::ostream& out, const Decimal& d);

} // namespace abc

#endif // ABC_DECIMAL_HPP
