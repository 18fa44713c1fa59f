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

#ifndef ABC_DECIMALPLACES_HPP
#define ABC_DECIMALPLACES_HPP

#include "decimal.hpp"

#include "database/amount.hpp"

namespace abc
{

/**
 * The decimal precisions of the supply and reserve tokens.  This reconciles
 * the two raw integer representations into the canonical fixed-point domain
 * (Decimal::PLACES places) that the curves operate in, and back.
 *
 * Instances are immutable once constructed.
 */
class DecimalPlaces
{

private:

  /** Decimal places of the supply token.  */
  unsigned supply;

  /** Decimal places of the reserve token.  */
  unsigned reserve;

  /**
   * Converts a raw amount with the given decimals into the fixed-point
   * domain.  This is exact.
   */
  static BigInt ToFixed (const Amount& raw, unsigned decimals);

  /**
   * Converts a fixed-point value back to raw units with the given decimals,
   * rounding down.  Fails with an overflow error if the result does not
   * fit into an Amount.
   */
  static Amount FromFixed (const BigInt& fixed, unsigned decimals);

public:

  /**
   * Maximum number of decimals supported for either token.  This must not
   * exceed Decimal::PLACES, so that the conversion into the fixed-point
   * domain is exact.
   */
  static constexpr unsigned MAX_DECIMALS = 18;

  /** Constructs an instance with zero decimals for both.  */
  DecimalPlaces ()
    : supply(0), reserve(0)
  {}

  /**
   * Constructs an instance for the given decimals.  Fails with a config
   * error if any of them is larger than MAX_DECIMALS.
   */
  explicit DecimalPlaces (unsigned s, unsigned r);

  DecimalPlaces (const DecimalPlaces&) = default;
  DecimalPlaces& operator= (const DecimalPlaces&) = default;

  unsigned
  GetSupply () const
  {
    return supply;
  }

  unsigned
  GetReserve () const
  {
    return reserve;
  }

  /** Returns 10^supply, i.e. one whole supply token in raw units.  */
  BigInt SupplyUnit () const;

  /** Returns 10^reserve, i.e. one whole reserve token in raw units.  */
  BigInt ReserveUnit () const;

  BigInt
  FromSupply (const Amount& raw) const
  {
    return ToFixed (raw, supply);
  }

  BigInt
  FromReserve (const Amount& raw) const
  {
    return ToFixed (raw, reserve);
  }

  Amount
  ToSupply (const BigInt& fixed) const
  {
    return FromFixed (fixed, supply);
  }

  Amount
  ToReserve (const BigInt& fixed) const
  {
    return FromFixed (fixed, reserve);
  }

  friend bool
  operator== (const DecimalPlaces& a, const DecimalPlaces& b)
  {
    return a.supply == b.supply && a.reserve == b.reserve;
  }

};

} // namespace abc

#endif // ABC_DECIMALPLACES_HPP
