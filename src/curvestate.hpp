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

#ifndef ABC_CURVESTATE_HPP
#define ABC_CURVESTATE_HPP

#include "decimalplaces.hpp"

#include "database/amount.hpp"

#include <string>

namespace abc
{

/**
 * The ledger of the sale:  How much reserve is held and how much supply
 * has been issued against it.
 */
struct CurveState
{

  /** Total reserve held (raw units of the reserve token).  */
  Amount reserve = 0;

  /** Total supply issued (raw units of the supply token).  */
  Amount supply = 0;

  /** Denomination of the reserve token.  */
  std::string reserveDenom;

  /** Decimal places of the two tokens.  */
  DecimalPlaces decimals;

  CurveState () = default;

  /**
   * Constructs the initial state (with zero reserve and supply).
   */
  explicit CurveState (const std::string& denom, const DecimalPlaces& d)
    : reserveDenom(denom), decimals(d)
  {}

  friend bool
  operator== (const CurveState& a, const CurveState& b)
  {
    return a.reserve == b.reserve && a.supply == b.supply
            && a.reserveDenom == b.reserveDenom && a.decimals == b.decimals;
  }

};

} // namespace abc

#endif // ABC_CURVESTATE_HPP
