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

#ifndef ABC_PAYMENT_HPP
#define ABC_PAYMENT_HPP

#include "database/amount.hpp"

#include <string>
#include <vector>

namespace abc
{

/**
 * An amount of tokens of a particular denomination.
 */
struct Coin
{

  std::string denom;
  Amount amount;

  Coin () = default;

  explicit Coin (const std::string& d, const Amount& a)
    : denom(d), amount(a)
  {}

  friend bool
  operator== (const Coin& a, const Coin& b)
  {
    return a.denom == b.denom && a.amount == b.amount;
  }

};

/** The funds attached to a request.  */
using Funds = std::vector<Coin>;

/**
 * Validates that exactly one coin with a non-zero amount of the given denom
 * has been sent, and returns its amount.  Fails with a payment error
 * otherwise.
 */
Amount MustPay (const Funds& funds, const std::string& denom);

/**
 * Validates that no funds have been sent at all.
 */
void Nonpayable (const Funds& funds);

} // namespace abc

#endif // ABC_PAYMENT_HPP
