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

#include <glog/logging.h>

#include <sstream>

namespace abc
{

constexpr unsigned DecimalPlaces::MAX_DECIMALS;

static_assert (DecimalPlaces::MAX_DECIMALS <= Decimal::PLACES,
               "token decimals must fit into the fixed-point domain");

DecimalPlaces::DecimalPlaces (const unsigned s, const unsigned r)
  : supply(s), reserve(r)
{
  if (supply > MAX_DECIMALS || reserve > MAX_DECIMALS)
    {
      std::ostringstream msg;
      msg << "Token decimals (supply " << supply << ", reserve " << reserve
          << ") must not exceed " << MAX_DECIMALS;
      ReturnError (ErrorCode::CONFIG, msg.str ());
    }
}

BigInt
DecimalPlaces::SupplyUnit () const
{
  return Pow10 (supply);
}

BigInt
DecimalPlaces::ReserveUnit () const
{
  return Pow10 (reserve);
}

BigInt
DecimalPlaces::ToFixed (const Amount& raw, const unsigned decimals)
{
  CHECK_LE (decimals, Decimal::PLACES);
  return BigInt (raw) * Pow10 (Decimal::PLACES - decimals);
}

Amount
DecimalPlaces::FromFixed (const BigInt& fixed, const unsigned decimals)
{
  CHECK_LE (decimals, Decimal::PLACES);
  CHECK (fixed >= 0);

  const BigInt raw = fixed / Pow10 (Decimal::PLACES - decimals);

  Amount res;
  if (!BigToAmount (raw, res))
    {
      std::ostringstream msg;
      msg << "Value " << raw << " exceeds the representable amount range";
      ReturnError (ErrorCode::ARITHMETIC_OVERFLOW, msg.str ());
    }

  return res;
}

} // namespace abc
