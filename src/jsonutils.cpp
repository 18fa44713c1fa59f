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

#include "jsonutils.hpp"

#include <glog/logging.h>

namespace abc
{

namespace
{

constexpr const char COIN_DENOM[] = "denom";
constexpr const char COIN_AMOUNT[] = "amount";

} // anonymous namespace

Json::Value
AmountToJson (const Amount& a)
{
  return AmountToString (a);
}

bool
AmountFromJson (const Json::Value& val, Amount& a)
{
  if (!val.isString ())
    {
      VLOG (1) << "Invalid amount: JSON value " << val << " is not a string";
      return false;
    }

  if (!AmountFromString (val.asString (), a))
    {
      VLOG (1) << "Invalid amount: " << val;
      return false;
    }

  return true;
}

Json::Value
DecimalToJson (const Decimal& d)
{
  return d.ToString ();
}

Json::Value
CoinToJson (const Coin& c)
{
  Json::Value res(Json::objectValue);
  res[COIN_DENOM] = c.denom;
  res[COIN_AMOUNT] = AmountToJson (c.amount);

  return res;
}

bool
CoinFromJson (const Json::Value& val, Coin& c)
{
  if (!val.isObject ())
    {
      VLOG (1) << "Invalid coin: JSON value " << val << " is not an object";
      return false;
    }

  const Json::Value& denom = val[COIN_DENOM];
  const Json::Value& amount = val[COIN_AMOUNT];

  if (val.size () != 2 || !denom.isString () || amount.isNull ())
    {
      VLOG (1)
          << "Invalid coin: JSON value " << val
          << " must have exactly 'denom' and 'amount' members";
      return false;
    }

  Coin res;
  res.denom = denom.asString ();
  if (!AmountFromJson (amount, res.amount))
    return false;

  c = res;
  return true;
}

bool
FundsFromJson (const Json::Value& val, Funds& funds)
{
  funds.clear ();
  if (val.isNull ())
    return true;

  if (!val.isArray ())
    {
      VLOG (1) << "Invalid funds: JSON value " << val << " is not an array";
      return false;
    }

  for (const auto& entry : val)
    {
      Coin c;
      if (!CoinFromJson (entry, c))
        return false;
      funds.push_back (c);
    }

  return true;
}

} // namespace abc
