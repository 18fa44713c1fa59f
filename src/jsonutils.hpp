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

#ifndef ABC_JSONUTILS_HPP
#define ABC_JSONUTILS_HPP

#include "decimal.hpp"
#include "payment.hpp"

#include "database/amount.hpp"

#include <json/json.h>

#include <string>

namespace abc
{

/**
 * Encodes an amount as JSON.  Since amounts are 128-bit integers and do not
 * fit into JSON numbers, this is a string with the decimal value.
 */
Json::Value AmountToJson (const Amount& a);

/**
 * Parses an amount from JSON, which must be a string in the format
 * returned by AmountToJson.  Returns false if the value is invalid.
 */
bool AmountFromJson (const Json::Value& val, Amount& a);

/**
 * Encodes a decimal value (e.g. a price) as JSON string.
 */
Json::Value DecimalToJson (const Decimal& d);

/**
 * Encodes a coin into JSON:  {"denom": denom, "amount": amount}
 */
Json::Value CoinToJson (const Coin& c);

/**
 * Parses a coin from JSON.  Returns false if the format is not right,
 * e.g. there are missing or extra members.
 */
bool CoinFromJson (const Json::Value& val, Coin& c);

/**
 * Parses a list of coins (the funds sent with a request) from a JSON
 * array.  A null value is accepted as no funds.
 */
bool FundsFromJson (const Json::Value& val, Funds& funds);

} // namespace abc

#endif // ABC_JSONUTILS_HPP
