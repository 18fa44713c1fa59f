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

#include "intents.hpp"

#include "jsonutils.hpp"

#include <glog/logging.h>

namespace abc
{

Intent
Intent::CreateDenom (const std::string& subdenom, const TokenMetadata& meta)
{
  Intent res(Type::CREATE_DENOM);
  res.denom = subdenom;
  res.metadata = meta;
  return res;
}

Intent
Intent::Mint (const std::string& denom, const Amount& amount,
              const std::string& to)
{
  Intent res(Type::MINT);
  res.denom = denom;
  res.amount = amount;
  res.address = to;
  return res;
}

Intent
Intent::Burn (const std::string& denom, const Amount& amount,
              const std::string& from)
{
  Intent res(Type::BURN);
  res.denom = denom;
  res.amount = amount;
  res.address = from;
  return res;
}

Intent
Intent::Transfer (const std::string& denom, const Amount& amount,
                  const std::string& to)
{
  Intent res(Type::TRANSFER);
  res.denom = denom;
  res.amount = amount;
  res.address = to;
  return res;
}

Json::Value
Intent::ToJson () const
{
  if (type == Type::CREATE_DENOM)
    {
      Json::Value meta(Json::objectValue);
      meta["name"] = metadata.name;
      meta["symbol"] = metadata.symbol;
      meta["description"] = metadata.description;
      meta["display"] = metadata.display;

      Json::Value res(Json::objectValue);
      res["type"] = "create_denom";
      res["subdenom"] = denom;
      res["metadata"] = meta;
      return res;
    }

  /* All other intents move a coin to or from an address.  */
  Json::Value res = CoinToJson (Coin (denom, amount));
  switch (type)
    {
    case Type::MINT:
      res["type"] = "mint";
      res["to"] = address;
      return res;

    case Type::BURN:
      res["type"] = "burn";
      res["from"] = address;
      return res;

    case Type::TRANSFER:
      res["type"] = "transfer";
      res["to"] = address;
      return res;

    case Type::CREATE_DENOM:
      break;
    }

  LOG (FATAL) << "Invalid intent type: " << static_cast<int> (type);
}

Response&
Response::AddAttribute (const std::string& key, const std::string& value)
{
  attributes.emplace_back (key, value);
  return *this;
}

Response&
Response::AddAmountAttribute (const std::string& key, const Amount& value)
{
  return AddAttribute (key, AmountToString (value));
}

std::string
Response::GetAttribute (const std::string& key) const
{
  for (const auto& entry : attributes)
    if (entry.first == key)
      return entry.second;

  return "";
}

Json::Value
Response::ToJson () const
{
  Json::Value msgs(Json::arrayValue);
  for (const auto& m : messages)
    msgs.append (m.ToJson ());

  Json::Value attr(Json::objectValue);
  for (const auto& entry : attributes)
    attr[entry.first] = entry.second;

  Json::Value res(Json::objectValue);
  res["messages"] = msgs;
  res["attributes"] = attr;

  return res;
}

} // namespace abc
