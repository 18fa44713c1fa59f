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

#ifndef ABC_INTENTS_HPP
#define ABC_INTENTS_HPP

#include "database/amount.hpp"

#include <json/json.h>

#include <string>
#include <utility>
#include <vector>

namespace abc
{

/**
 * Display metadata of the supply token, as registered with the token
 * system when the denomination is created.
 */
struct TokenMetadata
{
  std::string name;
  std::string symbol;
  std::string description;
  std::string display;
};

/**
 * A side effect that the host environment should carry out as result
 * of a successful operation.  The engine never performs any of them
 * itself, it just returns the list.
 */
class Intent
{

public:

  /** The kinds of side effects.  */
  enum class Type
  {
    CREATE_DENOM,
    MINT,
    BURN,
    TRANSFER,
  };

private:

  Type type;

  /**
   * The denomination this is about.  For CREATE_DENOM, this is the subdenom
   * to register.
   */
  std::string denom;

  /** The amount minted, burnt or transferred.  */
  Amount amount;

  /**
   * The address involved.  This is the recipient for MINT and TRANSFER
   * and the owner of the burnt coins for BURN.
   */
  std::string address;

  /** Metadata for CREATE_DENOM.  */
  TokenMetadata metadata;

  explicit Intent (const Type t)
    : type(t), amount(0)
  {}

public:

  static Intent CreateDenom (const std::string& subdenom,
                             const TokenMetadata& meta);
  static Intent Mint (const std::string& denom, const Amount& amount,
                      const std::string& to);
  static Intent Burn (const std::string& denom, const Amount& amount,
                      const std::string& from);
  static Intent Transfer (const std::string& denom, const Amount& amount,
                          const std::string& to);

  Type
  GetType () const
  {
    return type;
  }

  const std::string&
  GetDenom () const
  {
    return denom;
  }

  const Amount&
  GetAmount () const
  {
    return amount;
  }

  const std::string&
  GetAddress () const
  {
    return address;
  }

  const TokenMetadata&
  GetMetadata () const
  {
    return metadata;
  }

  /**
   * Returns the JSON representation of this intent, as it is sent
   * back to the host.
   */
  Json::Value ToJson () const;

};

/**
 * The result of a successful execution:  An ordered list of intents
 * and a list of key/value attributes describing what happened.
 */
class Response
{

private:

  std::vector<Intent> messages;
  std::vector<std::pair<std::string, std::string>> attributes;

public:

  Response () = default;

  Response&
  AddMessage (const Intent& msg)
  {
    messages.push_back (msg);
    return *this;
  }

  Response& AddAttribute (const std::string& key, const std::string& value);

  /**
   * Adds an attribute whose value is an amount, formatted as decimal
   * string.
   */
  Response& AddAmountAttribute (const std::string& key, const Amount& value);

  const std::vector<Intent>&
  GetMessages () const
  {
    return messages;
  }

  const std::vector<std::pair<std::string, std::string>>&
  GetAttributes () const
  {
    return attributes;
  }

  /**
   * Looks up the value of an attribute.  Returns the empty string if
   * there is no such attribute.
   */
  std::string GetAttribute (const std::string& key) const;

  /**
   * Returns the JSON form:  {"messages": [...], "attributes": {...}}
   */
  Json::Value ToJson () const;

};

} // namespace abc

#endif // ABC_INTENTS_HPP
