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

#ifndef ABC_REQUESTS_HPP
#define ABC_REQUESTS_HPP

#include "contract.hpp"
#include "errors.hpp"

#include <json/json.h>

#include <string>

namespace abc
{

/**
 * Handles request envelopes in JSON form and dispatches them to the
 * contract.  A request looks like this:
 *
 *  {
 *    "sender": "<address>",
 *    "funds": [{"denom": "satoshi", "amount": "100"}],
 *    "execute": {"buy": {}}
 *  }
 *
 * Instead of "execute", a request may contain "instantiate" (with the JSON
 * form of proto::InstantiateMsg) or "query".  Exactly one of them must
 * be present.
 *
 * The result is either the response of the contract, the query result,
 * or an object {"error": {...}} describing why the request failed.
 */
class RequestProcessor
{

private:

  /** The contract to dispatch to.  */
  Contract& contract;

  Json::Value ProcessInstantiate (const std::string& sender,
                                  const Funds& funds,
                                  const Json::Value& msg);
  Json::Value ProcessExecute (const std::string& sender,
                              const Funds& funds,
                              const Json::Value& msg);
  Json::Value ProcessQuery (const Json::Value& msg);

  /**
   * Processes a request and returns the result.  Errors are thrown as
   * SaleError and converted by the caller.
   */
  Json::Value ProcessUnchecked (const Json::Value& request);

public:

  explicit RequestProcessor (Contract& c)
    : contract(c)
  {}

  RequestProcessor () = delete;
  RequestProcessor (const RequestProcessor&) = delete;
  void operator= (const RequestProcessor&) = delete;

  /**
   * Processes a request and returns the JSON result (which may be an
   * error object).
   */
  Json::Value Process (const Json::Value& request);

  /**
   * Parses a request from a line of text and returns the result serialised
   * to a single line.
   */
  std::string ProcessLine (const std::string& line);

};

/**
 * Returns the JSON object describing an error, as used in responses.
 */
Json::Value ErrorToJson (const SaleError& err);

} // namespace abc

#endif // ABC_REQUESTS_HPP
