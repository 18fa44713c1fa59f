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

#ifndef ABC_CONTRACT_HPP
#define ABC_CONTRACT_HPP

#include "curves.hpp"
#include "curvestate.hpp"
#include "engine.hpp"
#include "intents.hpp"
#include "payment.hpp"
#include "phase.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"
#include "proto/msg.pb.h"

#include <string>

namespace abc
{

/**
 * A sale instance backed by the slot store in a database.  This is the
 * entry point for all operations:  It loads the persisted state, runs the
 * requested operation through the engine and saves the resulting state.
 *
 * Every operation runs in its own database transaction, so that a failing
 * operation does not leave any partial changes behind.
 */
class Contract
{

private:

  /** The database holding the slots.  */
  Database& db;

  /** The address of this contract, used to build the supply denom.  */
  const std::string address;

  /**
   * The full state of an instantiated sale, as loaded from the slots.
   */
  struct LoadedState
  {
    CurveType type;
    CurveState state;
    PhaseConfig config;
    CommonsPhase phase;
    std::string supplyDenom;

    LoadedState ()
      : type(CurveType::Constant (1, 0))
    {}
  };

  /**
   * Loads the state from the database, failing with a config error if
   * the contract has not been instantiated.
   */
  LoadedState Load ();

public:

  explicit Contract (Database& d, const std::string& addr)
    : db(d), address(addr)
  {}

  Contract () = delete;
  Contract (const Contract&) = delete;
  void operator= (const Contract&) = delete;

  const std::string&
  GetAddress () const
  {
    return address;
  }

  /**
   * Returns true if the contract has already been instantiated.
   */
  bool IsInstantiated ();

  /**
   * Sets up a new sale with the given parameters.  This must be called
   * exactly once, before any other operation.
   */
  Response Instantiate (const std::string& sender, const Funds& funds,
                        const proto::InstantiateMsg& msg);

  /**
   * Buys supply tokens for the reserve tokens attached as funds.
   */
  Response Buy (const std::string& sender, const Funds& funds);

  /**
   * Sells (burns) the given amount of supply tokens, which must be attached
   * as funds, for reserve tokens.
   */
  Response Burn (const std::string& sender, const Funds& funds,
                 const Amount& amount);

  CurveInfo QueryCurveInfo ();
  CommonsPhase QueryPhase ();
  PhaseConfig QueryPhaseConfig ();

  /**
   * Returns the full denomination of the supply token.
   */
  std::string QuerySupplyDenom ();

};

/**
 * Instantiates the contract from a text-format InstantiateMsg, as it is
 * given to the daemon on start-up.  The contract itself is the sender and
 * no funds are attached.  Fails with a config error if the text cannot
 * be parsed.
 */
Response InstantiateFromText (Contract& contract, const std::string& text);

} // namespace abc

#endif // ABC_CONTRACT_HPP
