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

#ifndef ABC_ENGINE_HPP
#define ABC_ENGINE_HPP

#include "curves.hpp"
#include "curvestate.hpp"
#include "decimal.hpp"
#include "intents.hpp"
#include "payment.hpp"
#include "phase.hpp"

#include "database/amount.hpp"

#include <json/json.h>

#include <string>

namespace abc
{

/**
 * Result of the curve-info query.
 */
struct CurveInfo
{

  Amount reserve;
  Amount supply;
  Decimal spotPrice;
  std::string reserveDenom;

  Json::Value ToJson () const;

};

/**
 * Processes a buy:  The buyer pays reserve tokens (which must be attached
 * as funds), and receives newly minted supply tokens according to the curve.
 * In the hatch phase, the buyer must be allowlisted, and the sale may
 * transition to the open phase as a result of this buy.
 *
 * state and phase are only updated if the operation succeeds.  On any
 * error, a SaleError is thrown and they are left as they were.
 */
Response ExecuteBuy (const Curve& curve, const PhaseConfig& config,
                     const std::string& supplyDenom,
                     const std::string& buyer, const Funds& funds,
                     CurveState& state, CommonsPhase& phase);

/**
 * Processes a sell:  The seller sends amount supply tokens (attached
 * as funds), which get burnt, and receives the reserve released from
 * the curve in return.
 *
 * state is only updated if the operation succeeds.
 */
Response ExecuteSell (const Curve& curve, const std::string& supplyDenom,
                      const std::string& seller, const Amount& amount,
                      const Funds& funds, CurveState& state);

/**
 * Returns the current reserve, supply and spot price.
 */
CurveInfo QueryCurveInfo (const Curve& curve, const CurveState& state);

} // namespace abc

#endif // ABC_ENGINE_HPP
