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

#include "engine.hpp"

#include "errors.hpp"
#include "jsonutils.hpp"

#include <glog/logging.h>

#include <sstream>

namespace abc
{

Json::Value
CurveInfo::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["reserve"] = AmountToJson (reserve);
  res["supply"] = AmountToJson (supply);
  res["spot_price"] = DecimalToJson (spotPrice);
  res["reserve_denom"] = reserveDenom;

  return res;
}

Response
ExecuteBuy (const Curve& curve, const PhaseConfig& config,
            const std::string& supplyDenom,
            const std::string& buyer, const Funds& funds,
            CurveState& state, CommonsPhase& phase)
{
  const Amount payment = MustPay (funds, state.reserveDenom);

  AssertBuyAllowed (phase, config, buyer);
  CommonsPhase newPhase = phase;
  RecordHatcher (newPhase, buyer);

  CurveState newState = state;
  if (!CheckedAdd (state.reserve, payment, newState.reserve))
    {
      std::ostringstream msg;
      msg << "adding payment " << payment << " to reserve " << state.reserve
          << " overflows";
      ReturnError (ErrorCode::ARITHMETIC_OVERFLOW, msg.str ());
    }

  newState.supply = curve.Supply (newState.reserve);
  Amount minted;
  if (!CheckedSub (newState.supply, state.supply, minted))
    {
      std::ostringstream msg;
      msg << "curve supply decreased from " << state.supply
          << " to " << newState.supply << " for a larger reserve";
      ReturnError (ErrorCode::ARITHMETIC_OVERFLOW, msg.str ());
    }

  newPhase = MaybeTransition (newPhase, config, newState.reserve);
  const bool opened = (newPhase.GetKind () != phase.GetKind ());

  Response res;
  res.AddMessage (Intent::Mint (supplyDenom, minted, buyer));
  res.AddAttribute ("action", "buy")
      .AddAttribute ("from", buyer)
      .AddAmountAttribute ("reserve", payment)
      .AddAmountAttribute ("supply", minted);
  if (opened)
    res.AddAttribute ("phase", PhaseKindToString (newPhase.GetKind ()));

  LOG (INFO)
      << buyer << " bought " << minted << " " << supplyDenom
      << " for " << payment << " " << state.reserveDenom;

  state = newState;
  phase = newPhase;

  return res;
}

Response
ExecuteSell (const Curve& curve, const std::string& supplyDenom,
             const std::string& seller, const Amount& amount,
             const Funds& funds, CurveState& state)
{
  const Amount payment = MustPay (funds, supplyDenom);
  if (payment != amount)
    {
      std::ostringstream msg;
      msg << "burn amount " << amount << " does not match the payment of "
          << payment;
      ReturnError (ErrorCode::PAYMENT, msg.str ());
    }

  CurveState newState = state;
  if (!CheckedSub (state.supply, amount, newState.supply))
    {
      std::ostringstream msg;
      msg << "cannot burn " << amount << ", only " << state.supply
          << " is outstanding";
      ReturnError (ErrorCode::ARITHMETIC_OVERFLOW, msg.str ());
    }

  newState.reserve = curve.Reserve (newState.supply);
  Amount released;
  if (!CheckedSub (state.reserve, newState.reserve, released))
    {
      std::ostringstream msg;
      msg << "curve reserve " << newState.reserve << " for supply "
          << newState.supply << " exceeds the held reserve " << state.reserve;
      ReturnError (ErrorCode::ARITHMETIC_OVERFLOW, msg.str ());
    }

  Response res;
  res.AddMessage (Intent::Transfer (state.reserveDenom, released, seller))
      .AddMessage (Intent::Burn (supplyDenom, amount, seller));
  res.AddAttribute ("action", "burn")
      .AddAttribute ("from", seller)
      .AddAmountAttribute ("supply", amount)
      .AddAmountAttribute ("reserve", released);

  LOG (INFO)
      << seller << " burnt " << amount << " " << supplyDenom
      << " for " << released << " " << state.reserveDenom;

  state = newState;

  return res;
}

CurveInfo
QueryCurveInfo (const Curve& curve, const CurveState& state)
{
  CurveInfo res;
  res.reserve = state.reserve;
  res.supply = state.supply;
  res.spotPrice = curve.SpotPrice (state.supply);
  res.reserveDenom = state.reserveDenom;

  return res;
}

} // namespace abc
