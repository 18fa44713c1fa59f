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

#include "contract.hpp"

#include "errors.hpp"
#include "protoutils.hpp"

#include "database/slots.hpp"
#include "database/transaction.hpp"

#include <glog/logging.h>

#include <google/protobuf/text_format.h>

namespace abc
{

namespace
{

/** Prefix for denominations created through the token factory.  */
constexpr const char* DENOM_PREFIX = "factory";

/**
 * Loads a slot that must be present.  Fails with a config error if it is
 * not there, which means the contract has not been instantiated.
 */
void
LoadSlot (StateSlots& slots, const Slot slot,
          google::protobuf::Message& msg)
{
  if (!slots.Get (slot, msg))
    ReturnError (ErrorCode::CONFIG,
                 "contract is not instantiated (missing "
                    + SlotToKey (slot) + ")");
}

} // anonymous namespace

bool
Contract::IsInstantiated ()
{
  StateSlots slots(db);
  return !slots.IsEmpty ();
}

Contract::LoadedState
Contract::Load ()
{
  StateSlots slots(db);
  LoadedState res;

  proto::CurveType type;
  LoadSlot (slots, Slot::CURVE_TYPE, type);
  res.type = CurveTypeFromProto (type);

  proto::CurveState state;
  LoadSlot (slots, Slot::CURVE_STATE, state);
  res.state = CurveStateFromProto (state);

  proto::PhaseConfig config;
  LoadSlot (slots, Slot::PHASE_CONFIG, config);
  res.config = PhaseConfigFromProto (config);

  proto::Phase phase;
  LoadSlot (slots, Slot::PHASE, phase);
  res.phase = PhaseFromProto (phase);

  proto::SupplyDenom denom;
  LoadSlot (slots, Slot::SUPPLY_DENOM, denom);
  res.supplyDenom = denom.denom ();

  return res;
}

Response
Contract::Instantiate (const std::string& sender, const Funds& funds,
                       const proto::InstantiateMsg& msg)
{
  Transaction tx(db);
  StateSlots slots(db);

  if (!slots.IsEmpty ())
    ReturnError (ErrorCode::CONFIG, "contract is already instantiated");

  Nonpayable (funds);

  if (!msg.has_supply () || msg.supply ().subdenom ().empty ())
    ReturnError (ErrorCode::CONFIG, "no supply subdenom specified");
  if (!msg.has_reserve () || msg.reserve ().denom ().empty ())
    ReturnError (ErrorCode::CONFIG, "no reserve denom specified");
  if (!msg.has_curve_type ())
    ReturnError (ErrorCode::CONFIG, "no curve type specified");
  if (!msg.has_phase_config () || !msg.phase_config ().has_hatch ())
    ReturnError (ErrorCode::CONFIG, "no hatch phase config specified");

  proto::DecimalPlaces decimals;
  decimals.set_supply (msg.supply ().decimals ());
  decimals.set_reserve (msg.reserve ().decimals ());

  const CurveState state(msg.reserve ().denom (),
                         DecimalsFromProto (decimals));
  const CurveType type = CurveTypeFromProto (msg.curve_type ());
  const PhaseConfig config = PhaseConfigFromProto (msg.phase_config ());

  /* Make sure the curve can actually be constructed with the decimals.  */
  const Curve curve(type, state.decimals);

  const std::string& subdenom = msg.supply ().subdenom ();
  proto::SupplyDenom denom;
  denom.set_denom (std::string (DENOM_PREFIX) + "/" + address
                      + "/" + subdenom);

  slots.Set (Slot::CURVE_STATE, CurveStateToProto (state));
  slots.Set (Slot::CURVE_TYPE, CurveTypeToProto (curve.GetType ()));
  slots.Set (Slot::PHASE_CONFIG, PhaseConfigToProto (config));
  slots.Set (Slot::PHASE, PhaseToProto (CommonsPhase ()));
  slots.Set (Slot::SUPPLY_DENOM, denom);

  Response res;
  res.AddMessage (Intent::CreateDenom (
      subdenom, MetadataFromProto (msg.supply ().metadata ())));
  res.AddAttribute ("action", "instantiate")
      .AddAttribute ("from", sender)
      .AddAttribute ("supply_denom", denom.denom ());

  tx.Commit ();

  LOG (INFO)
      << "Instantiated sale of " << denom.denom ()
      << " for " << state.reserveDenom << " on a "
      << CurveKindToString (type.GetKind ()) << " curve";

  return res;
}

Response
Contract::Buy (const std::string& sender, const Funds& funds)
{
  Transaction tx(db);
  LoadedState s = Load ();

  const Curve curve(s.type, s.state.decimals);
  Response res = ExecuteBuy (curve, s.config, s.supplyDenom, sender, funds,
                             s.state, s.phase);

  StateSlots slots(db);
  slots.Set (Slot::CURVE_STATE, CurveStateToProto (s.state));
  slots.Set (Slot::PHASE, PhaseToProto (s.phase));

  tx.Commit ();
  return res;
}

Response
Contract::Burn (const std::string& sender, const Funds& funds,
                const Amount& amount)
{
  Transaction tx(db);
  LoadedState s = Load ();

  const Curve curve(s.type, s.state.decimals);
  Response res = ExecuteSell (curve, s.supplyDenom, sender, amount, funds,
                              s.state);

  StateSlots slots(db);
  slots.Set (Slot::CURVE_STATE, CurveStateToProto (s.state));

  tx.Commit ();
  return res;
}

CurveInfo
Contract::QueryCurveInfo ()
{
  const LoadedState s = Load ();
  const Curve curve(s.type, s.state.decimals);
  return abc::QueryCurveInfo (curve, s.state);
}

CommonsPhase
Contract::QueryPhase ()
{
  return Load ().phase;
}

PhaseConfig
Contract::QueryPhaseConfig ()
{
  return Load ().config;
}

std::string
Contract::QuerySupplyDenom ()
{
  return Load ().supplyDenom;
}

Response
InstantiateFromText (Contract& contract, const std::string& text)
{
  proto::InstantiateMsg msg;
  if (!google::protobuf::TextFormat::ParseFromString (text, &msg))
    ReturnError (ErrorCode::CONFIG,
                 "failed to parse the instantiation config");

  return contract.Instantiate (contract.GetAddress (), {}, msg);
}

} // namespace abc
