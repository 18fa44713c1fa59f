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

#include "protoutils.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace abc
{

Amount
AmountFromProto (const std::string& str, const std::string& field)
{
  Amount res;
  if (!AmountFromString (str, res))
    ReturnError (ErrorCode::CONFIG,
                 "invalid amount for " + field + ": '" + str + "'");

  return res;
}

proto::DecimalPlaces
DecimalsToProto (const DecimalPlaces& d)
{
  proto::DecimalPlaces res;
  res.set_supply (d.GetSupply ());
  res.set_reserve (d.GetReserve ());
  return res;
}

DecimalPlaces
DecimalsFromProto (const proto::DecimalPlaces& pb)
{
  return DecimalPlaces (pb.supply (), pb.reserve ());
}

proto::CurveType
CurveTypeToProto (const CurveType& t)
{
  const std::string coeff = AmountToString (t.GetCoefficient ());

  proto::CurveType res;
  switch (t.GetKind ())
    {
    case CurveKind::CONSTANT:
      res.mutable_constant ()->set_value (coeff);
      res.mutable_constant ()->set_scale (t.GetScale ());
      return res;
    case CurveKind::LINEAR:
      res.mutable_linear ()->set_slope (coeff);
      res.mutable_linear ()->set_scale (t.GetScale ());
      return res;
    case CurveKind::SQUARE_ROOT:
      res.mutable_square_root ()->set_slope (coeff);
      res.mutable_square_root ()->set_scale (t.GetScale ());
      return res;
    }

  LOG (FATAL) << "Invalid curve kind: " << static_cast<int> (t.GetKind ());
}

namespace
{

CurveType
BuildCurveType (const proto::CurveType& pb)
{
  switch (pb.kind_case ())
    {
    case proto::CurveType::kConstant:
      return CurveType::Constant (
          AmountFromProto (pb.constant ().value (), "constant value"),
          pb.constant ().scale ());
    case proto::CurveType::kLinear:
      return CurveType::Linear (
          AmountFromProto (pb.linear ().slope (), "linear slope"),
          pb.linear ().scale ());
    case proto::CurveType::kSquareRoot:
      return CurveType::SquareRoot (
          AmountFromProto (pb.square_root ().slope (), "square root slope"),
          pb.square_root ().scale ());
    case proto::CurveType::KIND_NOT_SET:
      break;
    }

  ReturnError (ErrorCode::CONFIG, "no curve type specified");
}

} // anonymous namespace

CurveType
CurveTypeFromProto (const proto::CurveType& pb)
{
  const CurveType res = BuildCurveType (pb);

  std::string reason;
  if (!res.IsValid (reason))
    ReturnError (ErrorCode::CONFIG, "invalid curve type: " + reason);

  return res;
}

proto::CurveState
CurveStateToProto (const CurveState& s)
{
  proto::CurveState res;
  res.set_reserve (AmountToString (s.reserve));
  res.set_supply (AmountToString (s.supply));
  res.set_reserve_denom (s.reserveDenom);
  *res.mutable_decimals () = DecimalsToProto (s.decimals);
  return res;
}

CurveState
CurveStateFromProto (const proto::CurveState& pb)
{
  CurveState res(pb.reserve_denom (), DecimalsFromProto (pb.decimals ()));
  res.reserve = AmountFromProto (pb.reserve (), "reserve");
  res.supply = AmountFromProto (pb.supply (), "supply");
  return res;
}

proto::Phase
PhaseToProto (const CommonsPhase& p)
{
  proto::Phase res;
  switch (p.GetKind ())
    {
    case PhaseKind::HATCH:
      res.set_kind (proto::Phase::HATCH);
      for (const auto& h : p.GetHatchers ())
        res.add_hatchers (h);
      return res;
    case PhaseKind::OPEN:
      res.set_kind (proto::Phase::OPEN);
      return res;
    case PhaseKind::CLOSED:
      res.set_kind (proto::Phase::CLOSED);
      return res;
    }

  LOG (FATAL) << "Invalid phase: " << static_cast<int> (p.GetKind ());
}

CommonsPhase
PhaseFromProto (const proto::Phase& pb)
{
  if (pb.kind () != proto::Phase::HATCH && pb.hatchers_size () > 0)
    ReturnError (ErrorCode::CONFIG, "hatchers set outside of the hatch phase");

  switch (pb.kind ())
    {
    case proto::Phase::HATCH:
      return CommonsPhase::Hatch (
          std::set<std::string> (pb.hatchers ().begin (),
                                 pb.hatchers ().end ()));
    case proto::Phase::OPEN:
      return CommonsPhase::Open ();
    case proto::Phase::CLOSED:
      return CommonsPhase::Closed ();
    }

  std::ostringstream msg;
  msg << "invalid phase kind " << static_cast<int> (pb.kind ());
  ReturnError (ErrorCode::CONFIG, msg.str ());
}

proto::PhaseConfig
PhaseConfigToProto (const PhaseConfig& c)
{
  proto::PhaseConfig res;
  auto& hatch = *res.mutable_hatch ();

  if (c.hatch.hasAllowlist)
    {
      auto& allowlist = *hatch.mutable_allowlist ();
      for (const auto& a : c.hatch.allowlist)
        allowlist.add_addresses (a);
    }

  hatch.mutable_initial_raise ()->set_min (AmountToString (c.hatch.raiseMin));
  hatch.mutable_initial_raise ()->set_max (AmountToString (c.hatch.raiseMax));
  hatch.set_initial_price (AmountToString (c.hatch.initialPrice));
  hatch.set_initial_allocation (c.hatch.initialAllocation);
  hatch.set_reserve_percentage (c.hatch.reservePercentage);

  return res;
}

PhaseConfig
PhaseConfigFromProto (const proto::PhaseConfig& pb)
{
  const auto& hatch = pb.hatch ();

  PhaseConfig res;
  res.hatch.hasAllowlist = hatch.has_allowlist ();
  for (const auto& a : hatch.allowlist ().addresses ())
    res.hatch.allowlist.insert (a);

  res.hatch.raiseMin
      = AmountFromProto (hatch.initial_raise ().min (), "initial raise min");
  res.hatch.raiseMax
      = AmountFromProto (hatch.initial_raise ().max (), "initial raise max");
  res.hatch.initialPrice
      = AmountFromProto (hatch.initial_price (), "initial price");
  res.hatch.initialAllocation = hatch.initial_allocation ();
  res.hatch.reservePercentage = hatch.reserve_percentage ();

  std::string reason;
  if (!res.hatch.IsValid (reason))
    ReturnError (ErrorCode::CONFIG, "invalid hatch config: " + reason);

  return res;
}

TokenMetadata
MetadataFromProto (const proto::TokenMetadata& pb)
{
  TokenMetadata res;
  res.name = pb.name ();
  res.symbol = pb.symbol ();
  res.description = pb.description ();
  res.display = pb.display ();
  return res;
}

} // namespace abc
