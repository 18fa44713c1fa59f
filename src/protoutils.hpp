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

#ifndef ABC_PROTOUTILS_HPP
#define ABC_PROTOUTILS_HPP

#include "curves.hpp"
#include "curvestate.hpp"
#include "decimalplaces.hpp"
#include "intents.hpp"
#include "phase.hpp"

#include "database/amount.hpp"
#include "proto/curve.pb.h"
#include "proto/msg.pb.h"
#include "proto/phase.pb.h"

#include <string>

namespace abc
{

/* The FromProto functions validate the data and fail with a config error
   if it is invalid (e.g. an amount string that cannot be parsed or
   parameters violating the invariants).  */

/**
 * Parses an amount stored as string in a protocol buffer.  The field
 * name is used for the error message.
 */
Amount AmountFromProto (const std::string& str, const std::string& field);

proto::DecimalPlaces DecimalsToProto (const DecimalPlaces& d);
DecimalPlaces DecimalsFromProto (const proto::DecimalPlaces& pb);

proto::CurveType CurveTypeToProto (const CurveType& t);
CurveType CurveTypeFromProto (const proto::CurveType& pb);

proto::CurveState CurveStateToProto (const CurveState& s);
CurveState CurveStateFromProto (const proto::CurveState& pb);

proto::Phase PhaseToProto (const CommonsPhase& p);
CommonsPhase PhaseFromProto (const proto::Phase& pb);

proto::PhaseConfig PhaseConfigToProto (const PhaseConfig& c);
PhaseConfig PhaseConfigFromProto (const proto::PhaseConfig& pb);

/**
 * Converts the metadata of the supply token.
 */
TokenMetadata MetadataFromProto (const proto::TokenMetadata& pb);

} // namespace abc

#endif // ABC_PROTOUTILS_HPP
