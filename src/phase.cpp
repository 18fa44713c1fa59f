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

#include "phase.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace abc
{

std::string
PhaseKindToString (const PhaseKind kind)
{
  switch (kind)
    {
    case PhaseKind::HATCH:
      return "hatch";
    case PhaseKind::OPEN:
      return "open";
    case PhaseKind::CLOSED:
      return "closed";
    }

  LOG (FATAL) << "Invalid phase: " << static_cast<int> (kind);
}

CommonsPhase
CommonsPhase::Hatch (const std::set<std::string>& h)
{
  CommonsPhase res(PhaseKind::HATCH);
  res.hatchers = h;
  return res;
}

void
CommonsPhase::AddHatcher (const std::string& addr)
{
  CHECK (kind == PhaseKind::HATCH)
      << "Adding hatcher in phase " << PhaseKindToString (kind);
  hatchers.insert (addr);
}

bool
HatchConfig::IsValid (std::string& reason) const
{
  std::ostringstream msg;

  if (raiseMin > raiseMax)
    msg << "initial raise minimum " << raiseMin
        << " exceeds the maximum " << raiseMax;
  else if (reservePercentage > 100)
    msg << "reserve percentage " << reservePercentage << " exceeds 100";
  else if (initialAllocation > 100)
    msg << "initial allocation " << initialAllocation << " exceeds 100";
  else if (initialPrice == 0)
    msg << "initial price must not be zero";
  else
    return true;

  reason = msg.str ();
  return false;
}

bool
HatchConfig::IsAllowlisted (const std::string& addr) const
{
  if (!hasAllowlist)
    return true;

  return allowlist.count (addr) > 0;
}

void
AssertBuyAllowed (const CommonsPhase& phase, const PhaseConfig& config,
                  const std::string& buyer)
{
  switch (phase.GetKind ())
    {
    case PhaseKind::HATCH:
      if (!config.hatch.IsAllowlisted (buyer))
        ReturnError (ErrorCode::ALLOWLIST,
                     buyer + " is not on the hatch allowlist");
      return;

    case PhaseKind::OPEN:
      return;

    case PhaseKind::CLOSED:
      ReturnError (ErrorCode::SALE_CLOSED, "the sale is closed");
    }

  LOG (FATAL) << "Invalid phase: " << static_cast<int> (phase.GetKind ());
}

void
RecordHatcher (CommonsPhase& phase, const std::string& buyer)
{
  if (phase.GetKind () != PhaseKind::HATCH)
    return;

  VLOG (1) << "Recording hatcher " << buyer;
  phase.AddHatcher (buyer);
}

CommonsPhase
MaybeTransition (const CommonsPhase& phase, const PhaseConfig& config,
                 const Amount& newReserve)
{
  if (phase.GetKind () != PhaseKind::HATCH)
    return phase;

  if (newReserve < config.hatch.raiseMax)
    return phase;

  LOG (INFO)
      << "Reserve " << newReserve << " reached the initial raise maximum "
      << config.hatch.raiseMax << ", opening the sale";
  return CommonsPhase::Open ();
}

} // namespace abc
