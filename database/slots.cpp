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

#include "slots.hpp"

#include <glog/logging.h>

namespace abc
{

namespace
{

struct SlotResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, key, 1);
  RESULT_COLUMN (std::string, proto, 2);
};

struct CountResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, cnt, 1);
};

} // anonymous namespace

std::string
SlotToKey (const Slot slot)
{
  switch (slot)
    {
    case Slot::CURVE_STATE:
      return "curve_state";
    case Slot::CURVE_TYPE:
      return "curve_type";
    case Slot::PHASE_CONFIG:
      return "phase_config";
    case Slot::PHASE:
      return "phase";
    case Slot::SUPPLY_DENOM:
      return "supply_denom";
    }

  LOG (FATAL) << "Invalid slot: " << static_cast<int> (slot);
}

bool
StateSlots::Get (const Slot slot, google::protobuf::Message& msg)
{
  const std::string key = SlotToKey (slot);

  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `slots`
      WHERE `key` = ?1
  )");
  stmt.Bind (1, key);

  auto res = stmt.Query<SlotResult> ();
  if (!res.Step ())
    {
      VLOG (1) << "Slot " << key << " is not set";
      return false;
    }

  res.GetProto<SlotResult::proto> (msg);
  CHECK (!res.Step ());

  return true;
}

void
StateSlots::Set (const Slot slot, const google::protobuf::Message& msg)
{
  const std::string key = SlotToKey (slot);
  VLOG (1) << "Updating slot " << key << ":\n" << msg.DebugString ();

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `slots`
      (`key`, `proto`) VALUES (?1, ?2)
  )");
  stmt.Bind (1, key);
  stmt.BindProto (2, msg);
  stmt.Execute ();
}

bool
StateSlots::IsEmpty ()
{
  auto stmt = db.Prepare ("SELECT COUNT (*) AS `cnt` FROM `slots`");
  auto res = stmt.Query<CountResult> ();
  CHECK (res.Step ());
  return res.Get<CountResult::cnt> () == 0;
}

} // namespace abc
