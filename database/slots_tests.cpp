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

#include "dbtest.hpp"

#include "proto/curve.pb.h"
#include "proto/phase.pb.h"

#include <gtest/gtest.h>

namespace abc
{
namespace
{

using StateSlotsTests = DBTestWithSchema;

TEST_F (StateSlotsTests, Keys)
{
  EXPECT_EQ (SlotToKey (Slot::CURVE_STATE), "curve_state");
  EXPECT_EQ (SlotToKey (Slot::CURVE_TYPE), "curve_type");
  EXPECT_EQ (SlotToKey (Slot::PHASE_CONFIG), "phase_config");
  EXPECT_EQ (SlotToKey (Slot::PHASE), "phase");
  EXPECT_EQ (SlotToKey (Slot::SUPPLY_DENOM), "supply_denom");
}

TEST_F (StateSlotsTests, Unset)
{
  StateSlots slots(db);
  EXPECT_TRUE (slots.IsEmpty ());

  proto::CurveState state;
  state.set_reserve ("5");
  EXPECT_FALSE (slots.Get (Slot::CURVE_STATE, state));
  EXPECT_EQ (state.reserve (), "5");
}

TEST_F (StateSlotsTests, SetAndGet)
{
  StateSlots slots(db);

  proto::CurveState state;
  state.set_reserve ("100");
  state.set_supply ("42");
  state.set_reserve_denom ("satoshi");
  slots.Set (Slot::CURVE_STATE, state);

  proto::DecimalPlaces dec;
  dec.set_supply (6);
  slots.Set (Slot::SUPPLY_DENOM, dec);

  EXPECT_FALSE (slots.IsEmpty ());

  proto::Phase phase;
  EXPECT_FALSE (slots.Get (Slot::PHASE, phase));

  proto::CurveState read;
  ASSERT_TRUE (slots.Get (Slot::CURVE_STATE, read));
  EXPECT_EQ (read.reserve (), "100");
  EXPECT_EQ (read.supply (), "42");
  EXPECT_EQ (read.reserve_denom (), "satoshi");
}

TEST_F (StateSlotsTests, Overwrite)
{
  StateSlots slots(db);

  proto::CurveState state;
  state.set_reserve ("100");
  state.set_supply ("42");
  slots.Set (Slot::CURVE_STATE, state);

  state.Clear ();
  state.set_reserve ("7");
  slots.Set (Slot::CURVE_STATE, state);

  proto::CurveState read;
  ASSERT_TRUE (slots.Get (Slot::CURVE_STATE, read));
  EXPECT_EQ (read.reserve (), "7");
  EXPECT_FALSE (read.has_supply ());
}

} // anonymous namespace
} // namespace abc
