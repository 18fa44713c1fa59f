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

#ifndef DATABASE_SLOTS_HPP
#define DATABASE_SLOTS_HPP

#include "database.hpp"

#include <google/protobuf/message.h>

#include <string>

namespace abc
{

/**
 * The persisted values that make up the state of a sale.
 */
enum class Slot
{
  CURVE_STATE,
  CURVE_TYPE,
  PHASE_CONFIG,
  PHASE,
  SUPPLY_DENOM,
};

/**
 * Returns the database key for a slot.
 */
std::string SlotToKey (Slot slot);

/**
 * Wrapper class around the database table holding the state slots.  Each
 * slot stores a single protocol buffer.
 */
class StateSlots
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit StateSlots (Database& d)
    : db(d)
  {}

  StateSlots () = delete;
  StateSlots (const StateSlots&) = delete;
  void operator= (const StateSlots&) = delete;

  /**
   * Loads the value of a slot into the given proto.  Returns false if
   * the slot is not set.
   */
  bool Get (Slot slot, google::protobuf::Message& msg);

  /**
   * Sets the value of a slot, replacing any existing one.
   */
  void Set (Slot slot, const google::protobuf::Message& msg);

  /**
   * Returns true if no slot has a value yet.
   */
  bool IsEmpty ();

};

} // namespace abc

#endif // DATABASE_SLOTS_HPP
