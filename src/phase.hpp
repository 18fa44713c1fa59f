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

#ifndef ABC_PHASE_HPP
#define ABC_PHASE_HPP

#include "database/amount.hpp"

#include <set>
#include <string>

namespace abc
{

/**
 * The phases the sale can be in.
 */
enum class PhaseKind
{

  /** Initial phase, restricted to the allowlist (if any).  */
  HATCH,

  /** Buying is open to everyone.  */
  OPEN,

  /** The sale is closed and no more tokens are minted.  */
  CLOSED,

};

/**
 * Returns the lower-case name of a phase, as used in JSON.
 */
std::string PhaseKindToString (PhaseKind kind);

/**
 * The current phase of the sale.  In the hatch phase, this also keeps
 * track of all addresses that have bought so far.
 */
class CommonsPhase
{

private:

  /** The phase we are in.  */
  PhaseKind kind;

  /** The hatchers so far.  This is always empty outside of HATCH.  */
  std::set<std::string> hatchers;

  explicit CommonsPhase (const PhaseKind k)
    : kind(k)
  {}

public:

  /** Constructs the initial phase, i.e. HATCH without any hatchers.  */
  CommonsPhase ()
    : kind(PhaseKind::HATCH)
  {}

  CommonsPhase (const CommonsPhase&) = default;
  CommonsPhase& operator= (const CommonsPhase&) = default;

  /**
   * Constructs a hatch phase with the given set of hatchers.
   */
  static CommonsPhase Hatch (const std::set<std::string>& h);

  static CommonsPhase
  Open ()
  {
    return CommonsPhase (PhaseKind::OPEN);
  }

  static CommonsPhase
  Closed ()
  {
    return CommonsPhase (PhaseKind::CLOSED);
  }

  PhaseKind
  GetKind () const
  {
    return kind;
  }

  const std::set<std::string>&
  GetHatchers () const
  {
    return hatchers;
  }

  /**
   * Adds an address to the set of hatchers.  Must only be called in the
   * hatch phase.
   */
  void AddHatcher (const std::string& addr);

  friend bool
  operator== (const CommonsPhase& a, const CommonsPhase& b)
  {
    return a.kind == b.kind && a.hatchers == b.hatchers;
  }

  friend bool
  operator!= (const CommonsPhase& a, const CommonsPhase& b)
  {
    return !(a == b);
  }

};

/**
 * Configuration of the hatch phase.  This is set at instantiation and
 * never changed afterwards.
 */
struct HatchConfig
{

  /**
   * Whether or not an allowlist is in effect.  If this is true, then
   * only addresses in allowlist can buy during the hatch phase (so that
   * an empty list blocks all buyers).
   */
  bool hasAllowlist = false;

  /** The addresses on the allowlist.  */
  std::set<std::string> allowlist;

  /** Minimum of the initial raise.  */
  Amount raiseMin = 0;

  /**
   * Maximum of the initial raise.  When the reserve reaches this,
   * the sale moves on to the open phase.
   */
  Amount raiseMax = 0;

  /** Price (in reserve units) per supply token during the hatch.  */
  Amount initialPrice = 0;

  /** Percentage of the supply allocated initially.  */
  unsigned initialAllocation = 0;

  /** Percentage of the hatch funds that go to the reserve.  */
  unsigned reservePercentage = 0;

  /**
   * Checks the invariants of the configuration.  Returns false and
   * sets an explanation if they are violated.
   */
  bool IsValid (std::string& reason) const;

  /**
   * Returns true if the given address is allowed to buy during the
   * hatch phase.
   */
  bool IsAllowlisted (const std::string& addr) const;

};

/**
 * Configuration of all the phases.
 */
struct PhaseConfig
{
  HatchConfig hatch;
};

/**
 * Checks that a buyer is allowed to buy in the current phase.  Fails with
 * an allowlist error if the buyer is not on the allowlist during the hatch,
 * and with a sale-closed error in the closed phase.
 */
void AssertBuyAllowed (const CommonsPhase& phase, const PhaseConfig& config,
                       const std::string& buyer);

/**
 * Records a buyer as hatcher if we are in the hatch phase.  This is
 * idempotent.
 */
void RecordHatcher (CommonsPhase& phase, const std::string& buyer);

/**
 * Returns the phase after a buy has raised the reserve to the given total.
 * If we are in the hatch phase and the maximum of the initial raise has been
 * reached, this is the open phase.  Otherwise the phase stays as it is.
 */
CommonsPhase MaybeTransition (const CommonsPhase& phase,
                              const PhaseConfig& config,
                              const Amount& newReserve);

} // namespace abc

#endif // ABC_PHASE_HPP
