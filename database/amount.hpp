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

#ifndef DATABASE_AMOUNT_HPP
#define DATABASE_AMOUNT_HPP

#include <boost/multiprecision/cpp_int.hpp>

#include <string>

namespace abc
{

/**
 * An amount of tokens (reserve or supply), in the raw integer units of the
 * respective token.  This is an unsigned 128-bit integer and wraps around
 * on overflow, so all arithmetic on it that can overflow has to go through
 * the checked helpers below.
 */
using Amount = boost::multiprecision::uint128_t;

/**
 * Arbitrary-precision signed integer.  This is used for intermediate values
 * in the curve math, which are then range-checked back into Amount.
 */
using BigInt = boost::multiprecision::cpp_int;

/** Highest valid value for an amount.  */
extern const Amount MAX_AMOUNT;

/**
 * Adds two amounts.  Returns false (and leaves res untouched) if the
 * result would exceed MAX_AMOUNT.
 */
bool CheckedAdd (const Amount& a, const Amount& b, Amount& res);

/**
 * Subtracts b from a.  Returns false (and leaves res untouched) if the
 * result would be negative.
 */
bool CheckedSub (const Amount& a, const Amount& b, Amount& res);

/**
 * Converts an intermediate value back into an Amount.  Returns false if
 * it is out of range (i.e. negative or larger than MAX_AMOUNT).
 */
bool BigToAmount (const BigInt& val, Amount& res);

/**
 * Returns 10^exp as BigInt.
 */
BigInt Pow10 (unsigned exp);

/**
 * Formats an amount as decimal string (without any decimal point; this
 * is the raw integer value).
 */
std::string AmountToString (const Amount& a);

/**
 * Parses a raw amount from its decimal string representation.  Only plain
 * digits are accepted (no sign, no whitespace, no hex prefix).  Returns
 * false if the format is invalid or the value exceeds MAX_AMOUNT.
 */
bool AmountFromString (const std::string& str, Amount& a);

} // namespace abc

#endif // DATABASE_AMOUNT_HPP
