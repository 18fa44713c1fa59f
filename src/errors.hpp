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

#ifndef ABC_ERRORS_HPP
#define ABC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace abc
{

/**
 * Kinds of errors a sale operation can fail with.  All values have an
 * explicit integer number, since they are also part of the JSON interface
 * (next to the string name) for clients that only read the integer.
 */
enum class ErrorCode
{

  /* Invalid instantiation parameters, or the store is not (or already)
     instantiated.  */
  CONFIG = 1,

  /* No funds, wrong denom or multiple denoms attached to a request.  */
  PAYMENT = 2,

  /* Buyer is not on the allowlist during the hatch phase.  */
  ALLOWLIST = 3,

  /* Checked arithmetic failed, or the curve math is inconsistent.  */
  ARITHMETIC_OVERFLOW = 4,

  /* Curve evaluated outside of its valid domain.  */
  CURVE_DOMAIN = 5,

  /* Buy attempted while the sale is closed.  */
  SALE_CLOSED = 6,

  /* Malformed request (not a known message, wrong JSON types).  */
  INVALID_REQUEST = 7,

};

/**
 * Returns the string name of an error code, as used in JSON responses.
 */
std::string ErrorCodeToString (ErrorCode code);

/**
 * Exception thrown for all errors that abort a sale operation.  It carries
 * the kind of error and a human-readable message.
 */
class SaleError : public std::runtime_error
{

private:

  /** The kind of error.  */
  const ErrorCode code;

public:

  explicit SaleError (const ErrorCode c, const std::string& msg)
    : std::runtime_error(msg), code(c)
  {}

  ErrorCode
  GetCode () const
  {
    return code;
  }

};

/**
 * Aborts the current operation with the given error.  This throws a
 * SaleError, so does not return to the caller in a normal way.
 */
[[noreturn]] void ReturnError (ErrorCode code, const std::string& msg);

} // namespace abc

#endif // ABC_ERRORS_HPP
