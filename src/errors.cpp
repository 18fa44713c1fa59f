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

#include "errors.hpp"

#include <glog/logging.h>

namespace abc
{

std::string
ErrorCodeToString (const ErrorCode code)
{
  switch (code)
    {
    case ErrorCode::CONFIG:
      return "config";
    case ErrorCode::PAYMENT:
      return "payment";
    case ErrorCode::ALLOWLIST:
      return "allowlist";
    case ErrorCode::ARITHMETIC_OVERFLOW:
      return "overflow";
    case ErrorCode::CURVE_DOMAIN:
      return "curve domain";
    case ErrorCode::SALE_CLOSED:
      return "sale closed";
    case ErrorCode::INVALID_REQUEST:
      return "invalid request";
    }

  LOG (FATAL) << "Invalid error code: " << static_cast<int> (code);
}

void
ReturnError (const ErrorCode code, const std::string& msg)
{
  VLOG (1) << "Operation failed (" << ErrorCodeToString (code) << "): " << msg;
  throw SaleError (code, msg);
}

} // namespace abc
