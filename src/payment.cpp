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

#include "payment.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace abc
{

Amount
MustPay (const Funds& funds, const std::string& denom)
{
  if (funds.empty ())
    ReturnError (ErrorCode::PAYMENT, "no funds sent");
  if (funds.size () > 1)
    ReturnError (ErrorCode::PAYMENT, "sent more than one denomination");

  const Coin& coin = funds.front ();
  if (coin.amount == 0)
    ReturnError (ErrorCode::PAYMENT, "no funds sent");

  if (coin.denom != denom)
    {
      std::ostringstream msg;
      msg << "must send denomination '" << denom << "', got '"
          << coin.denom << "'";
      ReturnError (ErrorCode::PAYMENT, msg.str ());
    }

  VLOG (1) << "Received payment of " << coin.amount << " " << denom;
  return coin.amount;
}

void
Nonpayable (const Funds& funds)
{
  if (!funds.empty ())
    ReturnError (ErrorCode::PAYMENT, "this message does not accept funds");
}

} // namespace abc
