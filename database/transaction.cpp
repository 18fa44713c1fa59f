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

#include "transaction.hpp"

#include <glog/logging.h>

namespace abc
{

Transaction::Transaction (Database& d)
  : db(d)
{
  VLOG (1) << "Starting database transaction";
  auto stmt = db.Prepare ("SAVEPOINT `abc_transaction`");
  stmt.Execute ();
}

Transaction::~Transaction ()
{
  if (committed)
    return;

  LOG (WARNING) << "Rolling back database transaction";
  auto stmt = db.Prepare ("ROLLBACK TO `abc_transaction`");
  stmt.Execute ();
  stmt = db.Prepare ("RELEASE `abc_transaction`");
  stmt.Execute ();
}

void
Transaction::Commit ()
{
  CHECK (!committed) << "Transaction has already been committed";

  VLOG (1) << "Committing database transaction";
  auto stmt = db.Prepare ("RELEASE `abc_transaction`");
  stmt.Execute ();
  committed = true;
}

} // namespace abc
