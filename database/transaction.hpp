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

#ifndef DATABASE_TRANSACTION_HPP
#define DATABASE_TRANSACTION_HPP

#include "database.hpp"

namespace abc
{

/**
 * RAII helper that wraps all database changes made during its lifetime
 * into an SQLite savepoint.  Unless Commit is called, the changes are
 * rolled back when the object goes out of scope (e.g. because an exception
 * is thrown).
 */
class Transaction
{

private:

  /** Underlying database handle.  */
  Database& db;

  /** Set to true once the changes have been committed.  */
  bool committed = false;

public:

  /**
   * Constructs the object and starts the savepoint.
   */
  explicit Transaction (Database& d);

  /**
   * Rolls back the changes unless they have been committed.
   */
  ~Transaction ();

  Transaction () = delete;
  Transaction (const Transaction&) = delete;
  void operator= (const Transaction&) = delete;

  /**
   * Commits the changes made so far.  Must be called at most once.
   */
  void Commit ();

};

} // namespace abc

#endif // DATABASE_TRANSACTION_HPP
