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

#include "database.hpp"

#include <glog/logging.h>

namespace abc
{

constexpr const char* Database::IN_MEMORY;

Database::Database (const std::string& file)
{
  LOG (INFO) << "Opening SQLite database " << file;

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  const int rc = sqlite3_open_v2 (file.c_str (), &db, flags, nullptr);
  if (rc != SQLITE_OK)
    LOG (FATAL)
        << "Failed to open SQLite database " << file << ": "
        << sqlite3_errstr (rc);
  CHECK (db != nullptr);
}

Database::~Database ()
{
  if (db == nullptr)
    return;

  VLOG (1) << "Closing SQLite database";
  const int rc = sqlite3_close (db);
  if (rc != SQLITE_OK)
    LOG (ERROR) << "Failed to close SQLite database: " << sqlite3_errstr (rc);
}

Database::Statement
Database::Prepare (const std::string& sql)
{
  CHECK (db != nullptr) << "Database has not been opened";

  sqlite3_stmt* res = nullptr;
  const int rc = sqlite3_prepare_v2 (db, sql.c_str (), sql.size () + 1,
                                     &res, nullptr);
  CHECK_EQ (rc, SQLITE_OK)
      << "Failed to prepare SQL statement: " << sqlite3_errmsg (db)
      << "\n" << sql;

  return Statement (*this, internal::StatementPtr (res));
}

namespace internal
{

void
StatementDeleter::operator() (sqlite3_stmt* stmt) const
{
  sqlite3_finalize (stmt);
}

template <>
  int64_t
  GetColumnValue<int64_t> (sqlite3_stmt* stmt, const int ind)
{
  return sqlite3_column_int64 (stmt, ind);
}

template <>
  bool
  GetColumnValue<bool> (sqlite3_stmt* stmt, const int ind)
{
  return sqlite3_column_int64 (stmt, ind) != 0;
}

template <>
  std::string
  GetColumnValue<std::string> (sqlite3_stmt* stmt, const int ind)
{
  const auto* data
      = static_cast<const char*> (sqlite3_column_blob (stmt, ind));
  const int len = sqlite3_column_bytes (stmt, ind);
  if (data == nullptr)
    return "";

  return std::string (data, len);
}

} // namespace internal

namespace
{

/**
 * Checks the return code of a binding call.
 */
void
CheckBind (const int rc, const unsigned ind)
{
  CHECK_EQ (rc, SQLITE_OK)
      << "Failed to bind parameter " << ind << ": " << sqlite3_errstr (rc);
}

} // anonymous namespace

template <>
  void
  Database::Statement::Bind<int64_t> (const unsigned ind, const int64_t& val)
{
  CHECK (!executed && !queried);
  CheckBind (sqlite3_bind_int64 (stmt.get (), ind, val), ind);
}

template <>
  void
  Database::Statement::Bind<int> (const unsigned ind, const int& val)
{
  Bind<int64_t> (ind, val);
}

template <>
  void
  Database::Statement::Bind<bool> (const unsigned ind, const bool& val)
{
  Bind<int64_t> (ind, val ? 1 : 0);
}

template <>
  void
  Database::Statement::Bind<std::string> (const unsigned ind,
                                          const std::string& val)
{
  CHECK (!executed && !queried);
  CheckBind (sqlite3_bind_text (stmt.get (), ind, val.c_str (), val.size (),
                                SQLITE_TRANSIENT),
             ind);
}

void
Database::Statement::BindNull (const unsigned ind)
{
  CHECK (!executed && !queried);
  CheckBind (sqlite3_bind_null (stmt.get (), ind), ind);
}

void
Database::Statement::BindProto (const unsigned ind,
                                const google::protobuf::Message& msg)
{
  CHECK (!executed && !queried);

  std::string data;
  CHECK (msg.SerializeToString (&data));
  CheckBind (sqlite3_bind_blob (stmt.get (), ind, data.data (), data.size (),
                                SQLITE_TRANSIENT),
             ind);
}

void
Database::Statement::Reset ()
{
  CHECK (!queried) << "SELECT statements can't be reset";
  sqlite3_clear_bindings (stmt.get ());
  sqlite3_reset (stmt.get ());
  executed = false;
}

void
Database::Statement::Execute ()
{
  CHECK (!executed && !queried) << "Database statement has already been run";
  executed = true;

  const int rc = sqlite3_step (stmt.get ());
  CHECK_EQ (rc, SQLITE_DONE)
      << "Failed to execute SQL statement: " << sqlite3_errmsg (db->db);
}

} // namespace abc
