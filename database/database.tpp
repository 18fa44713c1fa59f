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

/* Template implementation code for database.hpp.  */

#include <glog/logging.h>

#include <cstring>

namespace abc
{

namespace internal
{

/**
 * Extracts a value of the given type from a column of an SQLite result row.
 * This is specialised for the supported types in the .cpp file.
 */
template <typename T>
  T GetColumnValue (sqlite3_stmt* stmt, int ind);

template <>
  int64_t GetColumnValue<int64_t> (sqlite3_stmt* stmt, int ind);
template <>
  bool GetColumnValue<bool> (sqlite3_stmt* stmt, int ind);
template <>
  std::string GetColumnValue<std::string> (sqlite3_stmt* stmt, int ind);

} // namespace internal

template <typename T>
  Database::Result<T>
  Database::Statement::Query ()
{
  CHECK (!executed && !queried) << "Database statement has already been run";
  queried = true;
  return Result<T> (*db, std::move (stmt));
}

/* Specialisations for the supported types (with implementations in the
   .cpp file).  */
template <>
  void Database::Statement::Bind<int64_t> (unsigned ind, const int64_t& val);
template <>
  void Database::Statement::Bind<int> (unsigned ind, const int& val);
template <>
  void Database::Statement::Bind<bool> (unsigned ind, const bool& val);
template <>
  void Database::Statement::Bind<std::string> (unsigned ind,
                                               const std::string& val);

template <typename T>
  Database::Result<T>::Result (Database& d, internal::StatementPtr&& s)
    : db(&d), stmt(std::move (s))
{
  columnInd.fill (MISSING_COLUMN);
}

template <typename T>
  bool
  Database::Result<T>::Step ()
{
  const int rc = sqlite3_step (stmt.get ());
  if (rc == SQLITE_ROW)
    return true;

  CHECK_EQ (rc, SQLITE_DONE)
      << "Failed to step SQLite result: " << sqlite3_errstr (rc);
  return false;
}

template <typename T>
template <typename Col>
  int
  Database::Result<T>::ColumnIndex () const
{
  const int res = columnInd[Col::ID];
  if (res != MISSING_COLUMN)
    return res;

  const int num = sqlite3_column_count (stmt.get ());
  for (int i = 0; i < num; ++i)
    {
      const char* name = sqlite3_column_name (stmt.get (), i);
      if (std::strcmp (name, Col::NAME) == 0)
        {
          columnInd[Col::ID] = i;
          return i;
        }
    }

  LOG (FATAL) << "Column " << Col::NAME << " not returned by database";
}

template <typename T>
template <typename Col>
  bool
  Database::Result<T>::IsNull () const
{
  return sqlite3_column_type (stmt.get (), ColumnIndex<Col> ()) == SQLITE_NULL;
}

template <typename T>
template <typename Col>
  typename Col::Type
  Database::Result<T>::Get () const
{
  return internal::GetColumnValue<typename Col::Type> (stmt.get (),
                                                        ColumnIndex<Col> ());
}

template <typename T>
template <typename Col>
  void
  Database::Result<T>::GetProto (google::protobuf::Message& msg) const
{
  const auto data
      = internal::GetColumnValue<std::string> (stmt.get (), ColumnIndex<Col> ());
  CHECK (msg.ParseFromString (data))
      << "Failed to parse " << msg.GetTypeName () << " from column "
      << Col::NAME;
}

} // namespace abc
