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

#include "dbtest.hpp"

#include "proto/curve.pb.h"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace abc
{
namespace
{

/**
 * Basic struct that holds data corresponding to what we store in the test
 * database table.
 */
struct RowData
{
  int64_t id;
  bool flag;
  std::string name;
  unsigned supplyDecimals;
  unsigned reserveDecimals;
};

/**
 * Database result type for our test table.
 */
struct TestResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, id, 1);
  RESULT_COLUMN (bool, flag, 2);
  RESULT_COLUMN (std::string, name, 3);
  RESULT_COLUMN (std::string, proto, 4);
};

/**
 * Constructs a DecimalPlaces proto with the given values.
 */
proto::DecimalPlaces
MakeDecimals (const unsigned supply, const unsigned reserve)
{
  proto::DecimalPlaces res;
  res.set_supply (supply);
  res.set_reserve (reserve);
  return res;
}

class DatabaseTests : public DBTestFixture
{

protected:

  DatabaseTests ()
  {
    auto stmt = db.Prepare (R"(
      CREATE TABLE `test` (
        `id` INTEGER PRIMARY KEY,
        `flag` INTEGER,
        `name` TEXT,
        `proto` BLOB
      )
    )");
    stmt.Execute ();
  }

  /**
   * Queries the data to verify that it matches the given golden values.
   */
  void
  ExpectData (const std::vector<RowData>& golden)
  {
    auto stmt = db.Prepare (R"(
      SELECT * FROM `test` ORDER BY `id` ASC
    )");
    auto res = stmt.Query<TestResult> ();
    for (const auto& val : golden)
      {
        LOG (INFO) << "Verifying golden data with ID " << val.id << "...";

        ASSERT_TRUE (res.Step ());
        EXPECT_EQ (res.Get<TestResult::id> (), val.id);
        EXPECT_EQ (res.Get<TestResult::flag> (), val.flag);
        EXPECT_EQ (res.Get<TestResult::name> (), val.name);

        proto::DecimalPlaces d;
        res.GetProto<TestResult::proto> (d);
        EXPECT_EQ (d.supply (), val.supplyDecimals);
        EXPECT_EQ (d.reserve (), val.reserveDecimals);
      }
    ASSERT_FALSE (res.Step ());
  }

};

TEST_F (DatabaseTests, BindingAndQuery)
{
  const auto dec1 = MakeDecimals (6, 8);
  const auto dec2 = MakeDecimals (18, 0);

  auto stmt = db.Prepare (R"(
    INSERT INTO `test`
      (`id`, `flag`, `name`, `proto`) VALUES
      (?1, ?2, ?3, ?4), (?5, ?6, ?7, ?8);
  )");

  const auto largeInt = std::numeric_limits<int64_t>::max ();
  stmt.Bind (1, largeInt);
  stmt.BindNull (2);
  stmt.Bind<std::string> (3, "foo");
  stmt.BindProto (4, dec1);

  stmt.Bind (5, 10);
  stmt.Bind (6, true);
  stmt.Bind<std::string> (7, "bar");
  stmt.BindProto (8, dec2);

  stmt.Execute ();

  ExpectData ({
    {10, true, "bar", 18, 0},
    {largeInt, false, "foo", 6, 8},
  });
}

TEST_F (DatabaseTests, StatementReset)
{
  auto stmt = db.Prepare ("INSERT INTO `test` (`id`, `flag`) VALUES (?1, ?2)");

  stmt.Bind (1, 42);
  stmt.Bind (2, true);
  stmt.Execute ();

  stmt.Reset ();
  stmt.Bind (1, 50);
  /* Do not bind parameter 2, so it is NULL.  This verifies that the parameter
     bindings are reset completely.  */
  stmt.Execute ();

  stmt = db.Prepare ("SELECT `id`, `flag` FROM `test` ORDER BY `id`");
  auto res = stmt.Query<TestResult> ();

  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<TestResult::id> (), 42);
  EXPECT_EQ (res.Get<TestResult::flag> (), true);
  EXPECT_FALSE (res.IsNull<TestResult::flag> ());

  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<TestResult::id> (), 50);
  EXPECT_EQ (res.Get<TestResult::flag> (), false);
  EXPECT_TRUE (res.IsNull<TestResult::flag> ());

  ASSERT_FALSE (res.Step ());
}

TEST_F (DatabaseTests, ProtoIsOverwritten)
{
  proto::DecimalPlaces dec;
  dec.set_supply (5);
  /* Explicitly leave reserve unset.  */

  auto stmt = db.Prepare (R"(
    INSERT INTO `test` (`proto`) VALUES (?1);
  )");
  stmt.BindProto (1, dec);
  stmt.Execute ();

  stmt = db.Prepare ("SELECT `proto` FROM `test`");
  auto res = stmt.Query<TestResult> ();

  ASSERT_TRUE (res.Step ());

  /* Verify that the output proto is fully overwritten (i.e. cleared) and not
     just merged with the data we read.  */
  proto::DecimalPlaces protoRes;
  protoRes.set_reserve (42);
  res.GetProto<TestResult::proto> (protoRes);
  EXPECT_EQ (protoRes.supply (), 5);
  EXPECT_FALSE (protoRes.has_reserve ());

  ASSERT_FALSE (res.Step ());
}

TEST_F (DatabaseTests, ResultProperties)
{
  auto stmt = db.Prepare ("SELECT * FROM `test`");
  auto res = stmt.Query<TestResult> ();
  EXPECT_EQ (&res.GetDatabase (), &db);
}

} // anonymous namespace
} // namespace abc
