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

#ifndef ABC_TESTUTILS_HPP
#define ABC_TESTUTILS_HPP

#include "errors.hpp"

#include <google/protobuf/text_format.h>

#include <json/json.h>

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <string>

namespace abc
{

/**
 * Parses a string into JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Checks for "partial equality" of the given JSON values.  This means that
 * keys not present in the expected value (if it is an object) are not checked
 * in the actual value at all.  If keys have a value of null in expected,
 * then they must not be there in actual at all.
 */
bool PartialJsonEqual (const Json::Value& actual, const Json::Value& expected);

/**
 * Parses a protocol buffer from text format.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res))
      << "Failed to parse text proto:\n" << str;
  return res;
}

/**
 * Runs the given function and expects it to fail with a SaleError
 * of the given code.  Returns the error message (or the empty string
 * if the expectation failed), so that tests can check it further.
 */
template <typename Fcn>
  std::string
  ExpectSaleError (const ErrorCode code, Fcn f)
{
  try
    {
      f ();
      ADD_FAILURE ()
          << "Expected error " << ErrorCodeToString (code)
          << ", but the call succeeded";
    }
  catch (const SaleError& exc)
    {
      EXPECT_EQ (exc.GetCode (), code)
          << "Got error " << ErrorCodeToString (exc.GetCode ())
          << ": " << exc.what ();
      return exc.what ();
    }

  return "";
}

} // namespace abc

#endif // ABC_TESTUTILS_HPP
