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

#include "requests.hpp"

#include "jsonutils.hpp"
#include "protoutils.hpp"

#include <google/protobuf/util/json_util.h>

#include <glog/logging.h>

#include <memory>
#include <sstream>

namespace abc
{

namespace
{

/**
 * Serialises a JSON value to a compact string on a single line.
 */
std::string
JsonToLine (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["indentation"] = "";
  return Json::writeString (wbuilder, val);
}

/**
 * Fails with an invalid-request error.
 */
[[noreturn]] void
InvalidRequest (const std::string& msg)
{
  ReturnError (ErrorCode::INVALID_REQUEST, msg);
}

/**
 * Checks that the value is an object with exactly one member, and returns
 * the name of it.
 */
std::string
GetSingleKey (const Json::Value& val, const std::string& what)
{
  if (!val.isObject () || val.size () != 1)
    {
      std::ostringstream msg;
      msg << what << " must be an object with exactly one key";
      InvalidRequest (msg.str ());
    }

  return val.getMemberNames ().front ();
}

/**
 * Checks that the argument of a message without parameters is an
 * empty object.
 */
void
ExpectEmptyObject (const Json::Value& val, const std::string& what)
{
  if (!val.isObject () || !val.empty ())
    InvalidRequest (what + " does not take any arguments");
}

Json::Value
PhaseToJson (const CommonsPhase& phase)
{
  Json::Value hatchers(Json::arrayValue);
  for (const auto& h : phase.GetHatchers ())
    hatchers.append (h);

  Json::Value res(Json::objectValue);
  res["phase"] = PhaseKindToString (phase.GetKind ());
  res["hatchers"] = hatchers;

  return res;
}

Json::Value
PhaseConfigToJson (const PhaseConfig& config)
{
  google::protobuf::util::JsonPrintOptions opt;
  opt.preserve_proto_field_names = true;

  std::string str;
  const auto status = google::protobuf::util::MessageToJsonString (
      PhaseConfigToProto (config), &str, opt);
  CHECK (status.ok ()) << "Failed to convert phase config: " << status;

  Json::Value res;
  std::istringstream in(str);
  in >> res;

  return res;
}

} // anonymous namespace

Json::Value
ErrorToJson (const SaleError& err)
{
  Json::Value inner(Json::objectValue);
  inner["code"] = ErrorCodeToString (err.GetCode ());
  inner["number"] = static_cast<int> (err.GetCode ());
  inner["message"] = err.what ();

  Json::Value res(Json::objectValue);
  res["error"] = inner;

  return res;
}

Json::Value
RequestProcessor::ProcessInstantiate (const std::string& sender,
                                      const Funds& funds,
                                      const Json::Value& msg)
{
  if (!msg.isObject ())
    InvalidRequest ("instantiate message must be an object");

  google::protobuf::util::JsonParseOptions opt;
  opt.ignore_unknown_fields = false;

  proto::InstantiateMsg pb;
  const auto status = google::protobuf::util::JsonStringToMessage (
      JsonToLine (msg), &pb, opt);
  if (!status.ok ())
    {
      std::ostringstream err;
      err << "invalid instantiate message: " << status;
      InvalidRequest (err.str ());
    }

  return contract.Instantiate (sender, funds, pb).ToJson ();
}

Json::Value
RequestProcessor::ProcessExecute (const std::string& sender,
                                  const Funds& funds,
                                  const Json::Value& msg)
{
  const std::string type = GetSingleKey (msg, "execute message");
  const Json::Value& args = msg[type];

  if (type == "buy")
    {
      ExpectEmptyObject (args, "buy");
      return contract.Buy (sender, funds).ToJson ();
    }

  if (type == "burn")
    {
      if (!args.isObject () || args.size () != 1)
        InvalidRequest ("burn expects exactly an amount");

      Amount amount;
      if (!AmountFromJson (args["amount"], amount))
        InvalidRequest ("invalid burn amount: " + JsonToLine (args["amount"]));

      return contract.Burn (sender, funds, amount).ToJson ();
    }

  InvalidRequest ("unknown execute message: " + type);
}

Json::Value
RequestProcessor::ProcessQuery (const Json::Value& msg)
{
  const std::string type = GetSingleKey (msg, "query message");
  ExpectEmptyObject (msg[type], type);

  if (type == "curve_info")
    return contract.QueryCurveInfo ().ToJson ();
  if (type == "phase")
    return PhaseToJson (contract.QueryPhase ());
  if (type == "phase_config")
    return PhaseConfigToJson (contract.QueryPhaseConfig ());
  if (type == "supply_denom")
    {
      Json::Value res(Json::objectValue);
      res["denom"] = contract.QuerySupplyDenom ();
      return res;
    }

  InvalidRequest ("unknown query: " + type);
}

Json::Value
RequestProcessor::ProcessUnchecked (const Json::Value& request)
{
  if (!request.isObject ())
    InvalidRequest ("request must be a JSON object");

  const bool hasInstantiate = request.isMember ("instantiate");
  const bool hasExecute = request.isMember ("execute");
  const bool hasQuery = request.isMember ("query");
  const int numMessages = hasInstantiate + hasExecute + hasQuery;
  if (numMessages != 1)
    InvalidRequest ("request must contain exactly one of"
                    " instantiate, execute and query");

  if (hasQuery)
    return ProcessQuery (request["query"]);

  const Json::Value& senderVal = request["sender"];
  if (!senderVal.isString () || senderVal.asString ().empty ())
    InvalidRequest ("request has no valid sender");
  const std::string sender = senderVal.asString ();

  Funds funds;
  if (!FundsFromJson (request["funds"], funds))
    InvalidRequest ("invalid funds: " + JsonToLine (request["funds"]));

  if (hasInstantiate)
    return ProcessInstantiate (sender, funds, request["instantiate"]);

  return ProcessExecute (sender, funds, request["execute"]);
}

Json::Value
RequestProcessor::Process (const Json::Value& request)
{
  VLOG (1) << "Processing request:\n" << request;

  try
    {
      return ProcessUnchecked (request);
    }
  catch (const SaleError& exc)
    {
      LOG (WARNING)
          << "Request failed with " << ErrorCodeToString (exc.GetCode ())
          << " error: " << exc.what ();
      return ErrorToJson (exc);
    }
}

std::string
RequestProcessor::ProcessLine (const std::string& line)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["failIfExtra"] = true;
  const std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader ());

  Json::Value request;
  std::string parseErrors;
  if (!reader->parse (line.data (), line.data () + line.size (),
                      &request, &parseErrors))
    {
      LOG (WARNING) << "Invalid JSON request: " << parseErrors;
      const SaleError err(ErrorCode::INVALID_REQUEST,
                          "request is not valid JSON: " + parseErrors);
      return JsonToLine (ErrorToJson (err));
    }

  return JsonToLine (Process (request));
}

} // namespace abc
