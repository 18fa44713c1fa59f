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

#include "config.h"

#include "contract.hpp"
#include "errors.hpp"
#include "requests.hpp"

#include "database/database.hpp"
#include "database/schema.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace
{

DEFINE_string (datafile, "",
               "SQLite database file holding the state of the sale");
DEFINE_string (contract_address, "",
               "address of the contract, used to build the supply denom");
DEFINE_string (init_config, "",
               "if set, a text-format InstantiateMsg with which the sale is"
               " instantiated on start-up if it does not exist yet");

/**
 * Instantiates the contract from the text-format config file given
 * by --init_config.  Returns false if that failed.
 */
bool
InstantiateFromFile (abc::Contract& contract, const std::string& file)
{
  std::ifstream in(file);
  if (!in)
    {
      LOG (ERROR) << "Could not open init config " << file;
      return false;
    }

  std::ostringstream data;
  data << in.rdbuf ();

  try
    {
      const auto res = abc::InstantiateFromText (contract, data.str ());
      LOG (INFO) << "Instantiated the sale:\n" << res.ToJson ();
    }
  catch (const abc::SaleError& exc)
    {
      LOG (ERROR)
          << "Instantiation from " << file << " failed with "
          << abc::ErrorCodeToString (exc.GetCode ()) << " error: "
          << exc.what ();
      return false;
    }

  return true;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  LOG (INFO) << "Running ABC sale engine version " << PACKAGE_VERSION;

  gflags::SetUsageMessage ("Run the bonding-curve sale daemon");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_datafile.empty ())
    {
      std::cerr << "Error: --datafile must be specified" << std::endl;
      return EXIT_FAILURE;
    }
  if (FLAGS_contract_address.empty ())
    {
      std::cerr << "Error: --contract_address must be set" << std::endl;
      return EXIT_FAILURE;
    }

  int rc = EXIT_SUCCESS;
  {
    abc::Database db(FLAGS_datafile);
    abc::SetupDatabaseSchema (*db);

    abc::Contract contract(db, FLAGS_contract_address);
    if (!FLAGS_init_config.empty () && !contract.IsInstantiated ()
          && !InstantiateFromFile (contract, FLAGS_init_config))
      rc = EXIT_FAILURE;

    if (rc == EXIT_SUCCESS)
      {
        abc::RequestProcessor proc(contract);
        LOG (INFO) << "Reading requests from stdin...";

        std::string line;
        while (std::getline (std::cin, line))
          {
            if (line.empty ())
              continue;
            std::cout << proc.ProcessLine (line) << std::endl;
          }

        LOG (INFO) << "End of input, shutting down";
      }
  }

  google::protobuf::ShutdownProtobufLibrary ();
  return rc;
}
