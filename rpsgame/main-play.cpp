// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "console.hpp"
#include "session.hpp"
#include "sessionjson.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <json/json.h>

#include <google/protobuf/stubs/common.h>

#include <cstdlib>
#include <iostream>

namespace
{

DEFINE_int32 (rounds, 1, "number of rounds to play");
DEFINE_int32 (max_attempts, 0,
              "how often to ask for a value before giving up when the input"
              " is invalid (zero means to ask again forever)");
DEFINE_bool (case_insensitive_choices, false,
             "whether revealed choices like 'rock' or 'ROCK' are accepted"
             " in addition to 'Rock'");
DEFINE_bool (json_report, false,
             "whether to print the full session state as JSON at the end");

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  gflags::SetUsageMessage ("Play Rock-Paper-Scissors with hash commitments");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_rounds < 1)
    {
      std::cerr << "Error: --rounds must be at least one" << std::endl;
      return EXIT_FAILURE;
    }
  if (FLAGS_max_attempts < 0)
    {
      std::cerr << "Error: --max_attempts must not be negative" << std::endl;
      return EXIT_FAILURE;
    }

  rps::Session session(!FLAGS_case_insensitive_choices);
  rps::ConsoleFrontEnd frontEnd(
      std::cin, std::cout, rps::RetryPolicy::Bounded (FLAGS_max_attempts));

  const bool ok = frontEnd.Play (session, FLAGS_rounds);
  if (!ok)
    LOG (ERROR) << "Game aborted in round " << session.GetRound ();

  if (FLAGS_json_report)
    std::cout << rps::SessionToJson (session) << std::endl;

  google::protobuf::ShutdownProtobufLibrary ();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
