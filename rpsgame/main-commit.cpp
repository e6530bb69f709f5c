// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "choice.hpp"
#include "commitment.hpp"

#include <rpsutil/saltgen.hpp>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace
{

DEFINE_string (choice, "", "the choice to commit to (Rock, Paper, Scissors)");
DEFINE_string (salt, "",
               "the salt to use; if empty, a fresh random salt is generated");

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Compute a commit hash for a Rock-Paper-Scissors"
                           " choice");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  rps::proto::Choice parsed;
  if (!rps::ParseChoice (FLAGS_choice, true, parsed))
    {
      std::cerr << "Error: --choice must be one of Rock, Paper, Scissors"
                << std::endl;
      return EXIT_FAILURE;
    }

  std::string salt = FLAGS_salt;
  if (salt.empty ())
    {
      rps::SaltGenerator gen;
      salt = gen.NewSalt ();
    }

  const rps::Commitment c = rps::Commit (rps::ChoiceToString (parsed), salt);
  std::cout << "salt: " << salt << std::endl;
  std::cout << "commitment: " << c.ToHex () << std::endl;

  return EXIT_SUCCESS;
}
