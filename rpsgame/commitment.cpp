// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commitment.hpp"

#include <rpsutil/hash.hpp>

#include <glog/logging.h>

namespace rps
{

Commitment
Commit (const std::string& choice, const std::string& salt)
{
  SHA256 hasher;
  hasher << choice << salt;
  return hasher.Finalise ();
}

bool
VerifyReveal (const Commitment& commitment, const std::string& choice,
              const std::string& salt)
{
  const Commitment actual = Commit (choice, salt);
  if (actual != commitment)
    {
      VLOG (1)
          << "Reveal hashes to " << actual.ToHex ()
          << ", committed was " << commitment.ToHex ();
      return false;
    }

  return true;
}

} // namespace rps
