// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSUTIL_SALTGEN_HPP
#define RPSUTIL_SALTGEN_HPP

#include "digest.hpp"

#include <string>

namespace rps
{

/**
 * Source of fresh salts for hash commitments, based on the operating
 * system's secure random number generator.  With only three possible
 * choices, a commitment is only hiding if every round uses a new,
 * unpredictable salt.
 */
class SaltGenerator
{

public:

  SaltGenerator () = default;

  SaltGenerator (const SaltGenerator&) = delete;
  void operator= (const SaltGenerator&) = delete;

  /**
   * Returns NUM_BYTES of secure random data.
   */
  Digest RandomBytes ();

  /**
   * Returns a new salt string, which is 32 random bytes in hex.
   */
  std::string NewSalt ();

};

} // namespace rps

#endif // RPSUTIL_SALTGEN_HPP
