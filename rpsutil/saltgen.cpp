// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "saltgen.hpp"

#include <glog/logging.h>

#include <openssl/rand.h>

namespace rps
{

Digest
SaltGenerator::RandomBytes ()
{
  unsigned char bytes[Digest::NUM_BYTES];
  CHECK_EQ (RAND_bytes (bytes, Digest::NUM_BYTES), 1)
      << "OpenSSL failed to produce random bytes";

  Digest res;
  res.FromBlob (bytes);

  return res;
}

std::string
SaltGenerator::NewSalt ()
{
  return RandomBytes ().ToHex ();
}

} // namespace rps
