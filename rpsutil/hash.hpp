// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSUTIL_HASH_HPP
#define RPSUTIL_HASH_HPP

#include "digest.hpp"

#include <memory>
#include <string>

namespace rps
{

/**
 * Streaming SHA-256 hasher.  Data is fed in with operator<< and the result
 * is retrieved with Finalise.  Strings are hashed as their raw bytes without
 * any length prefix, so feeding "ab" and then "c" is the same as feeding
 * "abc" at once.
 */
class SHA256
{

private:

  /**
   * Wrapper around the OpenSSL digest context.  It is only declared here,
   * so that OpenSSL headers are not needed by users of this class.
   */
  class Context;

  std::unique_ptr<Context> ctx;

public:

  SHA256 ();
  ~SHA256 ();

  SHA256 (const SHA256&) = delete;
  void operator= (const SHA256&) = delete;

  SHA256& operator<< (const std::string& data);
  SHA256& operator<< (const Digest& data);

  /**
   * Completes the hash computation and returns the digest.  The instance
   * must not be used anymore afterwards.
   */
  Digest Finalise ();

  /**
   * Hashes a single string.
   */
  static Digest Hash (const std::string& data);

};

} // namespace rps

#endif // RPSUTIL_HASH_HPP
