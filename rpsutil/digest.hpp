// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSUTIL_DIGEST_HPP
#define RPSUTIL_DIGEST_HPP

#include <array>
#include <cstddef>
#include <string>

namespace rps
{

/**
 * A fixed-size 256-bit digest, as produced by the SHA-256 hasher.  It can be
 * compared and converted to/from hex and raw bytes, but has no arithmetic.
 * This is the representation of hash commitments made by players.
 */
class Digest final
{

public:

  static constexpr size_t NUM_BYTES = 256 / 8;

private:

  using Array = std::array<unsigned char, NUM_BYTES>;

  /** The raw bytes in the order the hash function output them.  */
  Array data;

public:

  /**
   * Constructs a digest with all bytes zero.
   */
  Digest ();

  Digest (const Digest&) = default;
  Digest (Digest&&) = default;

  Digest& operator= (const Digest&) = default;
  Digest& operator= (Digest&&) = default;

  /**
   * Converts the digest to a lower-case hex string of 2 * NUM_BYTES
   * characters.
   */
  std::string ToHex () const;

  /**
   * Parses a hex string (upper or lower case) into this object.  Returns
   * false and leaves the value unchanged if the string is not valid, i.e.
   * has the wrong length or invalid characters.
   */
  bool FromHex (const std::string& hex);

  /**
   * Returns a pointer to the raw bytes, NUM_BYTES of them.
   */
  const unsigned char*
  GetBlob () const
  {
    return data.data ();
  }

  /**
   * Sets the data from a raw blob of bytes, which must be of length NUM_BYTES.
   */
  void FromBlob (const unsigned char* blob);

  /**
   * Returns the raw bytes as std::string.
   */
  std::string GetBinaryString () const;

  /**
   * Checks if this is the all-zero value, which is used as "unset" marker
   * since it will not come out of a hash function in practice.
   */
  bool IsNull () const;

  void SetNull ();

  friend bool
  operator== (const Digest& a, const Digest& b)
  {
    return a.data == b.data;
  }

  friend bool
  operator!= (const Digest& a, const Digest& b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const Digest& a, const Digest& b)
  {
    return a.data < b.data;
  }

};

} // namespace rps

#endif // RPSUTIL_DIGEST_HPP
