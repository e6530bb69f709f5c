// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "digest.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cstdint>

namespace rps
{

namespace
{

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/**
 * Decodes a single hex character.  Returns false if it is not one.
 */
bool
DecodeNibble (const char c, uint_fast8_t& nibble)
{
  if (c >= '0' && c <= '9')
    nibble = c - '0';
  else if (c >= 'a' && c <= 'f')
    nibble = 0xA + (c - 'a');
  else if (c >= 'A' && c <= 'F')
    nibble = 0xA + (c - 'A');
  else
    return false;

  return true;
}

} // anonymous namespace

Digest::Digest ()
{
  SetNull ();
}

std::string
Digest::ToHex () const
{
  std::string res;
  res.reserve (2 * NUM_BYTES);

  for (const unsigned char b : data)
    {
      res.push_back (HEX_DIGITS[b >> 4]);
      res.push_back (HEX_DIGITS[b & 0x0F]);
    }

  return res;
}

bool
Digest::FromHex (const std::string& hex)
{
  if (hex.size () != 2 * NUM_BYTES)
    {
      LOG (WARNING)
          << "Digest hex string has " << hex.size ()
          << " characters instead of " << 2 * NUM_BYTES;
      return false;
    }

  Array parsed;
  for (size_t i = 0; i < NUM_BYTES; ++i)
    {
      uint_fast8_t hi, lo;
      if (!DecodeNibble (hex[2 * i], hi) || !DecodeNibble (hex[2 * i + 1], lo))
        {
          LOG (WARNING) << "Invalid hex character in digest string: " << hex;
          return false;
        }
      parsed[i] = (hi << 4) | lo;
    }

  data = parsed;
  return true;
}

void
Digest::FromBlob (const unsigned char* blob)
{
  CHECK (blob != nullptr);
  std::copy (blob, blob + NUM_BYTES, data.begin ());
}

std::string
Digest::GetBinaryString () const
{
  return std::string (reinterpret_cast<const char*> (GetBlob ()), NUM_BYTES);
}

bool
Digest::IsNull () const
{
  return std::all_of (data.begin (), data.end (),
                      [] (const unsigned char b) { return b == 0; });
}

void
Digest::SetNull ()
{
  data.fill (0);
}

} // namespace rps
