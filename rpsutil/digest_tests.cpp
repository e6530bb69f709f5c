// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "digest.hpp"

#include <gtest/gtest.h>

#include <string>

namespace rps
{
namespace
{

constexpr const char* SOME_HEX
    = "2e773fdbfcb9e80875ce3f2f44a4d17fd9d6a62023cad54bc79f394403e6a6ab";

using DigestTests = testing::Test;

TEST_F (DigestTests, DefaultIsNull)
{
  Digest d;
  EXPECT_TRUE (d.IsNull ());
  EXPECT_EQ (d.ToHex (), std::string (64, '0'));
}

TEST_F (DigestTests, HexRoundTrip)
{
  Digest d;
  ASSERT_TRUE (d.FromHex (SOME_HEX));
  EXPECT_FALSE (d.IsNull ());
  EXPECT_EQ (d.ToHex (), SOME_HEX);
  EXPECT_EQ (d.GetBlob ()[0], 0x2e);
  EXPECT_EQ (d.GetBlob ()[Digest::NUM_BYTES - 1], 0xab);
}

TEST_F (DigestTests, UpperCaseHexAccepted)
{
  Digest lower, upper;
  ASSERT_TRUE (lower.FromHex (SOME_HEX));
  ASSERT_TRUE (upper.FromHex (
      "2E773FDBFCB9E80875CE3F2F44A4D17FD9D6A62023CAD54BC79F394403E6A6AB"));
  EXPECT_EQ (lower, upper);
  EXPECT_EQ (upper.ToHex (), SOME_HEX);
}

TEST_F (DigestTests, InvalidHex)
{
  Digest d;
  ASSERT_TRUE (d.FromHex (SOME_HEX));

  EXPECT_FALSE (d.FromHex (""));
  EXPECT_FALSE (d.FromHex ("2e773f"));
  EXPECT_FALSE (d.FromHex (std::string (SOME_HEX) + "00"));
  EXPECT_FALSE (d.FromHex (
      "2e773fdbfcb9e80875ce3f2f44a4d17fd9d6a62023cad54bc79f394403e6a6ag"));
  EXPECT_FALSE (d.FromHex (
      " e773fdbfcb9e80875ce3f2f44a4d17fd9d6a62023cad54bc79f394403e6a6ab"));

  /* Failed parses leave the old value in place.  */
  EXPECT_EQ (d.ToHex (), SOME_HEX);
}

TEST_F (DigestTests, BlobAndBinaryString)
{
  Digest d;
  ASSERT_TRUE (d.FromHex (SOME_HEX));

  const std::string bin = d.GetBinaryString ();
  ASSERT_EQ (bin.size (), Digest::NUM_BYTES);
  EXPECT_EQ (bin[0], static_cast<char> (0x2e));

  Digest copy;
  copy.FromBlob (reinterpret_cast<const unsigned char*> (bin.data ()));
  EXPECT_EQ (copy, d);
}

TEST_F (DigestTests, Comparison)
{
  Digest a, b;
  ASSERT_TRUE (a.FromHex (SOME_HEX));
  ASSERT_TRUE (b.FromHex (
      "2e773fdbfcb9e80875ce3f2f44a4d17fd9d6a62023cad54bc79f394403e6a6ac"));

  EXPECT_NE (a, b);
  EXPECT_TRUE (a < b);
  EXPECT_FALSE (b < a);

  b = a;
  EXPECT_EQ (a, b);

  b.SetNull ();
  EXPECT_TRUE (b.IsNull ());
  EXPECT_TRUE (b < a);
}

} // anonymous namespace
} // namespace rps
