// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <glog/logging.h>

#include <openssl/evp.h>

#include <cstddef>

namespace rps
{

/**
 * Owns an OpenSSL EVP_MD_CTX set up for SHA-256.  Once the result has been
 * extracted, the context is marked as done and further updates fail.
 */
class SHA256::Context
{

private:

  EVP_MD_CTX* const md;

  bool done = false;

public:

  Context ()
    : md(EVP_MD_CTX_new ())
  {
    CHECK (md != nullptr) << "Failed to allocate EVP_MD_CTX";
    CHECK_EQ (EVP_DigestInit_ex (md, EVP_sha256 (), nullptr), 1);
  }

  ~Context ()
  {
    EVP_MD_CTX_free (md);
  }

  Context (const Context&) = delete;
  void operator= (const Context&) = delete;

  void
  Update (const void* bytes, const size_t len)
  {
    CHECK (!done) << "SHA256 instance has already been finalised";
    if (len > 0)
      CHECK_EQ (EVP_DigestUpdate (md, bytes, len), 1);
  }

  Digest
  Final ()
  {
    CHECK (!done) << "SHA256 instance has already been finalised";
    done = true;

    static_assert (EVP_MAX_MD_SIZE >= Digest::NUM_BYTES,
                   "EVP output buffer is too small for a Digest");
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned outLen = 0;
    CHECK_EQ (EVP_DigestFinal_ex (md, out, &outLen), 1);
    CHECK_EQ (outLen, Digest::NUM_BYTES);

    Digest res;
    res.FromBlob (out);
    return res;
  }

};

SHA256::SHA256 ()
  : ctx(std::make_unique<Context> ())
{}

SHA256::~SHA256 () = default;

SHA256&
SHA256::operator<< (const std::string& data)
{
  ctx->Update (data.data (), data.size ());
  return *this;
}

SHA256&
SHA256::operator<< (const Digest& data)
{
  ctx->Update (data.GetBlob (), Digest::NUM_BYTES);
  return *this;
}

Digest
SHA256::Finalise ()
{
  return ctx->Final ();
}

Digest
SHA256::Hash (const std::string& data)
{
  SHA256 hasher;
  hasher << data;
  return hasher.Finalise ();
}

} // namespace rps
