// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSGAME_COMMITMENT_HPP
#define RPSGAME_COMMITMENT_HPP

#include <rpsutil/digest.hpp>

#include <string>

namespace rps
{

/** A player's hash commitment to a choice.  */
using Commitment = Digest;

/**
 * Computes the commitment for a choice string and salt.  This is SHA-256 of
 * the raw bytes of choice followed directly by the salt.  The result only
 * hides the choice if the salt is fresh and unpredictable; ensuring that
 * is up to whoever picks the salt.
 */
Commitment Commit (const std::string& choice, const std::string& salt);

/**
 * Checks a revealed choice and salt against a previously stored commitment.
 * This compares the digests byte for byte and does not care whether the
 * choice string is a valid move.
 */
bool VerifyReveal (const Commitment& commitment, const std::string& choice,
                   const std::string& salt);

} // namespace rps

#endif // RPSGAME_COMMITMENT_HPP
