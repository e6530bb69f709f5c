// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSGAME_CHOICE_HPP
#define RPSGAME_CHOICE_HPP

#include "proto/round.pb.h"

#include <string>

namespace rps
{

/**
 * Returns the canonical name of a choice ("Rock", "Paper", "Scissors"
 * or "Empty").
 */
std::string ChoiceToString (proto::Choice c);

/**
 * Parses a revealed choice string.  With caseSensitive set, only the exact
 * canonical names are accepted; otherwise any casing of them is.  Returns
 * false for everything else, including the name of the EMPTY marker.
 */
bool ParseChoice (const std::string& str, bool caseSensitive,
                  proto::Choice& c);

/**
 * Returns true if a beats b.  Both must be actual moves, not EMPTY.
 */
bool Beats (proto::Choice a, proto::Choice b);

} // namespace rps

#endif // RPSGAME_CHOICE_HPP
