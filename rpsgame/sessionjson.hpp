// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSGAME_SESSIONJSON_HPP
#define RPSGAME_SESSIONJSON_HPP

#include "session.hpp"

#include "proto/round.pb.h"

#include <json/json.h>

namespace rps
{

/**
 * Converts the record of a finished round to JSON.
 */
Json::Value RoundRecordToJson (const proto::RoundRecord& rec);

/**
 * Returns the full state of a session as JSON:  The current round and
 * phase, all players with their state in the current round, the scores
 * and the history of finished rounds.
 *
 * Choices of players are only included once they have revealed, and
 * commitments only once they have been made.
 */
Json::Value SessionToJson (const Session& s);

} // namespace rps

#endif // RPSGAME_SESSIONJSON_HPP
