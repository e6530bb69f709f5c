// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSGAME_SCORING_HPP
#define RPSGAME_SCORING_HPP

#include "proto/round.pb.h"

#include <map>
#include <string>
#include <vector>

namespace rps
{

/**
 * A player's verified choice for a round, as input to the scorer.
 */
struct RevealedChoice
{
  std::string name;
  proto::Choice choice;
};

/**
 * Points gained by a player in a round.
 */
struct ScoreDelta
{
  std::string name;
  unsigned delta;
};

/**
 * Resolves a round in round-robin fashion:  Every unordered pair of players
 * is compared once, and the winner of each pairing (if it is not a tie)
 * gains one point.  The result has one entry per input, in the same order.
 *
 * All choices must be actual moves and all names distinct; EMPTY choices
 * mean the caller started scoring before every reveal was done, which is
 * a fatal error.
 */
std::vector<ScoreDelta> ScoreRound (const std::vector<RevealedChoice>& revealed);

/**
 * Accumulated scores of all players in a session.  Players are added once
 * with zero points, and their scores can only grow afterwards.
 */
class ScoreTable
{

private:

  /** Player names in the order they were added.  */
  std::vector<std::string> names;

  /** Current score for each player.  */
  std::map<std::string, unsigned> scores;

public:

  ScoreTable () = default;

  ScoreTable (const ScoreTable&) = default;
  ScoreTable& operator= (const ScoreTable&) = default;

  /**
   * Adds a new player with zero points.  Returns false if the name is
   * already present.
   */
  bool AddPlayer (const std::string& name);

  bool HasPlayer (const std::string& name) const;

  /**
   * Returns the score of a player, which must exist.
   */
  unsigned GetScore (const std::string& name) const;

  /**
   * Adds the deltas of a round onto the scores.  All names must be
   * known players.
   */
  void ApplyDeltas (const std::vector<ScoreDelta>& deltas);

  const std::vector<std::string>&
  GetNames () const
  {
    return names;
  }

  size_t
  size () const
  {
    return names.size ();
  }

};

} // namespace rps

#endif // RPSGAME_SCORING_HPP
