// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSGAME_SESSION_HPP
#define RPSGAME_SESSION_HPP

#include "commitment.hpp"
#include "player.hpp"
#include "scoring.hpp"

#include "proto/round.pb.h"

#include <ostream>
#include <string>
#include <vector>

namespace rps
{

/**
 * A game session:  A fixed set of players that play one or more rounds,
 * with their scores accumulated over all rounds.
 *
 * Each round has a commit phase and a reveal phase.  Reveals are only
 * accepted once every player has committed, so that nobody can learn
 * another player's choice before locking in their own.  When all players
 * have revealed, the round is scored.
 *
 * Players are registered together with their commitment for the first
 * round.  For later rounds, commitments are submitted after StartRound.
 * Calling methods in the wrong phase is a programming error and fatal.
 */
class Session
{

public:

  enum class Phase
  {
    /** Players are being added, round one has not started.  */
    REGISTRATION,
    /** Collecting commitments for the current round.  */
    COMMIT,
    /** All commitments are in, collecting reveals.  */
    REVEAL,
    /** The current round has been scored.  */
    FINISHED_ROUND,
  };

  /** Minimum number of players for a game.  */
  static constexpr size_t MIN_PLAYERS = 2;

private:

  /** Whether choice strings are matched case-sensitively.  */
  const bool caseSensitive;

  /** All players, in registration order.  */
  std::vector<PlayerEntry> players;

  ScoreTable scores;

  /** Records of all scored rounds.  */
  std::vector<proto::RoundRecord> history;

  /** Current round number, zero before the first round.  */
  unsigned round = 0;

  Phase phase = Phase::REGISTRATION;

  /**
   * Looks up a player by name.  Returns null if there is none.
   */
  PlayerEntry* FindPlayer (const std::string& name);

public:

  explicit Session (bool cs = true)
    : caseSensitive(cs)
  {}

  Session (const Session&) = delete;
  void operator= (const Session&) = delete;

  /**
   * Registers a new player with their commitment for the first round.
   * Returns false if the name is empty or already taken.
   */
  bool AddPlayer (const std::string& name, const Commitment& c);

  /**
   * Starts the next round.  For the first round, this closes registration
   * (at least MIN_PLAYERS are required).  Afterwards, it may only be called
   * when the previous round has been scored, and resets all players.
   */
  void StartRound ();

  /**
   * Stores a commitment for the current round.  Returns false if the
   * player is unknown or has already committed.
   */
  bool SubmitCommitment (const std::string& name, const Commitment& c);

  /**
   * Returns true if every player has a commitment for the current round.
   */
  bool AllCommitted () const;

  /**
   * Ends the commit phase.  All players must have committed.
   */
  void BeginReveal ();

  /**
   * Processes a reveal attempt by the given player.
   */
  RevealResult SubmitReveal (const std::string& name,
                             const std::string& choice,
                             const std::string& salt);

  /**
   * Returns true if every player has revealed in the current round.
   */
  bool AllRevealed () const;

  /**
   * Scores the current round, once all players have revealed.  The deltas
   * are added to the score table, and the record of the round is returned
   * (and also stored in the history).
   */
  const proto::RoundRecord& ScoreCurrentRound ();

  Phase
  GetPhase () const
  {
    return phase;
  }

  unsigned
  GetRound () const
  {
    return round;
  }

  bool
  IsCaseSensitive () const
  {
    return caseSensitive;
  }

  const std::vector<PlayerEntry>&
  GetPlayers () const
  {
    return players;
  }

  const ScoreTable&
  GetScores () const
  {
    return scores;
  }

  const std::vector<proto::RoundRecord>&
  GetHistory () const
  {
    return history;
  }

};

std::ostream& operator<< (std::ostream& out, Session::Phase p);

} // namespace rps

#endif // RPSGAME_SESSION_HPP
