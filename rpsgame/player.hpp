// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSGAME_PLAYER_HPP
#define RPSGAME_PLAYER_HPP

#include "commitment.hpp"

#include "proto/round.pb.h"

#include <ostream>
#include <string>

namespace rps
{

/**
 * Outcome of a reveal attempt by a player.
 */
enum class RevealResult
{

  /** The reveal matched and the choice has been recorded.  */
  OK,

  /** There is no player with the given name.  */
  UNKNOWN_PLAYER,

  /** The player has not committed yet in this round.  */
  NOT_COMMITTED,

  /** The player has already revealed successfully in this round.  */
  ALREADY_REVEALED,

  /** Choice and salt do not hash to the stored commitment.  */
  MISMATCH,

  /**
   * Choice and salt match the commitment, but the choice string is not
   * a valid move.  The player stays unrevealed.
   */
  INVALID_CHOICE,

};

std::ostream& operator<< (std::ostream& out, RevealResult r);

/**
 * A player in a session, with the state of the current round.  Each round
 * goes through AWAITING_COMMIT, AWAITING_REVEAL and REVEALED in order; the
 * only way into REVEALED is a reveal that matches the stored commitment.
 */
class PlayerEntry
{

public:

  enum class State
  {
    AWAITING_COMMIT,
    AWAITING_REVEAL,
    REVEALED,
  };

private:

  std::string name;

  State state = State::AWAITING_COMMIT;

  /** The commitment for this round.  Null until one has been set.  */
  Commitment commitment;

  /** The revealed choice, EMPTY until revealed.  */
  proto::Choice choice = proto::EMPTY;

public:

  explicit PlayerEntry (const std::string& n)
    : name(n)
  {}

  PlayerEntry (const PlayerEntry&) = default;
  PlayerEntry (PlayerEntry&&) = default;
  PlayerEntry& operator= (const PlayerEntry&) = default;
  PlayerEntry& operator= (PlayerEntry&&) = default;

  const std::string&
  GetName () const
  {
    return name;
  }

  State
  GetState () const
  {
    return state;
  }

  /**
   * Returns the stored commitment.  Must only be called after one has
   * been set this round.
   */
  const Commitment& GetCommitment () const;

  proto::Choice
  GetChoice () const
  {
    return choice;
  }

  /**
   * Stores the commitment for this round.  Must only be called while
   * the player is still awaiting it.
   */
  void SetCommitment (const Commitment& c);

  /**
   * Tries to reveal with the given choice string and salt.  Only if the
   * result is OK has the state changed.
   */
  RevealResult TryReveal (const std::string& choiceStr,
                          const std::string& salt, bool caseSensitive);

  /**
   * Clears commitment and choice so that a new round can start.
   */
  void ResetForNextRound ();

};

} // namespace rps

#endif // RPSGAME_PLAYER_HPP
