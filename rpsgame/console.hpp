// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPSGAME_CONSOLE_HPP
#define RPSGAME_CONSOLE_HPP

#include "commitment.hpp"
#include "session.hpp"

#include "proto/round.pb.h"

#include <istream>
#include <ostream>
#include <string>

namespace rps
{

/**
 * How often a prompt is repeated when the input is not acceptable.
 */
struct RetryPolicy
{

  /**
   * Maximum number of attempts per value that is collected.  Zero means
   * that invalid input is re-prompted forever.
   */
  unsigned maxAttempts = 0;

  static RetryPolicy
  Unbounded ()
  {
    return RetryPolicy ();
  }

  static RetryPolicy
  Bounded (const unsigned n)
  {
    RetryPolicy res;
    res.maxAttempts = n;
    return res;
  }

};

/**
 * Text front-end for playing a session with all players at one console.
 * It prompts for and validates all input, feeds it into the Session and
 * prints the results.
 *
 * Input is read line by line, with surrounding whitespace stripped.  The
 * methods returning bool give up (returning false) when the input ends
 * or the retry policy is exhausted; the session is then unusable for
 * further play.
 */
class ConsoleFrontEnd
{

private:

  std::istream& in;
  std::ostream& out;

  const RetryPolicy policy;

  /**
   * Prints the prompt and reads the next line into the given string.
   * Returns false if the input has ended.
   */
  bool ReadLine (const std::string& prompt, std::string& line);

  /**
   * Prompts for a commitment in hex until a valid one is entered.
   */
  bool CollectCommitment (const std::string& prompt, Commitment& c);

public:

  explicit ConsoleFrontEnd (std::istream& i, std::ostream& o,
                            const RetryPolicy& p = RetryPolicy::Unbounded ())
    : in(i), out(o), policy(p)
  {}

  ConsoleFrontEnd (const ConsoleFrontEnd&) = delete;
  void operator= (const ConsoleFrontEnd&) = delete;

  /**
   * Asks for the number of players, which must be an integer of at
   * least Session::MIN_PLAYERS.
   */
  bool CollectPlayerCount (unsigned& count);

  /**
   * Asks each of count players for their name and first-round commitment,
   * and adds them to the session (which must still be in registration).
   */
  bool RegisterPlayers (Session& s, unsigned count);

  /**
   * Asks every player for their commitment in a round after the first.
   */
  bool CollectCommitments (Session& s);

  /**
   * Prints the commitments of the current round for everyone to see.
   */
  void PrintCommitments (const Session& s);

  /**
   * Asks every player in turn for the choice and salt, until they match
   * the commitment.
   */
  bool CollectReveals (Session& s);

  void PrintRoundResult (const proto::RoundRecord& rec);

  /**
   * Prints the accumulated score of every player, one per line.
   */
  void PrintScores (const Session& s);

  /**
   * Runs a full game in a fresh session:  Registration followed by the
   * given number of rounds, and the final score report.
   */
  bool Play (Session& s, unsigned rounds);

};

} // namespace rps

#endif // RPSGAME_CONSOLE_HPP
