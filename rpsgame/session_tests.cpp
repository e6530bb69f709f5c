// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "session.hpp"

#include "choice.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <string>

namespace rps
{
namespace
{

class SessionTests : public testing::Test
{

protected:

  Session session;

  /**
   * Registers a player with a commitment to the given choice and a salt
   * derived from the name.
   */
  void
  AddPlayer (const std::string& name, const proto::Choice c)
  {
    ASSERT_TRUE (session.AddPlayer (
        name, Commit (ChoiceToString (c), "salt " + name)));
  }

  /**
   * Submits a commitment for the current round.
   */
  void
  CommitFor (const std::string& name, const proto::Choice c)
  {
    ASSERT_TRUE (session.SubmitCommitment (
        name, Commit (ChoiceToString (c), "salt " + name)));
  }

  /**
   * Reveals the choice matching what AddPlayer or CommitFor did.
   */
  RevealResult
  Reveal (const std::string& name, const proto::Choice c)
  {
    return session.SubmitReveal (name, ChoiceToString (c), "salt " + name);
  }

};

TEST_F (SessionTests, FullRound)
{
  EXPECT_EQ (session.GetPhase (), Session::Phase::REGISTRATION);
  EXPECT_EQ (session.GetRound (), 0);

  AddPlayer ("a", proto::ROCK);
  AddPlayer ("b", proto::ROCK);
  AddPlayer ("c", proto::SCISSORS);

  session.StartRound ();
  EXPECT_EQ (session.GetRound (), 1);
  EXPECT_EQ (session.GetPhase (), Session::Phase::COMMIT);
  EXPECT_TRUE (session.AllCommitted ());

  session.BeginReveal ();
  EXPECT_EQ (session.GetPhase (), Session::Phase::REVEAL);
  EXPECT_FALSE (session.AllRevealed ());

  EXPECT_EQ (Reveal ("a", proto::ROCK), RevealResult::OK);
  EXPECT_EQ (Reveal ("b", proto::ROCK), RevealResult::OK);
  EXPECT_FALSE (session.AllRevealed ());
  EXPECT_EQ (Reveal ("c", proto::SCISSORS), RevealResult::OK);
  EXPECT_TRUE (session.AllRevealed ());

  const auto& rec = session.ScoreCurrentRound ();
  EXPECT_EQ (session.GetPhase (), Session::Phase::FINISHED_ROUND);

  EXPECT_EQ (rec.round (), 1);
  ASSERT_EQ (rec.participants_size (), 3);
  EXPECT_EQ (rec.participants (0).name (), "a");
  EXPECT_EQ (rec.participants (0).choice (), proto::ROCK);
  EXPECT_EQ (rec.participants (0).delta (), 1);
  EXPECT_EQ (rec.participants (1).delta (), 1);
  EXPECT_EQ (rec.participants (2).name (), "c");
  EXPECT_EQ (rec.participants (2).choice (), proto::SCISSORS);
  EXPECT_EQ (rec.participants (2).delta (), 0);
  EXPECT_EQ (rec.participants (2).commitment (),
             Commit ("Scissors", "salt c").GetBinaryString ());
  EXPECT_FALSE (rec.has_winner ());

  EXPECT_EQ (session.GetScores ().GetScore ("a"), 1);
  EXPECT_EQ (session.GetScores ().GetScore ("b"), 1);
  EXPECT_EQ (session.GetScores ().GetScore ("c"), 0);
  ASSERT_EQ (session.GetHistory ().size (), 1);
}

TEST_F (SessionTests, RegistrationRules)
{
  AddPlayer ("a", proto::ROCK);
  EXPECT_FALSE (session.AddPlayer ("a", Commit ("Paper", "x")));
  EXPECT_FALSE (session.AddPlayer ("", Commit ("Paper", "x")));

  EXPECT_EQ (session.GetPlayers ().size (), 1);
  EXPECT_EQ (session.GetScores ().size (), 1);
  EXPECT_DEATH (session.StartRound (), "Not enough players");

  AddPlayer ("b", proto::PAPER);
  session.StartRound ();
  EXPECT_DEATH (session.AddPlayer ("c", Commit ("Rock", "x")),
                "only be added before the first round");
}

TEST_F (SessionTests, ScoreKeysMatchPlayers)
{
  AddPlayer ("x", proto::PAPER);
  AddPlayer ("y", proto::ROCK);
  AddPlayer ("z", proto::SCISSORS);

  const auto& players = session.GetPlayers ();
  const auto& names = session.GetScores ().GetNames ();
  ASSERT_EQ (players.size (), names.size ());
  for (size_t i = 0; i < players.size (); ++i)
    EXPECT_EQ (players[i].GetName (), names[i]);
}

TEST_F (SessionTests, FailedRevealsKeepState)
{
  AddPlayer ("a", proto::PAPER);
  AddPlayer ("b", proto::ROCK);
  session.StartRound ();
  session.BeginReveal ();

  EXPECT_EQ (session.SubmitReveal ("a", "Rock", "salt a"),
             RevealResult::MISMATCH);
  EXPECT_EQ (session.SubmitReveal ("a", "Paper", "wrong"),
             RevealResult::MISMATCH);
  EXPECT_EQ (session.SubmitReveal ("nobody", "Paper", "salt a"),
             RevealResult::UNKNOWN_PLAYER);
  EXPECT_EQ (session.GetPlayers ()[0].GetState (),
             PlayerEntry::State::AWAITING_REVEAL);
  EXPECT_EQ (session.GetPlayers ()[0].GetChoice (), proto::EMPTY);

  EXPECT_EQ (Reveal ("a", proto::PAPER), RevealResult::OK);
  EXPECT_EQ (Reveal ("a", proto::PAPER), RevealResult::ALREADY_REVEALED);
  EXPECT_DEATH (session.ScoreCurrentRound (), "Not all players have revealed");

  EXPECT_EQ (Reveal ("b", proto::ROCK), RevealResult::OK);
  const auto& rec = session.ScoreCurrentRound ();
  ASSERT_TRUE (rec.has_winner ());
  EXPECT_EQ (rec.winner (), "a");
}

TEST_F (SessionTests, MultipleRounds)
{
  AddPlayer ("a", proto::ROCK);
  AddPlayer ("b", proto::SCISSORS);

  session.StartRound ();
  session.BeginReveal ();
  ASSERT_EQ (Reveal ("a", proto::ROCK), RevealResult::OK);
  ASSERT_EQ (Reveal ("b", proto::SCISSORS), RevealResult::OK);
  EXPECT_EQ (session.ScoreCurrentRound ().winner (), "a");

  session.StartRound ();
  EXPECT_EQ (session.GetRound (), 2);
  EXPECT_FALSE (session.AllCommitted ());
  for (const auto& p : session.GetPlayers ())
    {
      EXPECT_EQ (p.GetState (), PlayerEntry::State::AWAITING_COMMIT);
      EXPECT_EQ (p.GetChoice (), proto::EMPTY);
    }

  /* Reveals are not accepted before everyone has committed.  */
  CommitFor ("a", proto::PAPER);
  EXPECT_FALSE (session.AllCommitted ());
  EXPECT_DEATH (session.BeginReveal (), "Not all players have committed");
  EXPECT_DEATH (Reveal ("a", proto::PAPER), "Reveal submitted in phase commit");

  EXPECT_FALSE (session.SubmitCommitment ("a", Commit ("Rock", "x")));
  EXPECT_FALSE (session.SubmitCommitment ("c", Commit ("Rock", "x")));
  CommitFor ("b", proto::SCISSORS);
  session.BeginReveal ();

  ASSERT_EQ (Reveal ("a", proto::PAPER), RevealResult::OK);
  ASSERT_EQ (Reveal ("b", proto::SCISSORS), RevealResult::OK);
  const auto& rec = session.ScoreCurrentRound ();
  EXPECT_EQ (rec.round (), 2);
  EXPECT_EQ (rec.winner (), "b");

  /* Scores accumulate and never decrease.  */
  EXPECT_EQ (session.GetScores ().GetScore ("a"), 1);
  EXPECT_EQ (session.GetScores ().GetScore ("b"), 1);
  ASSERT_EQ (session.GetHistory ().size (), 2);
  EXPECT_EQ (session.GetHistory ()[0].round (), 1);
  EXPECT_EQ (session.GetHistory ()[1].round (), 2);
}

TEST_F (SessionTests, PhaseViolations)
{
  AddPlayer ("a", proto::ROCK);
  AddPlayer ("b", proto::ROCK);

  EXPECT_DEATH (session.BeginReveal (), "Cannot begin reveal");
  EXPECT_DEATH (session.ScoreCurrentRound (), "Cannot score");

  session.StartRound ();
  EXPECT_DEATH (session.StartRound (), "Cannot start a new round");
  session.BeginReveal ();
  EXPECT_DEATH (session.SubmitCommitment ("a", Commit ("Rock", "x")),
                "Commitment submitted in phase reveal");
}

TEST_F (SessionTests, CaseInsensitiveSession)
{
  Session s(false);
  EXPECT_FALSE (s.IsCaseSensitive ());

  ASSERT_TRUE (s.AddPlayer ("a", Commit ("rock", "abhi")));
  ASSERT_TRUE (s.AddPlayer ("b", Commit ("PAPER", "x")));
  s.StartRound ();
  s.BeginReveal ();
  EXPECT_EQ (s.SubmitReveal ("a", "rock", "abhi"), RevealResult::OK);
  EXPECT_EQ (s.SubmitReveal ("b", "PAPER", "x"), RevealResult::OK);
  EXPECT_EQ (s.ScoreCurrentRound ().winner (), "b");
}

} // anonymous namespace
} // namespace rps
