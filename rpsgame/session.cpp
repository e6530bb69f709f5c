// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "session.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <utility>

namespace rps
{

std::ostream&
operator<< (std::ostream& out, const Session::Phase p)
{
  switch (p)
    {
    case Session::Phase::REGISTRATION:
      return out << "registration";
    case Session::Phase::COMMIT:
      return out << "commit";
    case Session::Phase::REVEAL:
      return out << "reveal";
    case Session::Phase::FINISHED_ROUND:
      return out << "finished round";
    }

  return out << "unknown (" << static_cast<int> (p) << ")";
}

PlayerEntry*
Session::FindPlayer (const std::string& name)
{
  for (auto& p : players)
    if (p.GetName () == name)
      return &p;

  return nullptr;
}

bool
Session::AddPlayer (const std::string& name, const Commitment& c)
{
  CHECK (phase == Phase::REGISTRATION)
      << "Players can only be added before the first round, phase is "
      << phase;

  if (name.empty ())
    {
      LOG (WARNING) << "Player name must not be empty";
      return false;
    }

  if (!scores.AddPlayer (name))
    {
      LOG (WARNING) << "Player name is already taken: " << name;
      return false;
    }

  players.emplace_back (name);
  players.back ().SetCommitment (c);
  LOG (INFO) << "Registered player " << name;

  return true;
}

void
Session::StartRound ()
{
  switch (phase)
    {
    case Phase::REGISTRATION:
      CHECK_GE (players.size (), MIN_PLAYERS) << "Not enough players";
      break;

    case Phase::FINISHED_ROUND:
      for (auto& p : players)
        p.ResetForNextRound ();
      break;

    default:
      LOG (FATAL) << "Cannot start a new round in phase " << phase;
    }

  ++round;
  phase = Phase::COMMIT;
  LOG (INFO) << "Starting round " << round << " with " << players.size ()
             << " players";
}

bool
Session::SubmitCommitment (const std::string& name, const Commitment& c)
{
  CHECK (phase == Phase::COMMIT) << "Commitment submitted in phase " << phase;

  PlayerEntry* p = FindPlayer (name);
  if (p == nullptr)
    {
      LOG (WARNING) << "Commitment from unknown player " << name;
      return false;
    }

  if (p->GetState () != PlayerEntry::State::AWAITING_COMMIT)
    {
      LOG (WARNING) << "Player " << name << " has already committed";
      return false;
    }

  p->SetCommitment (c);
  return true;
}

bool
Session::AllCommitted () const
{
  return std::all_of (players.begin (), players.end (),
                      [] (const PlayerEntry& p)
                        {
                          return p.GetState ()
                                    != PlayerEntry::State::AWAITING_COMMIT;
                        });
}

void
Session::BeginReveal ()
{
  CHECK (phase == Phase::COMMIT) << "Cannot begin reveal in phase " << phase;
  CHECK (AllCommitted ()) << "Not all players have committed yet";

  phase = Phase::REVEAL;
  LOG (INFO) << "All commitments for round " << round << " are in";
}

RevealResult
Session::SubmitReveal (const std::string& name, const std::string& choice,
                       const std::string& salt)
{
  CHECK (phase == Phase::REVEAL) << "Reveal submitted in phase " << phase;

  PlayerEntry* p = FindPlayer (name);
  if (p == nullptr)
    {
      LOG (WARNING) << "Reveal from unknown player " << name;
      return RevealResult::UNKNOWN_PLAYER;
    }

  return p->TryReveal (choice, salt, caseSensitive);
}

bool
Session::AllRevealed () const
{
  return std::all_of (players.begin (), players.end (),
                      [] (const PlayerEntry& p)
                        {
                          return p.GetState ()
                                    == PlayerEntry::State::REVEALED;
                        });
}

const proto::RoundRecord&
Session::ScoreCurrentRound ()
{
  CHECK (phase == Phase::REVEAL) << "Cannot score in phase " << phase;
  CHECK (AllRevealed ()) << "Not all players have revealed yet";

  std::vector<RevealedChoice> revealed;
  for (const auto& p : players)
    revealed.push_back ({p.GetName (), p.GetChoice ()});

  const auto deltas = ScoreRound (revealed);
  CHECK_EQ (deltas.size (), players.size ());
  scores.ApplyDeltas (deltas);

  proto::RoundRecord rec;
  rec.set_round (round);

  unsigned best = 0;
  unsigned numBest = 0;
  for (size_t i = 0; i < players.size (); ++i)
    {
      auto* part = rec.add_participants ();
      part->set_name (players[i].GetName ());
      part->set_commitment (players[i].GetCommitment ().GetBinaryString ());
      part->set_choice (players[i].GetChoice ());
      part->set_delta (deltas[i].delta);

      if (deltas[i].delta > best)
        {
          best = deltas[i].delta;
          numBest = 1;
          rec.set_winner (players[i].GetName ());
        }
      else if (deltas[i].delta == best)
        ++numBest;
    }

  if (best == 0 || numBest > 1)
    rec.clear_winner ();

  if (rec.has_winner ())
    LOG (INFO) << "Round " << round << " won by " << rec.winner ();
  else
    LOG (INFO) << "Round " << round << " is a tie";

  history.push_back (std::move (rec));
  phase = Phase::FINISHED_ROUND;

  return history.back ();
}

} // namespace rps
