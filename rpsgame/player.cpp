// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "player.hpp"

#include "choice.hpp"

#include <glog/logging.h>

namespace rps
{

std::ostream&
operator<< (std::ostream& out, const RevealResult r)
{
  switch (r)
    {
    case RevealResult::OK:
      return out << "ok";
    case RevealResult::UNKNOWN_PLAYER:
      return out << "unknown player";
    case RevealResult::NOT_COMMITTED:
      return out << "not committed";
    case RevealResult::ALREADY_REVEALED:
      return out << "already revealed";
    case RevealResult::MISMATCH:
      return out << "mismatch";
    case RevealResult::INVALID_CHOICE:
      return out << "invalid choice";
    }

  return out << "unknown (" << static_cast<int> (r) << ")";
}

const Commitment&
PlayerEntry::GetCommitment () const
{
  CHECK (state != State::AWAITING_COMMIT)
      << "Player " << name << " has no commitment yet";
  return commitment;
}

void
PlayerEntry::SetCommitment (const Commitment& c)
{
  CHECK (state == State::AWAITING_COMMIT)
      << "Player " << name << " has already committed this round";

  commitment = c;
  state = State::AWAITING_REVEAL;
  VLOG (1) << "Player " << name << " committed to " << c.ToHex ();
}

RevealResult
PlayerEntry::TryReveal (const std::string& choiceStr, const std::string& salt,
                        const bool caseSensitive)
{
  switch (state)
    {
    case State::AWAITING_COMMIT:
      LOG (WARNING) << "Reveal from " << name << " before commitment";
      return RevealResult::NOT_COMMITTED;

    case State::REVEALED:
      LOG (WARNING) << "Player " << name << " has already revealed";
      return RevealResult::ALREADY_REVEALED;

    case State::AWAITING_REVEAL:
      break;
    }

  if (!VerifyReveal (commitment, choiceStr, salt))
    {
      LOG (WARNING)
          << "Reveal of " << name << " does not match the commitment "
          << commitment.ToHex ();
      return RevealResult::MISMATCH;
    }

  proto::Choice parsed;
  if (!ParseChoice (choiceStr, caseSensitive, parsed))
    {
      LOG (WARNING)
          << "Reveal of " << name << " matches the commitment, but '"
          << choiceStr << "' is not a valid choice";
      return RevealResult::INVALID_CHOICE;
    }

  choice = parsed;
  state = State::REVEALED;
  LOG (INFO) << "Player " << name << " revealed " << ChoiceToString (choice);

  return RevealResult::OK;
}

void
PlayerEntry::ResetForNextRound ()
{
  state = State::AWAITING_COMMIT;
  commitment.SetNull ();
  choice = proto::EMPTY;
}

} // namespace rps
