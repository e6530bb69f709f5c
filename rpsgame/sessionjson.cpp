// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sessionjson.hpp"

#include "choice.hpp"

#include <glog/logging.h>

#include <sstream>

namespace rps
{

namespace
{

std::string
PlayerStateToString (const PlayerEntry::State s)
{
  switch (s)
    {
    case PlayerEntry::State::AWAITING_COMMIT:
      return "awaiting commit";
    case PlayerEntry::State::AWAITING_REVEAL:
      return "awaiting reveal";
    case PlayerEntry::State::REVEALED:
      return "revealed";
    }

  LOG (FATAL) << "Invalid player state: " << static_cast<int> (s);
  return "";
}

/**
 * Converts the raw commitment bytes from a RoundParticipant to hex.
 */
std::string
CommitmentBytesToHex (const std::string& bytes)
{
  CHECK_EQ (bytes.size (), Commitment::NUM_BYTES);

  Commitment c;
  c.FromBlob (reinterpret_cast<const unsigned char*> (bytes.data ()));

  return c.ToHex ();
}

} // anonymous namespace

Json::Value
RoundRecordToJson (const proto::RoundRecord& rec)
{
  Json::Value participants(Json::arrayValue);
  for (const auto& p : rec.participants ())
    {
      Json::Value cur(Json::objectValue);
      cur["name"] = p.name ();
      cur["commitment"] = CommitmentBytesToHex (p.commitment ());
      cur["choice"] = ChoiceToString (p.choice ());
      cur["delta"] = static_cast<Json::Int> (p.delta ());
      participants.append (cur);
    }

  Json::Value res(Json::objectValue);
  res["round"] = static_cast<Json::Int> (rec.round ());
  res["participants"] = participants;
  if (rec.has_winner ())
    res["winner"] = rec.winner ();
  else
    res["winner"] = Json::Value ();

  return res;
}

Json::Value
SessionToJson (const Session& s)
{
  Json::Value players(Json::arrayValue);
  for (const auto& p : s.GetPlayers ())
    {
      Json::Value cur(Json::objectValue);
      cur["name"] = p.GetName ();
      cur["state"] = PlayerStateToString (p.GetState ());
      if (p.GetState () != PlayerEntry::State::AWAITING_COMMIT)
        cur["commitment"] = p.GetCommitment ().ToHex ();
      if (p.GetState () == PlayerEntry::State::REVEALED)
        cur["choice"] = ChoiceToString (p.GetChoice ());
      players.append (cur);
    }

  Json::Value scores(Json::objectValue);
  for (const auto& name : s.GetScores ().GetNames ())
    scores[name] = static_cast<Json::Int> (s.GetScores ().GetScore (name));

  Json::Value history(Json::arrayValue);
  for (const auto& rec : s.GetHistory ())
    history.append (RoundRecordToJson (rec));

  std::ostringstream phase;
  phase << s.GetPhase ();

  Json::Value res(Json::objectValue);
  res["round"] = static_cast<Json::Int> (s.GetRound ());
  res["phase"] = phase.str ();
  res["players"] = players;
  res["scores"] = scores;
  res["history"] = history;

  return res;
}

} // namespace rps
