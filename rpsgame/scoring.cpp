// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scoring.hpp"

#include "choice.hpp"

#include <glog/logging.h>

#include <set>

namespace rps
{

std::vector<ScoreDelta>
ScoreRound (const std::vector<RevealedChoice>& revealed)
{
  std::vector<ScoreDelta> res;
  std::set<std::string> seen;
  for (const auto& r : revealed)
    {
      CHECK (r.choice != proto::EMPTY)
          << "Player " << r.name << " has not revealed a choice";
      CHECK (seen.insert (r.name).second)
          << "Duplicate player in round: " << r.name;
      res.push_back ({r.name, 0});
    }

  for (size_t i = 0; i < revealed.size (); ++i)
    for (size_t j = i + 1; j < revealed.size (); ++j)
      {
        const auto a = revealed[i].choice;
        const auto b = revealed[j].choice;
        if (a == b)
          continue;

        const size_t winner = Beats (a, b) ? i : j;
        ++res[winner].delta;

        VLOG (1)
            << revealed[i].name << " (" << ChoiceToString (a) << ") vs "
            << revealed[j].name << " (" << ChoiceToString (b) << "): "
            << revealed[winner].name << " wins";
      }

  return res;
}

bool
ScoreTable::AddPlayer (const std::string& name)
{
  if (!scores.emplace (name, 0).second)
    return false;

  names.push_back (name);
  return true;
}

bool
ScoreTable::HasPlayer (const std::string& name) const
{
  return scores.count (name) > 0;
}

unsigned
ScoreTable::GetScore (const std::string& name) const
{
  const auto mit = scores.find (name);
  CHECK (mit != scores.end ()) << "Unknown player: " << name;
  return mit->second;
}

void
ScoreTable::ApplyDeltas (const std::vector<ScoreDelta>& deltas)
{
  for (const auto& d : deltas)
    {
      auto mit = scores.find (d.name);
      CHECK (mit != scores.end ()) << "Unknown player: " << d.name;
      mit->second += d.delta;
    }
}

} // namespace rps
