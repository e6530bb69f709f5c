// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "console.hpp"

#include "choice.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace rps
{

namespace
{

/**
 * Outcome of a single attempt at reading some value.
 */
enum class Attempt
{
  ACCEPTED,
  REJECTED,
  END_OF_INPUT,
};

/**
 * Repeats an attempt until it is accepted, the input ends or the policy
 * allows no more attempts.  Returns true if the value was accepted.
 */
template <typename Fcn>
  bool
  WithRetries (const RetryPolicy& policy, const std::string& what,
               const Fcn& attempt)
{
  for (unsigned n = 1; ; ++n)
    {
      switch (attempt ())
        {
        case Attempt::ACCEPTED:
          return true;

        case Attempt::END_OF_INPUT:
          LOG (ERROR) << "Input ended while waiting for " << what;
          return false;

        case Attempt::REJECTED:
          break;
        }

      if (policy.maxAttempts > 0 && n >= policy.maxAttempts)
        {
          LOG (ERROR)
              << "Giving up on " << what << " after " << n << " attempts";
          return false;
        }
    }
}

std::string
Trim (const std::string& str)
{
  static constexpr const char* WHITESPACE = " \t\r\n";

  const auto begin = str.find_first_not_of (WHITESPACE);
  if (begin == std::string::npos)
    return "";
  const auto end = str.find_last_not_of (WHITESPACE);

  return str.substr (begin, end - begin + 1);
}

/**
 * Parses a non-negative decimal number.  Signs, whitespace and anything
 * with more than nine digits are rejected.
 */
bool
ParseCount (const std::string& str, unsigned& count)
{
  if (str.empty () || str.size () > 9)
    return false;

  if (!std::all_of (str.begin (), str.end (),
                    [] (const unsigned char c) { return std::isdigit (c); }))
    return false;

  count = std::stoul (str);
  return true;
}

} // anonymous namespace

bool
ConsoleFrontEnd::ReadLine (const std::string& prompt, std::string& line)
{
  out << prompt << std::endl;
  if (!std::getline (in, line))
    return false;

  line = Trim (line);
  return true;
}

bool
ConsoleFrontEnd::CollectCommitment (const std::string& prompt, Commitment& c)
{
  return WithRetries (policy, "commitment", [&] ()
    {
      std::string line;
      if (!ReadLine (prompt, line))
        return Attempt::END_OF_INPUT;

      if (!c.FromHex (line))
        {
          out << "The commit hash must be " << 2 * Commitment::NUM_BYTES
              << " hex characters." << std::endl;
          return Attempt::REJECTED;
        }

      return Attempt::ACCEPTED;
    });
}

bool
ConsoleFrontEnd::CollectPlayerCount (unsigned& count)
{
  return WithRetries (policy, "player count", [&] ()
    {
      std::string line;
      if (!ReadLine ("Enter number of players: ", line))
        return Attempt::END_OF_INPUT;

      unsigned n;
      if (!ParseCount (line, n))
        {
          LOG (WARNING) << "Invalid player count: '" << line << "'";
          out << "Please enter a whole number." << std::endl;
          return Attempt::REJECTED;
        }

      if (n < Session::MIN_PLAYERS)
        {
          out << "At least " << Session::MIN_PLAYERS << " players are needed."
              << std::endl;
          return Attempt::REJECTED;
        }

      count = n;
      return Attempt::ACCEPTED;
    });
}

bool
ConsoleFrontEnd::RegisterPlayers (Session& s, const unsigned count)
{
  for (unsigned i = 0; i < count; ++i)
    {
      std::string name;
      const bool nameOk = WithRetries (policy, "player name", [&] ()
        {
          if (!ReadLine ("Enter your name: ", name))
            return Attempt::END_OF_INPUT;

          if (name.empty ())
            {
              out << "The name must not be empty." << std::endl;
              return Attempt::REJECTED;
            }
          if (s.GetScores ().HasPlayer (name))
            {
              out << "The name " << name << " is already taken." << std::endl;
              return Attempt::REJECTED;
            }

          return Attempt::ACCEPTED;
        });
      if (!nameOk)
        return false;

      Commitment c;
      if (!CollectCommitment ("Enter the commit hash of your choice"
                              " (Rock, Paper, Scissors) with salt: ", c))
        return false;

      CHECK (s.AddPlayer (name, c));
    }

  return true;
}

bool
ConsoleFrontEnd::CollectCommitments (Session& s)
{
  std::vector<std::string> names;
  for (const auto& p : s.GetPlayers ())
    names.push_back (p.GetName ());

  for (const auto& name : names)
    {
      std::ostringstream prompt;
      prompt << name << ", enter the commit hash of your choice for round "
             << s.GetRound () << ": ";

      Commitment c;
      if (!CollectCommitment (prompt.str (), c))
        return false;

      CHECK (s.SubmitCommitment (name, c));
    }

  return true;
}

void
ConsoleFrontEnd::PrintCommitments (const Session& s)
{
  out << "commit hashes:" << std::endl;
  for (const auto& p : s.GetPlayers ())
    out << "  " << p.GetName () << ": " << p.GetCommitment ().ToHex ()
        << std::endl;
}

bool
ConsoleFrontEnd::CollectReveals (Session& s)
{
  std::vector<std::string> names;
  for (const auto& p : s.GetPlayers ())
    names.push_back (p.GetName ());

  for (const auto& name : names)
    {
      const bool ok = WithRetries (policy, "reveal of " + name, [&] ()
        {
          std::string choice, salt;
          if (!ReadLine (name + ", please reveal the choice: ", choice))
            return Attempt::END_OF_INPUT;
          if (!ReadLine ("also please reveal the salt: ", salt))
            return Attempt::END_OF_INPUT;

          const RevealResult res = s.SubmitReveal (name, choice, salt);
          switch (res)
            {
            case RevealResult::OK:
              return Attempt::ACCEPTED;

            case RevealResult::MISMATCH:
              out << "This does not match your commit hash, please try again."
                  << std::endl;
              return Attempt::REJECTED;

            case RevealResult::INVALID_CHOICE:
              out << "'" << choice << "' is not a valid choice"
                  << " (Rock, Paper, Scissors)." << std::endl;
              return Attempt::REJECTED;

            default:
              break;
            }

          LOG (FATAL) << "Unexpected reveal result for " << name << ": " << res;
          return Attempt::REJECTED;
        });
      if (!ok)
        return false;
    }

  return true;
}

void
ConsoleFrontEnd::PrintRoundResult (const proto::RoundRecord& rec)
{
  out << "Round " << rec.round () << " result:" << std::endl;
  for (const auto& p : rec.participants ())
    out << "  " << p.name () << ": " << ChoiceToString (p.choice ())
        << " (+" << p.delta () << ")" << std::endl;

  if (rec.has_winner ())
    out << "  winner: " << rec.winner () << std::endl;
  else
    out << "  tie" << std::endl;
}

void
ConsoleFrontEnd::PrintScores (const Session& s)
{
  const auto& scores = s.GetScores ();

  out << "The game score so far is:" << std::endl;
  for (const auto& name : scores.GetNames ())
    out << "- " << name << ": " << scores.GetScore (name) << std::endl;
}

bool
ConsoleFrontEnd::Play (Session& s, const unsigned rounds)
{
  CHECK_GT (rounds, 0);
  CHECK (s.GetPhase () == Session::Phase::REGISTRATION);

  unsigned count;
  if (!CollectPlayerCount (count))
    return false;
  if (!RegisterPlayers (s, count))
    return false;

  for (unsigned r = 1; r <= rounds; ++r)
    {
      s.StartRound ();
      CHECK_EQ (s.GetRound (), r);

      if (r > 1 && !CollectCommitments (s))
        return false;
      PrintCommitments (s);

      s.BeginReveal ();
      if (!CollectReveals (s))
        return false;

      PrintRoundResult (s.ScoreCurrentRound ());
    }

  PrintScores (s);
  return true;
}

} // namespace rps
