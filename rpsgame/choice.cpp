// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "choice.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace rps
{

namespace
{

/** Number of actual moves (without EMPTY).  */
constexpr int NUM_MOVES = 3;

/**
 * The dominance relation:  BEATS[a][b] is true if move a beats move b.  Rows
 * and columns are indexed by the proto enum value minus one, i.e. in the
 * order rock, paper, scissors.
 */
constexpr bool BEATS[NUM_MOVES][NUM_MOVES] =
  {
    /*               rock   paper  scissors */
    /* rock */     {false, false, true},
    /* paper */    {true,  false, false},
    /* scissors */ {false, true,  false},
  };

/**
 * Returns the row/column index of a move in the BEATS table.
 */
int
MoveIndex (const proto::Choice c)
{
  switch (c)
    {
    case proto::ROCK:
    case proto::PAPER:
    case proto::SCISSORS:
      return static_cast<int> (c) - 1;

    default:
      LOG (FATAL) << "Not an actual move: " << static_cast<int> (c);
      return -1;
    }
}

std::string
ToLower (std::string str)
{
  std::transform (str.begin (), str.end (), str.begin (),
                  [] (const unsigned char c) { return std::tolower (c); });
  return str;
}

} // anonymous namespace

std::string
ChoiceToString (const proto::Choice c)
{
  switch (c)
    {
    case proto::EMPTY:
      return "Empty";
    case proto::ROCK:
      return "Rock";
    case proto::PAPER:
      return "Paper";
    case proto::SCISSORS:
      return "Scissors";
    }

  LOG (FATAL) << "Unexpected choice: " << static_cast<int> (c);
  return "";
}

bool
ParseChoice (const std::string& str, const bool caseSensitive,
             proto::Choice& c)
{
  const std::string key = caseSensitive ? str : ToLower (str);

  for (const auto cur : {proto::ROCK, proto::PAPER, proto::SCISSORS})
    {
      const std::string name = ChoiceToString (cur);
      if (key == (caseSensitive ? name : ToLower (name)))
        {
          c = cur;
          return true;
        }
    }

  LOG (WARNING) << "Invalid choice string: '" << str << "'";
  return false;
}

bool
Beats (const proto::Choice a, const proto::Choice b)
{
  return BEATS[MoveIndex (a)][MoveIndex (b)];
}

} // namespace rps
