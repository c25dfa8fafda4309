#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wise_enum.h"

namespace rps::domain {

WISE_ENUM_CLASS(Move, ROCK, PAPER, SCISSORS, LIZARD, SPOCK);
WISE_ENUM_CLASS(Ruleset, CLASSIC, EXTENDED);
WISE_ENUM_CLASS(RoundOutcome, PLAYER1, PLAYER2, TIE);

// Moves playable under the ruleset, in enum order.
std::vector<Move> legal_moves(const Ruleset ruleset);

bool is_legal(const Ruleset ruleset, const Move move);

// True if `a` defeats `b` under the ruleset. False for equal moves and for moves that are not
// legal under the ruleset.
bool beats(const Ruleset ruleset, const Move a, const Move b);

// Throws InvalidMove if either move is not legal under the ruleset.
RoundOutcome resolve(const Ruleset ruleset, const Move a, const Move b);

// Drops leading and trailing whitespace. Typed names and menu choices go through this.
std::string_view trim(std::string_view in);

// Accepts full names or single letter shortcuts (k for Spock), ignoring case and surrounding
// whitespace. Lizard and Spock are only accepted under the extended ruleset.
std::optional<Move> parse_move(std::string_view input, const Ruleset ruleset);

std::string accepted_inputs(const Ruleset ruleset);

std::string to_string(const Move move);
std::string to_string(const Ruleset ruleset);
}  // namespace rps::domain
