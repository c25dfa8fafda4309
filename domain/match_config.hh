#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "domain/rock_paper_scissors.hh"
#include "wise_enum.h"

namespace rps::domain {

WISE_ENUM_CLASS(Mode, SINGLE_PLAYER, MULTIPLAYER);
WISE_ENUM_CLASS(Difficulty, EASY, NORMAL, HARD);

struct SingleRound {
    static constexpr std::string_view name = "SingleRound";
    constexpr bool operator==(const SingleRound &) const { return true; }
};

// Only constructed through make_best_of_n, which guarantees an odd count of at least one.
struct BestOfN {
    static constexpr std::string_view name = "BestOfN";
    int rounds;
    // Round wins needed for a strict majority of `rounds`
    constexpr int wins_needed() const { return rounds / 2 + 1; }
    constexpr bool operator==(const BestOfN &other) const { return rounds == other.rounds; }
};

// Only constructed through make_first_to_k, which guarantees a count of at least one.
struct FirstToK {
    static constexpr std::string_view name = "FirstToK";
    int wins;
    constexpr bool operator==(const FirstToK &other) const { return wins == other.wins; }
};

using MatchFormat = std::variant<SingleRound, BestOfN, FirstToK>;

// Throws InvalidFormatParameter unless n is odd and at least one.
BestOfN make_best_of_n(const int n);

// Throws InvalidFormatParameter unless k is at least one.
FirstToK make_first_to_k(const int k);

// Throws InvalidFormatParameter if the payload of the format is out of range.
void validate(const MatchFormat &format);

inline constexpr std::string_view COMPUTER_NAME = "Computer";

struct MatchConfig {
    std::string player1;
    std::string player2;
    Mode mode;
    Ruleset ruleset;
    MatchFormat format;
    // Present iff mode is SINGLE_PLAYER
    std::optional<Difficulty> difficulty;

    bool operator==(const MatchConfig &other) const = default;
};

MatchConfig make_single_player_config(std::string player, const Ruleset ruleset,
                                      const MatchFormat &format, const Difficulty difficulty);

MatchConfig make_multiplayer_config(std::string player1, std::string player2,
                                    const Ruleset ruleset, const MatchFormat &format);

// Throws InvalidFormatParameter for a bad format, InvalidConfig for empty or duplicate names or
// a difficulty that does not match the mode.
void validate(const MatchConfig &config);

std::string to_string(const MatchFormat &format);
std::string to_string(const Difficulty difficulty);
}  // namespace rps::domain
