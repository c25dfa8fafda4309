#include "domain/match_config.hh"

#include <sstream>
#include <type_traits>

#include "domain/errors.hh"

namespace rps::domain {
BestOfN make_best_of_n(const int n) {
    if (n < 1 || n % 2 == 0) {
        throw InvalidFormatParameter("Best of N requires an odd N >= 1, got " + std::to_string(n));
    }
    return BestOfN{.rounds = n};
}

FirstToK make_first_to_k(const int k) {
    if (k < 1) {
        throw InvalidFormatParameter("First to K requires K >= 1, got " + std::to_string(k));
    }
    return FirstToK{.wins = k};
}

void validate(const MatchFormat &format) {
    std::visit(
        [](const auto &alternative) {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, BestOfN>) {
                make_best_of_n(alternative.rounds);
            } else if constexpr (std::is_same_v<T, FirstToK>) {
                make_first_to_k(alternative.wins);
            }
        },
        format);
}

MatchConfig make_single_player_config(std::string player, const Ruleset ruleset,
                                      const MatchFormat &format, const Difficulty difficulty) {
    MatchConfig out = {
        .player1 = std::move(player),
        .player2 = std::string(COMPUTER_NAME),
        .mode = Mode::SINGLE_PLAYER,
        .ruleset = ruleset,
        .format = format,
        .difficulty = difficulty,
    };
    validate(out);
    return out;
}

MatchConfig make_multiplayer_config(std::string player1, std::string player2,
                                    const Ruleset ruleset, const MatchFormat &format) {
    MatchConfig out = {
        .player1 = std::move(player1),
        .player2 = std::move(player2),
        .mode = Mode::MULTIPLAYER,
        .ruleset = ruleset,
        .format = format,
        .difficulty = std::nullopt,
    };
    validate(out);
    return out;
}

void validate(const MatchConfig &config) {
    validate(config.format);

    if (config.player1.empty() || config.player2.empty()) {
        throw InvalidConfig("Player names can't be empty");
    }

    // The scoreboard is keyed by name, so the computer's name is reserved in single player
    if (config.player1 == config.player2) {
        throw InvalidConfig("Player names must be different, both are " + config.player1);
    }

    if (config.mode == Mode::SINGLE_PLAYER) {
        if (!config.difficulty.has_value()) {
            throw InvalidConfig("Single player matches require a difficulty");
        }
    } else if (config.difficulty.has_value()) {
        throw InvalidConfig("Multiplayer matches don't have a difficulty");
    }
}

std::string to_string(const MatchFormat &format) {
    return std::visit(
        [](const auto &alternative) -> std::string {
            using T = std::decay_t<decltype(alternative)>;
            std::stringstream out;
            if constexpr (std::is_same_v<T, BestOfN>) {
                out << "Best of " << alternative.rounds;
            } else if constexpr (std::is_same_v<T, FirstToK>) {
                out << "First to " << alternative.wins << " wins";
            } else {
                out << "Single round";
            }
            return out.str();
        },
        format);
}

std::string to_string(const Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:
            return "Easy";
        case Difficulty::NORMAL:
            return "Normal";
        case Difficulty::HARD:
            return "Hard";
    }
    return std::string(wise_enum::to_string(difficulty));
}
}  // namespace rps::domain
