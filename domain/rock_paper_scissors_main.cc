#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>

#include "common/argument_wrapper.hh"
#include "common/proto/load_from_file.hh"
#include "cxxopts.hpp"
#include "domain/errors.hh"
#include "domain/match_state.hh"
#include "domain/match_state_to_proto.hh"
#include "domain/scoreboard.hh"

namespace rps::domain {
namespace {
struct Options {
    std::filesystem::path save_file;
    std::filesystem::path scoreboard_file;
    bool show_ascii;
};

void banner() {
    std::cout << "==============================" << std::endl;
    std::cout << "    Rock, Paper, Scissors   " << std::endl;
    std::cout << "==============================" << std::endl << std::endl;
}

void clear_screen() {
    std::cout << "\x1B[2J\x1B[1;1H" << std::endl;
    banner();
}

std::string read_line(const std::string &prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        // Treat a closed stdin like an interrupted session
        std::cout << std::endl << "Input closed." << std::endl;
        std::exit(0);
    }
    return std::string(trim(line));
}

void pause() { read_line("\nPress Enter to continue"); }

int read_menu_choice(const int min, const int max) {
    while (true) {
        const std::string line = read_line("\nChoose: ");
        try {
            std::size_t num_parsed = 0;
            const int choice = std::stoi(line, &num_parsed);
            if (num_parsed == line.size() && choice >= min && choice <= max) {
                return choice;
            }
        } catch (const std::logic_error &) {
            // Not a number, fall through and prompt again
        }
        std::cout << "Invalid choice. Try again." << std::endl;
    }
}

std::string read_name(const std::string &prompt, const std::optional<std::string> &taken) {
    while (true) {
        const std::string name = read_line(prompt);
        if (!name.empty() && name != taken) {
            return name;
        }
        std::cout << "Name can't be empty";
        if (taken.has_value()) {
            std::cout << " or be " << taken.value();
        }
        std::cout << "." << std::endl;
    }
}

std::string ascii_move(const Move move) {
    switch (move) {
        case Move::ROCK:
            return R"(
    _______
---'   ____)
      (_____)
      (_____)
      (____)
---.__(___)
)";
        case Move::PAPER:
            return R"(
     _______
---'   ____)____
          ______)
          _______)
         _______)
---.__________)
)";
        case Move::SCISSORS:
            return R"(
    _______
---'   ____)____
          ______)
       __________)
      (____)
---.__(___)
)";
        case Move::LIZARD:
            return R"(
     __,---._
    /        `.
   |   .-"""-. |
   |  /  _ _  \|
    \ | | | | |
     \| |_| |_|/
       \       /
        `-.__.-'
)";
        case Move::SPOCK:
            return R"(
      _  _
     | || |
     | || |  _
     | \/ | / |
     |    |/  /
      \      /
       \____/
  Live long and prosper
)";
    }
    return "";
}

MatchFormat read_format() {
    std::cout << std::endl << "Choose match format:" << std::endl;
    std::cout << "1) Single round" << std::endl;
    std::cout << "2) Best of N" << std::endl;
    std::cout << "3) First to K wins" << std::endl;
    const int choice = read_menu_choice(1, 3);
    if (choice == 1) {
        return SingleRound{};
    }

    while (true) {
        const std::string prompt =
            choice == 2 ? "Enter N (odd number >= 1): " : "Enter K (>= 1): ";
        const std::string line = read_line(prompt);
        try {
            const int count = std::stoi(line);
            if (choice == 2) {
                return make_best_of_n(count);
            }
            return make_first_to_k(count);
        } catch (const InvalidFormatParameter &e) {
            std::cout << e.what() << std::endl;
        } catch (const std::logic_error &) {
            std::cout << "Invalid." << std::endl;
        }
    }
}

Difficulty read_difficulty() {
    std::cout << std::endl << "Choose difficulty:" << std::endl;
    std::cout << "1) Easy" << std::endl;
    std::cout << "2) Normal" << std::endl;
    std::cout << "3) Hard" << std::endl;
    const int choice = read_menu_choice(1, 3);
    return choice == 1 ? Difficulty::EASY : choice == 2 ? Difficulty::NORMAL : Difficulty::HARD;
}

Ruleset read_ruleset() {
    std::cout << std::endl << "Choose ruleset:" << std::endl;
    std::cout << "1) Classic" << std::endl;
    std::cout << "2) Extended" << std::endl;
    return read_menu_choice(1, 2) == 1 ? Ruleset::CLASSIC : Ruleset::EXTENDED;
}

MatchConfig new_game_setup() {
    clear_screen();
    std::cout << "New game setup" << std::endl << std::endl;

    std::cout << "Choose mode:" << std::endl;
    std::cout << "1) Single-player" << std::endl;
    std::cout << "2) Multiplayer" << std::endl;
    const bool single_player = read_menu_choice(1, 2) == 1;

    const std::string player1 = read_name(
        "\nPlayer 1 name: ",
        single_player ? std::make_optional(std::string(COMPUTER_NAME)) : std::nullopt);
    if (single_player) {
        const Difficulty difficulty = read_difficulty();
        const Ruleset ruleset = read_ruleset();
        return make_single_player_config(player1, ruleset, read_format(), difficulty);
    }

    const std::string player2 = read_name("Player 2 name: ", player1);
    const Ruleset ruleset = read_ruleset();
    return make_multiplayer_config(player1, player2, ruleset, read_format());
}

// Keeps the players and mode, asks for everything else again.
MatchConfig change_settings(const MatchConfig &config) {
    if (config.mode == Mode::SINGLE_PLAYER) {
        const Difficulty difficulty = read_difficulty();
        const Ruleset ruleset = read_ruleset();
        return make_single_player_config(config.player1, ruleset, read_format(), difficulty);
    }
    const Ruleset ruleset = read_ruleset();
    return make_multiplayer_config(config.player1, config.player2, ruleset, read_format());
}

Move read_move(const std::string &player, const Ruleset ruleset, const bool hidden) {
    if (hidden) {
        // Keep the previous player's choice off screen
        clear_screen();
        std::cout << player << "'s turn" << std::endl;
    }
    while (true) {
        std::cout << "Accepted inputs: " << accepted_inputs(ruleset) << std::endl;
        const auto maybe_move = parse_move(read_line(player + " move: "), ruleset);
        if (maybe_move.has_value()) {
            return maybe_move.value();
        }
        std::cout << "Invalid move." << std::endl;
    }
}

void print_score(const MatchState &state, const std::string &label) {
    const MatchConfig &config = state.config();
    std::cout << label << ": " << config.player1 << " " << state.player1_round_wins() << " - "
              << state.player2_round_wins() << " " << config.player2 << std::endl;
}

void print_match_header(const MatchState &state) {
    const MatchConfig &config = state.config();
    std::cout << "Match" << std::endl;
    std::cout << config.player1 << " vs " << config.player2 << std::endl;
    std::cout << "Ruleset: " << to_string(config.ruleset) << std::endl;
    std::cout << "Format: " << to_string(config.format) << std::endl;
    if (config.difficulty.has_value()) {
        std::cout << "Difficulty: " << to_string(config.difficulty.value()) << std::endl;
    }
    std::cout << std::endl;
    print_score(state, "Score");
    std::cout << "Round: " << state.round_index() << std::endl << std::endl;
}

void print_round_summary(const MatchState &state, const bool show_ascii) {
    const MatchConfig &config = state.config();
    const RoundRecord &record = state.history().back();
    std::cout << "Round " << record.round << std::endl;
    std::cout << config.player1 << " chose: " << to_string(record.player1_move) << std::endl;
    if (show_ascii) {
        std::cout << ascii_move(record.player1_move) << std::endl;
    }
    std::cout << config.player2 << " chose: " << to_string(record.player2_move) << std::endl;
    if (show_ascii) {
        std::cout << ascii_move(record.player2_move) << std::endl;
    }

    std::cout << std::endl;
    if (record.outcome == RoundOutcome::TIE) {
        std::cout << "===== TIE ROUND =====" << std::endl;
    } else {
        const std::string &winner =
            record.outcome == RoundOutcome::PLAYER1 ? config.player1 : config.player2;
        std::cout << "===== " << winner << " WINS =====" << std::endl;
    }
    std::cout << std::endl;
    print_score(state, "Current Score");
}

void view_match_history(const MatchState &state) {
    clear_screen();
    if (state.history().empty()) {
        std::cout << "No rounds played yet." << std::endl;
    }
    for (const auto &record : state.history()) {
        std::cout << "Round " << record.round << ": " << to_string(record.player1_move) << " vs "
                  << to_string(record.player2_move) << " => " << to_string(record.outcome)
                  << std::endl;
    }
    pause();
}

void show_victory(const MatchState &state, const MatchResult &result) {
    std::cout << "Match Complete!" << std::endl << std::endl;
    if (result.winner.has_value()) {
        std::cout << "Winner: " << result.winner.value() << std::endl;
    } else {
        std::cout << "It ended in a tie." << std::endl;
    }
    std::cout << std::endl;
    print_score(state, "Final Score");
}

void save_scoreboard(const Scoreboard &scoreboard, const Options &options) {
    proto::Scoreboard proto;
    pack_into(scoreboard, &proto);
    if (!rps::proto::write_to_file(proto, options.scoreboard_file)) {
        std::cout << "Scoreboard was not saved." << std::endl;
    }
}

Scoreboard load_scoreboard(const Options &options) {
    const auto maybe_proto = rps::proto::load_from_file<proto::Scoreboard>(options.scoreboard_file);
    if (!maybe_proto.has_value()) {
        return {};
    }
    try {
        return unpack_from(maybe_proto.value());
    } catch (const MalformedPersistedState &e) {
        std::cout << e.what() << ", starting an empty scoreboard" << std::endl;
        return {};
    }
}

std::optional<MatchState> load_saved_match(const Options &options) {
    const auto maybe_proto = rps::proto::load_from_file<proto::MatchState>(options.save_file);
    if (!maybe_proto.has_value()) {
        return std::nullopt;
    }
    try {
        return unpack_from(maybe_proto.value());
    } catch (const MalformedPersistedState &e) {
        std::cout << e.what() << std::endl;
        return std::nullopt;
    }
}

// Completes the match and asks whether to play again. Returns true for a rematch.
bool finish_match(MatchState &state, const MatchResult &result, Scoreboard &scoreboard,
                  const Options &options) {
    clear_screen();
    show_victory(state, result);

    scoreboard.add_match_result(result);
    save_scoreboard(scoreboard, options);
    // The match may never have been saved, so a missing file is not an error
    std::error_code error;
    std::filesystem::remove(options.save_file, error);

    std::cout << std::endl << "1) Rematch" << std::endl;
    std::cout << "2) Rematch with new settings" << std::endl;
    std::cout << "3) Return to main menu" << std::endl;
    const int choice = read_menu_choice(1, 3);
    if (choice == 1) {
        state.reset_for_rematch();
    } else if (choice == 2) {
        state.reset_for_rematch(change_settings(state.config()));
    }
    return choice != 3;
}

void run_match(MatchState &state, Scoreboard &scoreboard, const Options &options,
               InOut<std::mt19937> gen) {
    const MatchConfig &config = state.config();
    scoreboard.ensure_player(config.player1);
    scoreboard.ensure_player(config.player2);

    while (true) {
        const auto maybe_result = match_result(state);
        if (maybe_result.has_value()) {
            if (!finish_match(state, maybe_result.value(), scoreboard, options)) {
                return;
            }
            continue;
        }

        clear_screen();
        print_match_header(state);

        if (config.mode == Mode::SINGLE_PLAYER) {
            const Move human = read_move(config.player1, config.ruleset, false);
            state.advance_round_vs_computer(human, gen);
        } else {
            const Move move1 = read_move(config.player1, config.ruleset, true);
            const Move move2 = read_move(config.player2, config.ruleset, true);
            state.advance_round(move1, move2);
        }

        clear_screen();
        print_round_summary(state, options.show_ascii);

        while (true) {
            std::cout << std::endl << "Options:" << std::endl;
            std::cout << "1) Next round" << std::endl;
            std::cout << "2) View match history" << std::endl;
            std::cout << "3) Save and return to main menu" << std::endl;
            std::cout << "4) Return to main menu without saving" << std::endl;
            const int choice = read_menu_choice(1, 4);
            if (choice == 1) {
                break;
            } else if (choice == 2) {
                view_match_history(state);
                clear_screen();
                print_round_summary(state, options.show_ascii);
            } else if (choice == 3) {
                proto::MatchState proto;
                pack_into(state, &proto);
                if (!rps::proto::write_to_file(proto, options.save_file)) {
                    std::cout << "Match was not saved." << std::endl;
                    pause();
                }
                save_scoreboard(scoreboard, options);
                return;
            } else {
                save_scoreboard(scoreboard, options);
                return;
            }
        }
    }
}

void view_scoreboard(const Scoreboard &scoreboard) {
    while (true) {
        clear_screen();
        if (scoreboard.empty()) {
            std::cout << "Scoreboard is empty." << std::endl;
            pause();
            return;
        }

        std::cout << "Scoreboard" << std::endl;
        std::cout << "1) Sort by matches won" << std::endl;
        std::cout << "2) Sort by win rate" << std::endl;
        std::cout << "3) Sort by rounds won" << std::endl;
        std::cout << "4) Back" << std::endl;
        const int choice = read_menu_choice(1, 4);
        if (choice == 4) {
            return;
        }
        const ScoreboardSort sort = choice == 1   ? ScoreboardSort::MATCHES_WON
                                    : choice == 2 ? ScoreboardSort::WIN_RATE
                                                  : ScoreboardSort::ROUNDS_WON;

        clear_screen();
        std::cout << std::left << std::setw(20) << "Player" << std::right << std::setw(7) << "MP"
                  << std::setw(7) << "MW" << std::setw(9) << "RW" << std::setw(11) << "WinRate"
                  << std::endl;
        std::cout << std::string(54, '-') << std::endl;
        for (const auto &[name, stats] : scoreboard.sorted(sort)) {
            std::cout << std::left << std::setw(20) << name << std::right << std::setw(7)
                      << stats.matches_played << std::setw(7) << stats.matches_won << std::setw(9)
                      << stats.rounds_won << std::setw(10) << std::fixed << std::setprecision(0)
                      << stats.win_rate() * 100.0 << "%" << std::endl;
        }
        pause();
    }
}

void main_menu(const Options &options, const std::optional<int> &seed) {
    std::mt19937 gen(seed.has_value() ? seed.value() : std::random_device()());
    Scoreboard scoreboard = load_scoreboard(options);

    while (true) {
        clear_screen();
        std::cout << "          Main menu" << std::endl << std::endl;
        std::cout << "1) Start a new game" << std::endl;
        std::cout << "2) Continue the saved game" << std::endl;
        std::cout << "3) View the scoreboard" << std::endl;
        std::cout << "4) Exit" << std::endl;

        const int choice = read_menu_choice(1, 4);
        if (choice == 1) {
            MatchState state(new_game_setup());
            run_match(state, scoreboard, options, make_in_out(gen));
        } else if (choice == 2) {
            auto maybe_state = load_saved_match(options);
            if (maybe_state.has_value()) {
                run_match(maybe_state.value(), scoreboard, options, make_in_out(gen));
            } else {
                std::cout << std::endl << "No saved game found." << std::endl;
                pause();
            }
        } else if (choice == 3) {
            view_scoreboard(scoreboard);
        } else {
            save_scoreboard(scoreboard, options);
            std::cout << std::endl << "Goodbye." << std::endl;
            return;
        }
    }
}
}  // namespace
}  // namespace rps::domain

int main(int argc, char **argv) {
    cxxopts::Options options("rock_paper_scissors",
                             "Rock, Paper, Scissors (and Lizard, Spock) against a friend or the "
                             "computer");
    // clang-format off
    options.add_options()
      ("save_file", "Where an unfinished match is saved", cxxopts::value<std::string>()->default_value("rps_save.pb"))
      ("scoreboard_file", "Where cumulative player stats are kept", cxxopts::value<std::string>()->default_value("rps_scoreboard.pb"))
      ("seed", "Seed for the computer opponent", cxxopts::value<int>())
      ("no_ascii", "Don't draw the moves")
      ("help", "Print usage");
    // clang-format on
    auto args = options.parse(argc, argv);
    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    const std::optional<int> seed =
        args.count("seed") ? std::make_optional(args["seed"].as<int>()) : std::nullopt;
    rps::domain::main_menu(
        {
            .save_file = args["save_file"].as<std::string>(),
            .scoreboard_file = args["scoreboard_file"].as<std::string>(),
            .show_ascii = args.count("no_ascii") == 0,
        },
        seed);
}
