#include "domain/rock_paper_scissors.hh"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

#include "domain/errors.hh"

namespace rps::domain {
namespace {
struct Edge {
    Move winner;
    Move loser;
};

constexpr std::array<Edge, 3> CLASSIC_EDGES{{
    {Move::ROCK, Move::SCISSORS},
    {Move::PAPER, Move::ROCK},
    {Move::SCISSORS, Move::PAPER},
}};

constexpr std::array<Edge, 10> EXTENDED_EDGES{{
    {Move::ROCK, Move::SCISSORS},
    {Move::ROCK, Move::LIZARD},
    {Move::PAPER, Move::ROCK},
    {Move::PAPER, Move::SPOCK},
    {Move::SCISSORS, Move::PAPER},
    {Move::SCISSORS, Move::LIZARD},
    {Move::LIZARD, Move::SPOCK},
    {Move::LIZARD, Move::PAPER},
    {Move::SPOCK, Move::SCISSORS},
    {Move::SPOCK, Move::ROCK},
}};

template <std::size_t N>
bool has_edge(const std::array<Edge, N> &edges, const Move a, const Move b) {
    return std::any_of(edges.begin(), edges.end(),
                       [a, b](const Edge &edge) { return edge.winner == a && edge.loser == b; });
}

std::string lowercase(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (const char c : in) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

void check_legal(const Ruleset ruleset, const Move move) {
    if (!is_legal(ruleset, move)) {
        std::stringstream msg;
        msg << to_string(move) << " is not a legal move under the " << to_string(ruleset)
            << " ruleset";
        throw InvalidMove(msg.str());
    }
}
}  // namespace

std::vector<Move> legal_moves(const Ruleset ruleset) {
    if (ruleset == Ruleset::CLASSIC) {
        return {Move::ROCK, Move::PAPER, Move::SCISSORS};
    }
    return {Move::ROCK, Move::PAPER, Move::SCISSORS, Move::LIZARD, Move::SPOCK};
}

bool is_legal(const Ruleset ruleset, const Move move) {
    return ruleset == Ruleset::EXTENDED || (move != Move::LIZARD && move != Move::SPOCK);
}

bool beats(const Ruleset ruleset, const Move a, const Move b) {
    if (ruleset == Ruleset::CLASSIC) {
        return has_edge(CLASSIC_EDGES, a, b);
    }
    return has_edge(EXTENDED_EDGES, a, b);
}

RoundOutcome resolve(const Ruleset ruleset, const Move a, const Move b) {
    check_legal(ruleset, a);
    check_legal(ruleset, b);

    if (a == b) {
        return RoundOutcome::TIE;
    }
    return beats(ruleset, a, b) ? RoundOutcome::PLAYER1 : RoundOutcome::PLAYER2;
}

std::string_view trim(std::string_view in) {
    const auto is_space = [](const char c) { return std::isspace(static_cast<unsigned char>(c)); };
    while (!in.empty() && is_space(in.front())) {
        in.remove_prefix(1);
    }
    while (!in.empty() && is_space(in.back())) {
        in.remove_suffix(1);
    }
    return in;
}

std::optional<Move> parse_move(std::string_view input, const Ruleset ruleset) {
    const std::string token = lowercase(trim(input));
    std::optional<Move> out;
    if (token == "rock" || token == "r") {
        out = Move::ROCK;
    } else if (token == "paper" || token == "p") {
        out = Move::PAPER;
    } else if (token == "scissors" || token == "s") {
        out = Move::SCISSORS;
    } else if (token == "lizard" || token == "l") {
        out = Move::LIZARD;
    } else if (token == "spock" || token == "k") {
        out = Move::SPOCK;
    }

    if (out.has_value() && !is_legal(ruleset, out.value())) {
        return std::nullopt;
    }
    return out;
}

std::string accepted_inputs(const Ruleset ruleset) {
    if (ruleset == Ruleset::CLASSIC) {
        return "rock / paper / scissors  OR  r / p / s";
    }
    return "rock / paper / scissors / lizard / spock  OR  r / p / s / l / k";
}

std::string to_string(const Move move) {
    switch (move) {
        case Move::ROCK:
            return "Rock";
        case Move::PAPER:
            return "Paper";
        case Move::SCISSORS:
            return "Scissors";
        case Move::LIZARD:
            return "Lizard";
        case Move::SPOCK:
            return "Spock";
    }
    return std::string(wise_enum::to_string(move));
}

std::string to_string(const Ruleset ruleset) {
    return ruleset == Ruleset::CLASSIC ? "Classic" : "Extended";
}
}  // namespace rps::domain
