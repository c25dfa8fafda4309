#pragma once

#include <stdexcept>
#include <string>

namespace rps::domain {

// A move outside the active ruleset's legal set, e.g. Spock under Classic.
struct InvalidMove : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Best of N with an even or zero count, or First to K with zero.
struct InvalidFormatParameter : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Player names or the mode/difficulty pairing are inconsistent.
struct InvalidConfig : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// A persisted record does not describe a reachable match.
struct MalformedPersistedState : public std::runtime_error {
    using std::runtime_error::runtime_error;
};
}  // namespace rps::domain
