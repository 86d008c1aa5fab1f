#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace redfa::nfa {

using StateID = std::size_t;

struct EpsilonTransition {};
using TransitionCondition = std::variant<EpsilonTransition, char>;

struct State {
    std::map<char, std::vector<StateID>> transitions;
    std::vector<StateID> epsilon;
};

// Append-only state arena. Identifiers are indices into `states` and are
// allocated by the NFA itself, so independent constructions never share them.
class NFA {
public:
    NFA() = default;

    StateID create_state();
    void add_transition(StateID from, TransitionCondition cond, StateID to);

    std::size_t size() const { return states.size(); }

    std::vector<State> states;
    StateID start_state = 0;
    StateID accept_state = 0;
};

std::string describe(const NFA& nfa);

}  // namespace redfa::nfa
