#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "state_set.hpp"

namespace redfa::dfa {

using StateID = std::size_t;

struct State {
    // Subset of NFA states this state stands for.
    nfa::StateSet subset;
    std::map<char, StateID> transitions;
    bool accepting = false;
};

class DFA {
public:
    DFA() = default;

    StateID create_state(nfa::StateSet subset, bool accepting);
    void add_transition(StateID from, char c, StateID to);
    bool is_accepting(StateID state) const;

    std::optional<StateID> find(const nfa::StateSet& subset) const;
    std::optional<StateID> next(StateID state, char c) const;

    std::size_t size() const { return states.size(); }

    std::vector<State> states;
    StateID start_state = 0;

private:
    std::map<nfa::StateSet, StateID> index_;
};

std::string describe(const DFA& dfa);

}  // namespace redfa::dfa
