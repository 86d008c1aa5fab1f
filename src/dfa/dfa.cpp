#include "dfa.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace redfa::dfa {

StateID DFA::create_state(nfa::StateSet subset, bool accepting) {
    const StateID id = states.size();
    if (!index_.try_emplace(subset, id).second) {
        throw std::logic_error("DFA state for this subset already exists");
    }
    states.push_back(State{std::move(subset), {}, accepting});
    return id;
}

void DFA::add_transition(StateID from, char c, StateID to) {
    if (to >= states.size()) {
        throw std::out_of_range("Transition target is not a DFA state");
    }
    states.at(from).transitions[c] = to;
}

bool DFA::is_accepting(StateID state) const {
    return states.at(state).accepting;
}

std::optional<StateID> DFA::find(const nfa::StateSet& subset) const {
    if (auto it = index_.find(subset); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<StateID> DFA::next(StateID state, char c) const {
    const auto& transitions = states.at(state).transitions;
    if (auto it = transitions.find(c); it != transitions.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string describe(const DFA& dfa) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "start: {}\n", dfa.start_state);
    for (StateID id = 0; id < dfa.states.size(); ++id) {
        const auto& state = dfa.states[id];
        fmt::format_to(it, "DFAState({}, accept={}, nfa_states=[{}], ", id,
                       state.accepting,
                       fmt::join(state.subset.to_vector(), ", "));
        fmt::format_to(it, "transitions={{");
        bool first = true;
        for (const auto& [symbol, target] : state.transitions) {
            fmt::format_to(it, "{}{}: {}", first ? "" : ", ", symbol, target);
            first = false;
        }
        fmt::format_to(it, "}})\n");
    }
    return fmt::to_string(out);
}

}  // namespace redfa::dfa
