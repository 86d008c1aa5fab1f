#include "nfa.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>
#include <stdexcept>

namespace redfa::nfa {

StateID NFA::create_state() {
    states.emplace_back();
    return states.size() - 1;
}

void NFA::add_transition(StateID from, TransitionCondition cond, StateID to) {
    if (to >= states.size()) {
        throw std::out_of_range("Transition target is not an NFA state");
    }
    auto& state = states.at(from);
    if (const auto* c = std::get_if<char>(&cond)) {
        state.transitions[*c].push_back(to);
    } else {
        state.epsilon.push_back(to);
    }
}

std::string describe(const NFA& nfa) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "start: {}, accept: {}\n", nfa.start_state,
                   nfa.accept_state);
    for (StateID id = 0; id < nfa.states.size(); ++id) {
        const auto& state = nfa.states[id];
        fmt::format_to(it, "State {}: edges={{", id);
        bool first = true;
        for (const auto& [symbol, targets] : state.transitions) {
            fmt::format_to(it, "{}{}: [{}]", first ? "" : ", ", symbol,
                           fmt::join(targets, ", "));
            first = false;
        }
        fmt::format_to(it, "}}, epsilon=[{}]\n",
                       fmt::join(state.epsilon, ", "));
    }
    return fmt::to_string(out);
}

}  // namespace redfa::nfa
