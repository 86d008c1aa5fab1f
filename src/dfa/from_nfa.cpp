#include "from_nfa.hpp"
#include <queue>
#include <utility>
#include "closure.hpp"

namespace redfa::dfa {

namespace {

std::set<char> collect_alphabet(const nfa::NFA& nfa) {
    std::set<char> chars;
    for (const auto& state : nfa.states) {
        for (const auto& [c, _] : state.transitions) {
            chars.insert(c);
        }
    }
    return chars;
}

}  // namespace

DFA from_nfa(const nfa::NFA& nfa, const std::set<char>& alphabet) {
    DFA dfa;

    auto initial_states = nfa::epsilon_closure(
        nfa, nfa::StateSet(nfa.size(), {nfa.start_state}));
    const bool initial_accepting = initial_states.contains(nfa.accept_state);
    const auto initial_id =
        dfa.create_state(std::move(initial_states), initial_accepting);
    dfa.start_state = initial_id;

    std::queue<StateID> processing;
    processing.push(initial_id);

    while (!processing.empty()) {
        const auto dfa_state = processing.front();
        processing.pop();

        for (char c : alphabet) {
            auto closure = nfa::epsilon_closure(
                nfa, nfa::move(nfa, dfa.states[dfa_state].subset, c));
            if (closure.empty()) {
                continue;
            }

            auto target = dfa.find(closure);
            if (!target) {
                const bool accepting = closure.contains(nfa.accept_state);
                target = dfa.create_state(std::move(closure), accepting);
                processing.push(*target);
            }

            dfa.add_transition(dfa_state, c, *target);
        }
    }

    return dfa;
}

DFA from_nfa(const nfa::NFA& nfa) {
    return from_nfa(nfa, collect_alphabet(nfa));
}

}  // namespace redfa::dfa
