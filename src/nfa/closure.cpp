#include "closure.hpp"
#include <queue>

namespace redfa::nfa {

StateSet epsilon_closure(const NFA& nfa, const StateSet& states) {
    StateSet closure = states;
    std::queue<StateID> processing_queue;
    states.for_each([&](StateID s) { processing_queue.push(s); });

    while (!processing_queue.empty()) {
        auto current = processing_queue.front();
        processing_queue.pop();

        for (auto target : nfa.states[current].epsilon) {
            if (!closure.contains(target)) {
                closure.insert(target);
                processing_queue.push(target);
            }
        }
    }

    return closure;
}

StateSet move(const NFA& nfa, const StateSet& states, char symbol) {
    StateSet result(nfa.size());
    states.for_each([&](StateID s) {
        const auto& transitions = nfa.states[s].transitions;
        if (auto it = transitions.find(symbol); it != transitions.end()) {
            for (auto target : it->second) {
                result.insert(target);
            }
        }
    });
    return result;
}

}  // namespace redfa::nfa
