#include "nfa_matcher.hpp"
#include <utility>
#include "closure.hpp"

namespace redfa::nfa {

NFAMatcher::NFAMatcher(NFA&& nfa) : nfa_(std::move(nfa)) {}

bool NFAMatcher::is_match(std::string_view input) const {
    auto current =
        epsilon_closure(nfa_, StateSet(nfa_.size(), {nfa_.start_state}));

    for (char c : input) {
        auto next_states = move(nfa_, current, c);
        if (next_states.empty()) {
            return false;
        }
        current = epsilon_closure(nfa_, next_states);
    }

    return current.contains(nfa_.accept_state);
}

NFA NFAMatcher::extract() && {
    return std::move(nfa_);
}

}  // namespace redfa::nfa
