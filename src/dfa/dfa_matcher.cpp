#include "dfa_matcher.hpp"
#include <utility>

namespace redfa::dfa {

DFAMatcher::DFAMatcher(DFA&& dfa) : dfa_(std::move(dfa)) {}

bool DFAMatcher::is_match(std::string_view str) const {
    if (dfa_.states.empty()) {
        return false;
    }
    auto current = dfa_.start_state;
    for (char c : str) {
        const auto& transitions = dfa_.states[current].transitions;
        if (auto it = transitions.find(c); it != transitions.end()) {
            current = it->second;
        } else {
            return false;
        }
    }
    return dfa_.is_accepting(current);
}

DFA DFAMatcher::extract() && {
    return std::move(dfa_);
}

}  // namespace redfa::dfa
