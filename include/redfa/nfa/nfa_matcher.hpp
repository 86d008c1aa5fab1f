#pragma once

#include <string_view>
#include "nfa.hpp"

namespace redfa::nfa {

// Recognizes input by simulating the NFA directly, one state set per symbol.
class NFAMatcher {
public:
    explicit NFAMatcher(NFA&& nfa);

    bool is_match(std::string_view str) const;

    const NFA& nfa() const { return nfa_; }

    NFA extract() &&;

private:
    NFA nfa_;
};

}  // namespace redfa::nfa
