#pragma once

#include <string_view>
#include "dfa.hpp"

namespace redfa::dfa {

class DFAMatcher {
public:
    explicit DFAMatcher(DFA&& dfa);

    bool is_match(std::string_view str) const;

    const DFA& dfa() const { return dfa_; }

    DFA extract() &&;

private:
    DFA dfa_;
};

}  // namespace redfa::dfa
