#pragma once

#include <set>
#include "dfa.hpp"
#include "nfa.hpp"

namespace redfa::dfa {

// Subset construction. Only symbols of `alphabet` are explored; a symbol with
// an empty successor subset gets no transition.
DFA from_nfa(const nfa::NFA& nfa, const std::set<char>& alphabet);

// Same as above, with the alphabet taken from the labeled NFA edges.
DFA from_nfa(const nfa::NFA& nfa);

}  // namespace redfa::dfa
