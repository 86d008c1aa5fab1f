#pragma once

#include "nfa.hpp"
#include "state_set.hpp"

namespace redfa::nfa {

// All states reachable from `states` through zero or more epsilon edges.
StateSet epsilon_closure(const NFA& nfa, const StateSet& states);

// All states reachable from `states` through exactly one edge labeled
// `symbol`. Epsilon edges are not followed.
StateSet move(const NFA& nfa, const StateSet& states, char symbol);

}  // namespace redfa::nfa
