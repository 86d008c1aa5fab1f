#include "state_set.hpp"
#include <stdexcept>

namespace redfa::nfa {

StateSet::StateSet(std::size_t width) : bits_(width) {}

StateSet::StateSet(std::size_t width, std::initializer_list<StateID> states)
    : StateSet(width) {
    for (auto state : states) {
        insert(state);
    }
}

void StateSet::insert(StateID state) {
    if (state >= bits_.size()) {
        throw std::out_of_range("State is outside of the set width");
    }
    bits_.set(state);
}

bool StateSet::contains(StateID state) const {
    return state < bits_.size() && bits_.test(state);
}

std::vector<StateID> StateSet::to_vector() const {
    std::vector<StateID> result;
    result.reserve(size());
    for_each([&result](StateID state) { result.push_back(state); });
    return result;
}

}  // namespace redfa::nfa
