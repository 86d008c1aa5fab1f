#pragma once

#include <boost/dynamic_bitset.hpp>
#include <cstddef>
#include <initializer_list>
#include <vector>
#include "nfa.hpp"

namespace redfa::nfa {

// Fixed-width bitset over the states of one NFA. Used as the canonical key of
// a DFA state: two sets of the same width are equal iff they hold the same
// states, whatever order the states were inserted in.
class StateSet {
public:
    StateSet() = default;
    explicit StateSet(std::size_t width);
    StateSet(std::size_t width, std::initializer_list<StateID> states);

    void insert(StateID state);
    bool contains(StateID state) const;

    bool empty() const { return bits_.none(); }
    std::size_t size() const { return bits_.count(); }
    std::size_t width() const { return bits_.size(); }

    std::vector<StateID> to_vector() const;

    template <typename F>
    void for_each(F&& f) const {
        for (auto i = bits_.find_first(); i != boost::dynamic_bitset<>::npos;
             i = bits_.find_next(i)) {
            f(static_cast<StateID>(i));
        }
    }

    bool operator==(const StateSet&) const = default;
    bool operator<(const StateSet& other) const { return bits_ < other.bits_; }

private:
    boost::dynamic_bitset<> bits_;
};

}  // namespace redfa::nfa
