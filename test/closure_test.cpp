#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <vector>

#include "closure.hpp"
#include "nfa.hpp"
#include "state_set.hpp"

using namespace redfa::nfa;

namespace {

// 0 -e-> 1 -e-> 2 -e-> 0, 2 -a-> 3 -e-> 4, 1 -b-> 1, 4 -a-> 0
NFA cyclic_nfa() {
    NFA nfa;
    for (int i = 0; i < 5; ++i) nfa.create_state();
    nfa.add_transition(0, EpsilonTransition{}, 1);
    nfa.add_transition(1, EpsilonTransition{}, 2);
    nfa.add_transition(2, EpsilonTransition{}, 0);
    nfa.add_transition(2, 'a', 3);
    nfa.add_transition(3, EpsilonTransition{}, 4);
    nfa.add_transition(1, 'b', 1);
    nfa.add_transition(4, 'a', 0);
    nfa.start_state = 0;
    nfa.accept_state = 4;
    return nfa;
}

}  // namespace

TEST(StateSet, Basics) {
    StateSet set(130);
    EXPECT_TRUE(set.empty());
    set.insert(129);
    set.insert(3);
    set.insert(64);
    set.insert(3);
    EXPECT_FALSE(set.empty());
    EXPECT_EQ(set.size(), 3u);
    EXPECT_TRUE(set.contains(64));
    EXPECT_FALSE(set.contains(65));
    EXPECT_FALSE(set.contains(500));
    EXPECT_EQ(set.to_vector(), (std::vector<StateID>{3, 64, 129}));
    EXPECT_THROW(set.insert(130), std::out_of_range);
}

TEST(StateSet, Canonical) {
    StateSet a(10, {7, 1, 4});
    StateSet b(10, {4, 7, 1, 1});
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a < b || b < a);

    StateSet c(10, {1, 4});
    EXPECT_NE(a, c);
    EXPECT_TRUE(a < c || c < a);

    std::map<StateSet, int> index;
    index[a] = 1;
    index[b] = 2;
    index[c] = 3;
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.at(a), 2);
}

TEST(StateSet, WideSet) {
    StateSet a(70, {0, 65});
    a.insert(69);
    EXPECT_EQ(a.to_vector(), (std::vector<StateID>{0, 65, 69}));
    EXPECT_EQ(a.size(), 3u);
    EXPECT_EQ(a.width(), 70u);
}

TEST(Closure, EpsilonCycle) {
    auto nfa = cyclic_nfa();
    EXPECT_EQ(epsilon_closure(nfa, StateSet(5, {0})), StateSet(5, {0, 1, 2}));
    EXPECT_EQ(epsilon_closure(nfa, StateSet(5, {2})), StateSet(5, {0, 1, 2}));
    EXPECT_EQ(epsilon_closure(nfa, StateSet(5, {3})), StateSet(5, {3, 4}));
    EXPECT_EQ(epsilon_closure(nfa, StateSet(5, {4})), StateSet(5, {4}));
    EXPECT_TRUE(epsilon_closure(nfa, StateSet(5)).empty());
}

TEST(Closure, ContainsInput) {
    auto nfa = cyclic_nfa();
    StateSet input(5, {1, 3});
    auto closure = epsilon_closure(nfa, input);
    input.for_each([&](StateID s) { EXPECT_TRUE(closure.contains(s)); });
}

TEST(Closure, Move) {
    auto nfa = cyclic_nfa();
    StateSet all(5, {0, 1, 2, 3, 4});
    EXPECT_EQ(move(nfa, all, 'a'), StateSet(5, {0, 3}));
    EXPECT_EQ(move(nfa, all, 'b'), StateSet(5, {1}));
    EXPECT_TRUE(move(nfa, all, 'c').empty());
    // Epsilon edges are not followed.
    EXPECT_EQ(move(nfa, StateSet(5, {0, 2}), 'a'), StateSet(5, {3}));
    EXPECT_TRUE(move(nfa, StateSet(5, {0}), 'a').empty());
}
