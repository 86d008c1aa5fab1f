#pragma once

#include <cstddef>
#include <set>
#include <string_view>
#include <variant>
#include <vector>
#include "dfa.hpp"
#include "dfa_matcher.hpp"
#include "log.hpp"
#include "nfa.hpp"
#include "nfa_matcher.hpp"
#include "token.hpp"

namespace redfa {

namespace regex_constants {

using OptionType = std::size_t;

inline constexpr OptionType none = 0;
inline constexpr OptionType simulate_nfa = 1;

}  // namespace regex_constants

// Every intermediate product of one compilation.
struct Compiled {
    std::set<char> alphabet;
    std::vector<token::Token> postfix;
    nfa::NFA nfa_graph;
    dfa::DFA dfa_graph;
};

// Runs the whole pipeline. Throws ParseError on bad input and
// nfa::BuildError if the builder receives a malformed postfix sequence.
Compiled compile(std::string_view regex, const Log* log = nullptr);

class Regex {
public:
    using FlagType = regex_constants::OptionType;

    explicit Regex(std::string_view regex,
                   FlagType f = regex_constants::none,
                   const Log* log = nullptr);

    bool is_match(std::string_view str) const;

private:
    std::variant<nfa::NFAMatcher, dfa::DFAMatcher> matcher_;
};

bool match(std::string_view regex, std::string_view str);

}  // namespace redfa
