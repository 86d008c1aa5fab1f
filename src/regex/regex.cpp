#include "regex.hpp"
#include <utility>
#include "alphabet.hpp"
#include "from_nfa.hpp"
#include "from_postfix.hpp"
#include "shunting_yard.hpp"
#include "tokenize.hpp"

namespace redfa {

using matcher_variant = std::variant<nfa::NFAMatcher, dfa::DFAMatcher>;

namespace {

matcher_variant make_matcher(std::string_view regex,
                             Regex::FlagType f,
                             const Log* log) {
    auto compiled = compile(regex, log);
    if (f & regex_constants::simulate_nfa) {
        return nfa::NFAMatcher(std::move(compiled.nfa_graph));
    } else {
        return dfa::DFAMatcher(std::move(compiled.dfa_graph));
    }
}

}  // namespace

Compiled compile(std::string_view regex, const Log* log) {
    REDFA_VLOG(log, "compiling '{}'", regex);

    const auto tokens = token::tokenize(regex);
    Compiled compiled;
    compiled.alphabet = token::extract_alphabet(tokens);
    compiled.postfix = token::shunting_yard(tokens);
    REDFA_DLOG(log, "{} tokens, postfix '{}'", tokens.size(),
               token::to_string(compiled.postfix));

    auto& graph = compiled.nfa_graph;
    graph = nfa::from_postfix(compiled.postfix);
    REDFA_DLOG(log, "NFA: {} states, start {}, accept {}", graph.size(),
               graph.start_state, graph.accept_state);

    compiled.dfa_graph = dfa::from_nfa(graph, compiled.alphabet);
    REDFA_VLOG(log, "DFA: {} states over {} symbols",
               compiled.dfa_graph.size(), compiled.alphabet.size());
    REDFA_ILOG(log, "compiled '{}' to {} NFA and {} DFA states", regex,
               graph.size(), compiled.dfa_graph.size());

    return compiled;
}

Regex::Regex(std::string_view regex, FlagType f, const Log* log)
    : matcher_(make_matcher(regex, f, log)) {}

bool Regex::is_match(std::string_view str) const {
    return std::visit(
        [str](const auto& matcher) { return matcher.is_match(str); }, matcher_);
}

bool match(std::string_view regex, std::string_view str) {
    return Regex(regex).is_match(str);
}

}  // namespace redfa
