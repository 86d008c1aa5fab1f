#include "from_postfix.hpp"
#include <fmt/core.h>
#include <stack>
#include "nfa.hpp"

namespace redfa::nfa {

namespace {

struct Fragment {
    StateID start;
    StateID end;
};

template <typename T>
constexpr bool always_false = false;

Fragment pop_operand(std::stack<Fragment>& frag_stack,
                     const token::Token& op) {
    if (frag_stack.empty()) {
        throw BuildError(fmt::format("Missing operand for '{}' at position {}",
                                     token::to_char(op), token::position(op)));
    }
    Fragment top = frag_stack.top();
    frag_stack.pop();
    return top;
}

void handle_literal(NFA& nfa,
                    std::stack<Fragment>& frag_stack,
                    const token::Literal& tok) {
    const auto start = nfa.create_state();
    const auto end = nfa.create_state();
    nfa.add_transition(start, tok.value, end);
    frag_stack.push(Fragment{start, end});
}

void handle_concatenation(NFA& nfa,
                          std::stack<Fragment>& frag_stack,
                          const token::Token& op) {
    Fragment rhs = pop_operand(frag_stack, op);
    Fragment lhs = pop_operand(frag_stack, op);

    nfa.add_transition(lhs.end, EpsilonTransition{}, rhs.start);
    frag_stack.push(Fragment{lhs.start, rhs.end});
}

void handle_alternation(NFA& nfa,
                        std::stack<Fragment>& frag_stack,
                        const token::Token& op) {
    Fragment rhs = pop_operand(frag_stack, op);
    Fragment lhs = pop_operand(frag_stack, op);

    const auto new_start = nfa.create_state();
    const auto new_end = nfa.create_state();

    nfa.add_transition(new_start, EpsilonTransition{}, lhs.start);
    nfa.add_transition(new_start, EpsilonTransition{}, rhs.start);
    nfa.add_transition(lhs.end, EpsilonTransition{}, new_end);
    nfa.add_transition(rhs.end, EpsilonTransition{}, new_end);

    frag_stack.push(Fragment{new_start, new_end});
}

void handle_kleene_star(NFA& nfa,
                        std::stack<Fragment>& frag_stack,
                        const token::Token& op) {
    Fragment inner = pop_operand(frag_stack, op);

    const auto new_start = nfa.create_state();
    const auto new_end = nfa.create_state();

    nfa.add_transition(new_start, EpsilonTransition{}, inner.start);
    nfa.add_transition(new_start, EpsilonTransition{}, new_end);
    nfa.add_transition(inner.end, EpsilonTransition{}, inner.start);
    nfa.add_transition(inner.end, EpsilonTransition{}, new_end);

    frag_stack.push(Fragment{new_start, new_end});
}

}  // namespace

NFA from_postfix(const std::vector<token::Token>& postfix) {
    NFA nfa;
    std::stack<Fragment> frag_stack;

    for (const auto& token : postfix) {
        std::visit(
            [&](auto&& tok) {
                using T = std::decay_t<decltype(tok)>;

                if constexpr (std::is_same_v<T, token::Literal>) {
                    handle_literal(nfa, frag_stack, tok);
                } else if constexpr (std::is_same_v<T, token::Concatenation>) {
                    handle_concatenation(nfa, frag_stack, token);
                } else if constexpr (std::is_same_v<T, token::Alternation>) {
                    handle_alternation(nfa, frag_stack, token);
                } else if constexpr (std::is_same_v<T, token::KleeneStar>) {
                    handle_kleene_star(nfa, frag_stack, token);
                } else if constexpr (std::is_same_v<T, token::GroupOpen> ||
                                     std::is_same_v<T, token::GroupClose>) {
                    throw BuildError(
                        "Unexpected grouping operator in postfix notation");
                } else {
                    static_assert(always_false<T>, "Non-exhaustive visitor");
                }
            },
            token);
    }

    if (frag_stack.size() != 1) {
        throw BuildError(fmt::format(
            "Malformed expression stack: {} fragments remaining",
            frag_stack.size()));
    }

    const Fragment final_frag = frag_stack.top();
    nfa.start_state = final_frag.start;
    nfa.accept_state = final_frag.end;

    return nfa;
}

}  // namespace redfa::nfa
