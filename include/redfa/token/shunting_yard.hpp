#pragma once

#include <optional>
#include <ranges>
#include <stack>
#include <vector>
#include <fmt/core.h>
#include "parse_error.hpp"
#include "token.hpp"

namespace redfa::token {

namespace detail {

template <typename... Alts, typename... Ts>
constexpr bool holds_any_of(const std::variant<Ts...>& v) noexcept {
    return (std::holds_alternative<Alts>(v) || ...);
}

inline int precedence(const Token& token) {
    return std::visit(
        [](auto&& tok) {
            using T = std::decay_t<decltype(tok)>;
            if constexpr (std::is_same_v<T, KleeneStar>) {
                return 3;
            } else if constexpr (std::is_same_v<T, Concatenation>) {
                return 2;
            } else if constexpr (std::is_same_v<T, Alternation>) {
                return 1;
            } else {
                return 0;
            }
        },
        token);
}

inline bool is_binary_operator(const Token& token) {
    return holds_any_of<Alternation, Concatenation>(token);
}

inline bool can_start_expr(const Token& token) {
    return holds_any_of<Literal, GroupOpen>(token);
}

// Moves operators binding at least as tight as `min_precedence` to the output.
// Stops at a group marker, whose precedence is 0.
inline void drain(std::stack<Token>& op_stack,
                  std::vector<Token>& output,
                  int min_precedence) {
    while (!op_stack.empty() &&
           precedence(op_stack.top()) >= min_precedence &&
           !std::holds_alternative<GroupOpen>(op_stack.top())) {
        output.push_back(op_stack.top());
        op_stack.pop();
    }
}

}  // namespace detail

// Infix to postfix conversion with implicit concatenation.
//
// Precedence is '*' > concatenation > '|'. A concatenation is inserted
// whenever a literal or '(' follows a literal, ')' or '*'. The star is a
// postfix operator with the highest precedence and is emitted directly.
template <std::ranges::input_range R>
std::vector<Token> shunting_yard(R&& tokens) {
    using namespace detail;
    std::vector<Token> output;
    std::stack<Token> op_stack;
    std::optional<Token> prev;
    bool prev_was_operand = false;

    for (auto&& token : tokens) {
        if (prev_was_operand && can_start_expr(token)) {
            drain(op_stack, output, precedence(Concatenation{}));
            op_stack.push(Concatenation{position(token)});
        }

        if (std::holds_alternative<GroupOpen>(token)) {
            op_stack.push(token);
            prev_was_operand = false;
        } else if (std::holds_alternative<GroupClose>(token)) {
            if (!prev_was_operand && prev) {
                if (std::holds_alternative<GroupOpen>(*prev)) {
                    throw ParseError("Empty group", position(*prev));
                }
                if (is_binary_operator(*prev)) {
                    throw DanglingOperator(
                        fmt::format("Missing right operand for '{}'",
                                    to_char(*prev)),
                        position(*prev));
                }
            }

            drain(op_stack, output, 0);
            if (op_stack.empty()) {
                throw UnbalancedParentheses("Unmatched ')'", position(token));
            }
            op_stack.pop();
            prev_was_operand = true;
        } else if (std::holds_alternative<KleeneStar>(token)) {
            if (!prev_was_operand) {
                throw DanglingOperator("Missing operand for '*'",
                                       position(token));
            }
            output.push_back(token);
            prev_was_operand = true;
        } else if (is_binary_operator(token)) {
            if (!prev_was_operand) {
                throw DanglingOperator(
                    fmt::format("Missing left operand for '{}'",
                                to_char(token)),
                    position(token));
            }
            drain(op_stack, output, precedence(token));
            op_stack.push(token);
            prev_was_operand = false;
        } else {
            output.push_back(token);
            prev_was_operand = true;
        }

        prev = token;
    }

    if (!prev) {
        throw ParseError("Empty expression", 0);
    }
    if (is_binary_operator(*prev)) {
        throw DanglingOperator(
            fmt::format("Missing right operand for '{}'", to_char(*prev)),
            position(*prev));
    }

    while (!op_stack.empty()) {
        if (std::holds_alternative<GroupOpen>(op_stack.top())) {
            throw UnbalancedParentheses("Unclosed '('",
                                        position(op_stack.top()));
        }
        output.push_back(op_stack.top());
        op_stack.pop();
    }

    return output;
}

}  // namespace redfa::token
