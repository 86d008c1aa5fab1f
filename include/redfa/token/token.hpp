#pragma once

#include <cstddef>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace redfa::token {

struct Literal {
    char value;
    std::size_t pos;
};
struct Concatenation {
    std::size_t pos;
};
struct Alternation {
    std::size_t pos;
};
struct KleeneStar {
    std::size_t pos;
};
struct GroupOpen {
    std::size_t pos;
};
struct GroupClose {
    std::size_t pos;
};

using Token = std::variant<Literal,
                           Concatenation,
                           Alternation,
                           KleeneStar,
                           GroupOpen,
                           GroupClose>;

inline std::size_t position(const Token& token) {
    return std::visit([](const auto& tok) { return tok.pos; }, token);
}

inline char to_char(const Token& token) {
    return std::visit(
        [](const auto& tok) {
            using T = std::decay_t<decltype(tok)>;
            if constexpr (std::is_same_v<T, Literal>) {
                return tok.value;
            } else if constexpr (std::is_same_v<T, Concatenation>) {
                return '.';
            } else if constexpr (std::is_same_v<T, Alternation>) {
                return '|';
            } else if constexpr (std::is_same_v<T, KleeneStar>) {
                return '*';
            } else if constexpr (std::is_same_v<T, GroupOpen>) {
                return '(';
            } else {
                return ')';
            }
        },
        token);
}

inline bool is_literal_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9');
}

inline bool is_operator_char(char c) {
    return c == '(' || c == ')' || c == '|' || c == '*';
}

// Renders a token sequence back to text, with '.' for concatenation.
std::string to_string(const std::vector<Token>& tokens);

}  // namespace redfa::token
