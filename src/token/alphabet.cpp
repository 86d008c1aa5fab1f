#include "alphabet.hpp"
#include <cstddef>
#include "parse_error.hpp"

namespace redfa::token {

std::set<char> extract_alphabet(std::string_view regex) {
    std::set<char> alphabet;
    for (std::size_t pos = 0; pos < regex.size(); ++pos) {
        const char c = regex[pos];
        if (is_literal_char(c)) {
            alphabet.insert(c);
        } else if (!is_operator_char(c)) {
            throw UnsupportedSymbol(c, pos);
        }
    }
    return alphabet;
}

std::set<char> extract_alphabet(const std::vector<Token>& tokens) {
    std::set<char> alphabet;
    for (const auto& token : tokens) {
        if (const auto* lit = std::get_if<Literal>(&token)) {
            alphabet.insert(lit->value);
        }
    }
    return alphabet;
}

}  // namespace redfa::token
