#include "tokenize.hpp"
#include <cstddef>
#include <string_view>
#include "parse_error.hpp"

namespace redfa::token {

std::vector<Token> tokenize(std::string_view regex) {
    std::vector<Token> tokens;
    tokens.reserve(regex.size());

    for (std::size_t pos = 0; pos < regex.size(); ++pos) {
        const char c = regex[pos];
        switch (c) {
            case '(':
                tokens.emplace_back(GroupOpen{pos});
                break;
            case ')':
                tokens.emplace_back(GroupClose{pos});
                break;
            case '|':
                tokens.emplace_back(Alternation{pos});
                break;
            case '*':
                tokens.emplace_back(KleeneStar{pos});
                break;
            default:
                if (!is_literal_char(c)) {
                    throw UnsupportedSymbol(c, pos);
                }
                tokens.emplace_back(Literal{c, pos});
                break;
        }
    }

    return tokens;
}

}  // namespace redfa::token
