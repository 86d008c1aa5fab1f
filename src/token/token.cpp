#include "token.hpp"

namespace redfa::token {

std::string to_string(const std::vector<Token>& tokens) {
    std::string result;
    result.reserve(tokens.size());
    for (const auto& token : tokens) {
        result.push_back(to_char(token));
    }
    return result;
}

}  // namespace redfa::token
