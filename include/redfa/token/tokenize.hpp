#pragma once

#include <string_view>
#include <vector>
#include "token.hpp"

namespace redfa::token {

// Classifies every character of the pattern. Concatenation is never produced
// here; it is inserted by the postfix converter.
std::vector<Token> tokenize(std::string_view regex);

}  // namespace redfa::token
