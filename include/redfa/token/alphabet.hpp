#pragma once

#include <set>
#include <string_view>
#include <vector>
#include "token.hpp"

namespace redfa::token {

std::set<char> extract_alphabet(std::string_view regex);

std::set<char> extract_alphabet(const std::vector<Token>& tokens);

}  // namespace redfa::token
