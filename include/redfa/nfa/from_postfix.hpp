#pragma once

#include <stdexcept>
#include <vector>
#include "nfa.hpp"
#include "token.hpp"

namespace redfa::nfa {

// Raised when a postfix sequence cannot be assembled into a single fragment.
// Well-formed output of the postfix converter never triggers it.
class BuildError : public std::runtime_error {
public:
    using BuildError::runtime_error::runtime_error;
};

// Thompson's construction over a postfix token sequence.
NFA from_postfix(const std::vector<token::Token>& postfix);

}  // namespace redfa::nfa
