#include "parse_error.hpp"
#include <fmt/core.h>

namespace redfa {

ParseError::ParseError(const std::string& what, std::size_t position)
    : std::runtime_error(fmt::format("{} at position {}", what, position)),
      position_(position) {}

UnsupportedSymbol::UnsupportedSymbol(char symbol, std::size_t position)
    : ParseError(fmt::format("Unsupported symbol '{}'", symbol), position),
      symbol_(symbol) {}

}  // namespace redfa
