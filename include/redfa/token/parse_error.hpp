#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace redfa {

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& what, std::size_t position);

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

class UnbalancedParentheses : public ParseError {
public:
    using ParseError::ParseError;
};

class DanglingOperator : public ParseError {
public:
    using ParseError::ParseError;
};

class UnsupportedSymbol : public ParseError {
public:
    UnsupportedSymbol(char symbol, std::size_t position);

    char symbol() const { return symbol_; }

private:
    char symbol_;
};

}  // namespace redfa
