#include <fmt/core.h>
#include <iostream>
#include <string_view>
#include <utility>
#include <vector>
#include "dfa_matcher.hpp"
#include "from_postfix.hpp"
#include "log.hpp"
#include "parse_error.hpp"
#include "regex.hpp"

int main(int argc, char** argv) {
    redfa::Log log(&std::cerr);
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-v") {
            log.set(redfa::Log::Level::Debug);
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        fmt::print(stderr, "usage: {} [-v] <regex> [input...]\n", argv[0]);
        return 2;
    }

    try {
        auto compiled = redfa::compile(args.front(), &log);
        fmt::print("regex: {}\n", args.front());
        fmt::print("postfix: {}\n", redfa::token::to_string(compiled.postfix));
        fmt::print("\nNFA:\n{}", redfa::nfa::describe(compiled.nfa_graph));
        fmt::print("\nDFA:\n{}", redfa::dfa::describe(compiled.dfa_graph));

        if (args.size() > 1) {
            fmt::print("\n");
            redfa::dfa::DFAMatcher matcher(std::move(compiled.dfa_graph));
            for (std::size_t i = 1; i < args.size(); ++i) {
                const auto input = args[i];
                fmt::print("'{}': {}\n", input,
                           matcher.is_match(input) ? "accept" : "reject");
            }
        }
    } catch (const redfa::ParseError& e) {
        REDFA_ELOG(&log, "syntax error: {}", e.what());
        return 1;
    } catch (const redfa::nfa::BuildError& e) {
        REDFA_ELOG(&log, "internal error: {}", e.what());
        return 3;
    }

    return 0;
}
