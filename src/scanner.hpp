#ifndef SCANNER_HPP
#define SCANNER_HPP

// Runs a DFA over a string in-process, using the same maximal-munch
// algorithm as the generated scanner.

#include <cstddef>
#include <string_view>
#include <vector>

#include "dfa.hpp"
#include "parser.hpp"

struct match_t
{
    unsigned rule = NO_RULE;
    std::size_t length = 0;

    explicit operator bool() const { return rule != NO_RULE; }
};

struct token_t
{
    unsigned rule;
    std::size_t offset;
    std::size_t length;

    std::string_view text(std::string_view input) const { return input.substr(offset, length); }
};

constexpr std::size_t NO_POSITION = ~std::size_t(0);

struct scan_result_t
{
    std::vector<token_t> tokens;

    // Offset of the first unrecognized byte, or NO_POSITION.
    std::size_t error_pos = NO_POSITION;

    bool ok() const { return error_pos == NO_POSITION; }
};

// Finds the longest match starting at 'pos'.
// Returns a false match_t if no rule matches a non-empty prefix.
match_t next_token(dfa_t const& dfa, std::string_view input, std::size_t pos,
                   unsigned condition = INITIAL_CONDITION);

// Splits 'input' into tokens, stopping at the first unrecognized byte.
scan_result_t scan_all(dfa_t const& dfa, std::string_view input,
                       unsigned condition = INITIAL_CONDITION);

#endif
