#ifndef PARSER_HPP
#define PARSER_HPP

// Syntax file parser overview:
// - Line-oriented: definitions, '%%', rules, optional '%%' and epilogue.
// - Patterns are parsed into trees as soon as their line is read, so later
//   definitions can only refer to earlier ones.
// - Throws on error, which GREATLY simplifies the logic.
//   - Recovering from parse errors takes a lot of work and complexity. KISS!

#include <string>
#include <vector>

#include <boost/container/small_vector.hpp>

#include "file.hpp"
#include "macro.hpp"
#include "pstring.hpp"
#include "regex.hpp"

namespace bc = ::boost::container;

constexpr unsigned INITIAL_CONDITION = 0;

// Verbatim code, copied into the generated scanner.
struct code_block_t
{
    std::string text;
    unsigned line = 0; // Line of the syntax file holding the first line of 'text'.
};

struct action_t
{
    std::string text;
    unsigned line = 0;
    pstring_t pstring = {};

    bool is_empty() const { return text.empty(); }
};

struct rule_t
{
    unsigned index;        // Declaration order; lower wins ties.
    pstring_t pstring;     // Location of the pattern text.
    rptr regex;
    unsigned action;       // Index into syntax_file_t::actions.
    bc::small_vector<unsigned, 2> conditions; // Sorted start conditions.
};

struct start_condition_t
{
    std::string name;
    bool exclusive = false;
    pstring_t pstring = {};
};

struct syntax_file_t
{
    definition_table_t definitions;
    std::vector<start_condition_t> conditions; // [0] is always INITIAL.
    std::vector<rule_t> rules;
    std::vector<action_t> actions; // Shared between continuation rules.

    std::vector<code_block_t> prologue;      // Before the generated declarations.
    std::vector<code_block_t> scan_prologue; // At the start of the scanning function.
    code_block_t epilogue;
    bool has_epilogue = false;

    // %option settings:
    bool yywrap = true;
    bool emit_main = false;

    rule_t const& rule(unsigned i) const { return rules.at(i); }
    action_t const& action_of(rule_t const& rule) const { return actions.at(rule.action); }
};

syntax_file_t parse_syntax_file(file_contents_t const& file);

#endif
