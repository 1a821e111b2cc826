#include <catch2/catch.hpp>
#include "regex_parser.hpp"

#include "compiler_error.hpp"

namespace
{

std::string parse(std::string const& pattern, definition_table_t const& defs = {})
{
    file_contents_t const file("test.l", pattern);
    return to_string(*parse_regex(file, { 0, std::uint32_t(pattern.size()) }, defs));
}

error_kind_t parse_error(std::string const& pattern, definition_table_t const& defs = {}, std::string_view defining = {})
{
    file_contents_t const file("test.l", pattern);
    try
    {
        parse_regex(file, { 0, std::uint32_t(pattern.size()) }, defs, defining);
    }
    catch(compiler_error_t const& e)
    {
        return e.kind;
    }
    FAIL("no error for " << pattern);
    return ERR_WARNING;
}

// Parses 'pattern' as if it were the definition of 'name'.
void define(definition_table_t& defs, std::string const& name, std::string const& pattern)
{
    file_contents_t const file("defs.l", pattern);
    pstring_t const p = { 0, std::uint32_t(pattern.size()) };
    REQUIRE(defs.define({ name, p, p, parse_regex(file, p, defs, name) }));
}

} // end anon namespace

TEST_CASE("parse_regex precedence", "[regex_parser]")
{
    REQUIRE(parse("a") == "a");
    REQUIRE(parse("ab") == "(ab)");
    REQUIRE(parse("abc") == "((ab)c)");
    REQUIRE(parse("a|b") == "(a|b)");
    REQUIRE(parse("a|b|c") == "((a|b)|c)");
    REQUIRE(parse("ab|c") == "((ab)|c)");
    REQUIRE(parse("ab*") == "(a(b)*)");
    REQUIRE(parse("(ab)*") == "((ab))*");
    REQUIRE(parse("a+?") == "((a)+)?");
    REQUIRE(parse("(a|)") == "(a|())");
}

TEST_CASE("parse_regex atoms", "[regex_parser]")
{
    REQUIRE(parse(".") == ".");
    REQUIRE(parse("\"if\"") == "(if)");
    REQUIRE(parse("\"a*\"") == "(a\\*)");
    REQUIRE(parse("\\*") == "\\*");
    REQUIRE(parse("\\n") == "\\n");
    REQUIRE(parse("\\t") == "\\t");
    REQUIRE(parse("\\x41") == "A");
    REQUIRE(parse("\\101") == "A");
    REQUIRE(parse("\\0") == "\\0");
    REQUIRE(parse("^$") == "(^$)");
}

TEST_CASE("parse_regex bracket expressions", "[regex_parser]")
{
    REQUIRE(parse("[a-z]") == "[a-z]");
    REQUIRE(parse("[^a-z]") == "[^a-z]");
    REQUIRE(parse("[]a]") == "[\\]a]");
    REQUIRE(parse("[a-]") == "[\\-a]");
    REQUIRE(parse("[ \\t]") == "[\\t ]");
    REQUIRE(parse("[[:digit:]]") == "[0-9]");
    REQUIRE(parse("[[:blank:]]") == "[\\t ]");
    REQUIRE(parse("[[:xdigit:]_]") == "[0-9A-F_a-f]");
}

TEST_CASE("parse_regex repetition bounds", "[regex_parser]")
{
    REQUIRE(parse("a{2}") == "(a){2}");
    REQUIRE(parse("a{2,}") == "(a){2,}");
    REQUIRE(parse("a{2,5}") == "(a){2,5}");
    REQUIRE(parse("a{0,1000}") == "(a){0,1000}");

    REQUIRE(parse_error("a{5,2}") == ERR_REPEAT_BOUNDS);
    REQUIRE(parse_error("a{1001}") == ERR_REPEAT_BOUNDS);
    REQUIRE(parse_error("a{2") == ERR_REPEAT_BOUNDS);
}

TEST_CASE("parse_regex nested repetition size", "[regex_parser]")
{
    REQUIRE(parse("(a{100}){100}") == "((a){100}){100}");
    REQUIRE(parse_error("(a{1000}){1000}") == ERR_REPEAT_BOUNDS);
    REQUIRE(parse_error("((ab){400}){400,}") == ERR_REPEAT_BOUNDS);

    // The error points at the outer bounds.
    std::string const pattern = "(a{1000}){1000}";
    file_contents_t const file("test.l", pattern);
    try
    {
        parse_regex(file, { 0, std::uint32_t(pattern.size()) }, {});
        FAIL("expected an error");
    }
    catch(compiler_error_t const& e)
    {
        REQUIRE(e.offset == 9);
    }

    // Definitions used over and over multiply out too.
    definition_table_t defs;
    define(defs, "A", "a{1000}");
    define(defs, "B", "({A}){50}");
    REQUIRE(parse_error("{B}{B}{B}", defs) == ERR_REPEAT_BOUNDS);
}

TEST_CASE("parse_regex definitions", "[regex_parser]")
{
    definition_table_t defs;
    define(defs, "DIGIT", "[0-9]");
    define(defs, "NUMBER", "{DIGIT}+");

    REQUIRE(parse("{DIGIT}", defs) == "[0-9]");
    REQUIRE(parse("{NUMBER}\\.{DIGIT}*", defs) == "((([0-9])+\\.)([0-9])*)");
    REQUIRE(parse("x{NUMBER}", defs) == "(x([0-9])+)");

    // Definitions are spliced in as copies.
    REQUIRE(defs.lookup("NUMBER"));
    REQUIRE(to_string(*defs.lookup("NUMBER")->regex) == "([0-9])+");

    REQUIRE(parse_error("{UNKNOWN}", defs) == ERR_UNDEFINED_MACRO);
    REQUIRE(parse_error("{DIGIT", defs) == ERR_UNDEFINED_MACRO);
    REQUIRE(parse_error("a{SELF}", defs, "SELF") == ERR_CYCLIC_MACRO);
}

TEST_CASE("parse_regex errors", "[regex_parser]")
{
    REQUIRE(parse_error("") == ERR_EMPTY_PATTERN);
    REQUIRE(parse_error("[a-z") == ERR_UNTERMINATED_BRACKET);
    REQUIRE(parse_error("[^") == ERR_UNTERMINATED_BRACKET);
    REQUIRE(parse_error("\"abc") == ERR_UNTERMINATED_STRING);
    REQUIRE(parse_error("[[:bogus:]]") == ERR_POSIX_CLASS);
    REQUIRE(parse_error("(ab") == ERR_UNBALANCED_PAREN);
    REQUIRE(parse_error("ab)") == ERR_UNBALANCED_PAREN);
    REQUIRE(parse_error("*a") == ERR_NOTHING_TO_REPEAT);
    REQUIRE(parse_error("a|+") == ERR_NOTHING_TO_REPEAT);
    REQUIRE(parse_error("[z-a]") == ERR_BAD_RANGE);
    REQUIRE(parse_error("a\\") == ERR_BAD_ESCAPE);
    REQUIRE(parse_error("\\xg") == ERR_BAD_ESCAPE);
}

TEST_CASE("parse_regex error location", "[regex_parser]")
{
    std::string const pattern = "ab[cd";
    file_contents_t const file("test.l", pattern);
    definition_table_t const defs;
    try
    {
        parse_regex(file, { 0, std::uint32_t(pattern.size()) }, defs);
        FAIL("expected an error");
    }
    catch(compiler_error_t const& e)
    {
        REQUIRE(e.kind == ERR_UNTERMINATED_BRACKET);
        REQUIRE(e.offset == 2);
    }
}
