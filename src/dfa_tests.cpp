#include <catch2/catch.hpp>
#include "dfa.hpp"

#include <stdexcept>

#include "byte_class.hpp"
#include "parser.hpp"

namespace
{

dfa_t build(std::string const& source)
{
    file_contents_t const file("test.l", source);
    syntax_file_t const syntax = parse_syntax_file(file);
    return nfa_to_dfa(build_nfa(syntax), syntax.rules.size());
}

unsigned accept_of(dfa_t const& dfa, std::string_view str, unsigned cond = 0)
{
    return dfa[dfa_walk(dfa, dfa.starts.at(cond), str)].accept;
}

} // end anon namespace

TEST_CASE("nfa_to_dfa reject state", "[dfa]")
{
    dfa_t const dfa = build("%%\nabc x;\n");

    REQUIRE(dfa.size() == 5); // reject, start, a, ab, abc
    REQUIRE(!dfa[REJECT_STATE].accepting());
    for(unsigned b = 0; b < NUM_BYTES; ++b)
        REQUIRE(dfa[REJECT_STATE].next[b] == REJECT_STATE);

    REQUIRE(dfa.starts.size() == 1);
    REQUIRE(dfa.starts[0] != REJECT_STATE);

    REQUIRE(dfa_walk(dfa, dfa.starts[0], "abd") == REJECT_STATE);
    REQUIRE(dfa_walk(dfa, dfa.starts[0], "abcabc") == REJECT_STATE);
    REQUIRE(accept_of(dfa, "abc") == 0);
    REQUIRE(accept_of(dfa, "ab") == NO_RULE);
}

TEST_CASE("nfa_to_dfa earliest rule wins", "[dfa]")
{
    dfa_t const dfa = build(
        "%%\n"
        "\"if\"                   k;\n"
        "[a-zA-Z][a-zA-Z0-9_]*  i;\n"
        "[0-9]+                 n;\n");

    REQUIRE(accept_of(dfa, "if") == 0);
    REQUIRE(accept_of(dfa, "i") == 1);
    REQUIRE(accept_of(dfa, "iffy") == 1);
    REQUIRE(accept_of(dfa, "x_1") == 1);
    REQUIRE(accept_of(dfa, "42") == 2);
    REQUIRE(accept_of(dfa, "4a") == NO_RULE);
    REQUIRE(unmatched_rules(dfa).empty());
}

TEST_CASE("nfa_to_dfa shadowed rules", "[dfa]")
{
    dfa_t const dfa = build(
        "%%\n"
        "[a-z]+   i;\n"
        "\"if\"     k;\n"
        "[0-9]    n;\n");

    REQUIRE(accept_of(dfa, "if") == 0);
    REQUIRE(unmatched_rules(dfa) == std::vector<unsigned>{ 1 });
}

TEST_CASE("nfa_to_dfa start conditions", "[dfa]")
{
    dfa_t const dfa = build(
        "%x STR\n"
        "%%\n"
        "\\\"          open;\n"
        "<STR>[^\"]+  body;\n"
        "<STR>\\\"     close;\n");

    REQUIRE(dfa.starts.size() == 2);
    REQUIRE(accept_of(dfa, "\"", 0) == 0);
    REQUIRE(accept_of(dfa, "\"", 1) == 2);
    REQUIRE(accept_of(dfa, "abc", 1) == 1);
    REQUIRE(accept_of(dfa, "abc", 0) == NO_RULE);
}

TEST_CASE("nfa_to_dfa is deterministic", "[dfa]")
{
    std::string const source =
        "D [0-9]\n"
        "%%\n"
        "{D}+(\\.{D}*)?   num;\n"
        "[a-z_]+         id;\n"
        "\"==\"|\"=\"        op;\n";

    dfa_t const a = build(source);
    dfa_t const b = build(source);

    REQUIRE(a.size() == b.size());
    REQUIRE(a.starts == b.starts);
    for(unsigned i = 0; i < a.size(); ++i)
    {
        REQUIRE(a[i].accept == b[i].accept);
        REQUIRE(a[i].next == b[i].next);
    }
}

TEST_CASE("nfa_to_dfa without rules", "[dfa]")
{
    nfa_t nfa;
    nfa.starts.push_back(nfa.new_state());
    REQUIRE_THROWS_AS(nfa_to_dfa(nfa, 0), std::logic_error);
}

TEST_CASE("byte classes", "[dfa]")
{
    byte_classes_t const classes = refine_byte_classes(
        { charset_t::range('a', 'z'), charset_t::range('0', '9'), charset_t::range('a', 'f') });

    REQUIRE(classes.size() == 4);
    REQUIRE(classes.class_of[0] == 0);
    REQUIRE(classes.class_of['0'] == 1);
    REQUIRE(classes.class_of['9'] == 1);
    REQUIRE(classes.class_of['a'] == 2);
    REQUIRE(classes.class_of['f'] == 2);
    REQUIRE(classes.class_of['g'] == 3);
    REQUIRE(classes.class_of['z'] == 3);
    REQUIRE(classes.class_of['!'] == 0);
    REQUIRE(classes.representative(3) == 'g');

    dfa_t const dfa = build("%%\n[a-z]+ id;\n[0-9]+ num;\n");
    byte_classes_t const dfa_classes = dfa_byte_classes(dfa);
    REQUIRE(dfa_classes.size() == 3);
    REQUIRE(dfa_classes.class_of['a'] == dfa_classes.class_of['q']);
    REQUIRE(dfa_classes.class_of['a'] != dfa_classes.class_of['5']);
}
