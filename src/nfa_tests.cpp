#include <catch2/catch.hpp>
#include "nfa.hpp"

#include "parser.hpp"

namespace
{

// Returns the rule accepting all of 'str' from 'start', or NO_RULE.
unsigned nfa_match(nfa_t const& nfa, unsigned start, std::string_view str)
{
    nfa_set_t set = eclosure(nfa, { start });
    for(char c : str)
        set = eclosure(nfa, nfa_move(nfa, set, c));
    return lowest_accept(nfa, set);
}

bool matches(rptr const& regex, std::string_view str)
{
    nfa_t nfa;
    nfa_fragment_t const frag = build_rule_nfa(*regex, 0, nfa);
    return nfa_match(nfa, frag.start, str) == 0;
}

} // end anon namespace

TEST_CASE("build_nfa leaf fragments", "[nfa]")
{
    nfa_t nfa;
    nfa_fragment_t const frag = build_rule_nfa(*literal('a'), 7, nfa);

    REQUIRE(nfa.size() == 2);
    REQUIRE(nfa[frag.start].edges.size() == 1);
    REQUIRE(nfa[frag.start].edges[0].chars == charset_t::single('a'));
    REQUIRE(nfa[frag.start].edges[0].target == frag.accept);
    REQUIRE(nfa[frag.start].accept == NO_RULE);
    REQUIRE(nfa[frag.accept].accept == 7);

    REQUIRE(matches(any(), "\xff"));
    REQUIRE(matches(char_class(charset_t::range('a', 'c'), true), "z"));
    REQUIRE(!matches(char_class(charset_t::range('a', 'c'), true), "b"));
    REQUIRE(matches(empty(), ""));
    REQUIRE(!matches(empty(), "a"));
}

TEST_CASE("build_nfa operators", "[nfa]")
{
    REQUIRE(matches(word("abc"), "abc"));
    REQUIRE(!matches(word("abc"), "ab"));

    REQUIRE(matches(uor(literal('a'), literal('b')), "a"));
    REQUIRE(matches(uor(literal('a'), literal('b')), "b"));
    REQUIRE(!matches(uor(literal('a'), literal('b')), "ab"));

    REQUIRE(matches(kleene(literal('a')), ""));
    REQUIRE(matches(kleene(literal('a')), "aaaa"));
    REQUIRE(!matches(kleene(literal('a')), "aab"));

    REQUIRE(!matches(many1(literal('a')), ""));
    REQUIRE(matches(many1(literal('a')), "a"));
    REQUIRE(matches(many1(literal('a')), "aaa"));

    REQUIRE(matches(maybe(literal('a')), ""));
    REQUIRE(matches(maybe(literal('a')), "a"));
    REQUIRE(!matches(maybe(literal('a')), "aa"));

    REQUIRE(matches(kleene(word("ab")), "ababab"));
    REQUIRE(!matches(kleene(word("ab")), "aba"));
}

TEST_CASE("build_nfa bounded repetition", "[nfa]")
{
    REQUIRE(!matches(repeat(literal('a'), 2, 3), "a"));
    REQUIRE(matches(repeat(literal('a'), 2, 3), "aa"));
    REQUIRE(matches(repeat(literal('a'), 2, 3), "aaa"));
    REQUIRE(!matches(repeat(literal('a'), 2, 3), "aaaa"));

    REQUIRE(!matches(repeat(literal('a'), 2, REPEAT_INF), "a"));
    REQUIRE(matches(repeat(literal('a'), 2, REPEAT_INF), "aaaaaaa"));

    REQUIRE(matches(repeat(literal('a'), 3, 3), "aaa"));
    REQUIRE(!matches(repeat(literal('a'), 3, 3), "aaaa"));

    REQUIRE(matches(repeat(literal('a'), 0, 0), ""));
    REQUIRE(!matches(repeat(literal('a'), 0, 0), "a"));
}

TEST_CASE("build_nfa merges rules under condition starts", "[nfa]")
{
    file_contents_t const file("test.l",
        "%x STR\n"
        "%%\n"
        "\"if\"     a;\n"
        "[a-z]+   b;\n"
        "<STR>\\\"  c;\n");
    syntax_file_t const syntax = parse_syntax_file(file);
    nfa_t const nfa = build_nfa(syntax);

    REQUIRE(nfa.starts.size() == 2);
    REQUIRE(nfa[nfa.starts[0]].epsilon.size() == 2);
    REQUIRE(nfa[nfa.starts[1]].epsilon.size() == 1);

    // Both rules accept "if"; the earlier one has the lower index.
    REQUIRE(nfa_match(nfa, nfa.starts[0], "if") == 0);
    REQUIRE(nfa_match(nfa, nfa.starts[0], "iffy") == 1);
    REQUIRE(nfa_match(nfa, nfa.starts[0], "\"") == NO_RULE);
    REQUIRE(nfa_match(nfa, nfa.starts[1], "\"") == 2);
    REQUIRE(nfa_match(nfa, nfa.starts[1], "if") == NO_RULE);
}

TEST_CASE("edge_charsets", "[nfa]")
{
    nfa_t nfa;
    build_nfa(*cat(literal('a'), uor(literal('a'), char_class(charset_t::range('0', '9')))), nfa);

    std::vector<charset_t> const sets = edge_charsets(nfa);
    REQUIRE(sets.size() == 2);
}
