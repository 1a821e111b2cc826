#include <catch2/catch.hpp>
#include "lexer_gen.hpp"

#include <sstream>

#include "compiler_error.hpp"
#include "guard.hpp"
#include "options.hpp"

namespace
{

error_kind_t compile_error(std::string const& source)
{
    file_contents_t const file("test.l", source);
    try
    {
        compile_lexer(file);
    }
    catch(compiler_error_t const& e)
    {
        return e.kind;
    }
    FAIL("no error for:\n" << source);
    return ERR_READ;
}

} // end anon namespace

TEST_CASE("compile_lexer phases", "[lexer_gen]")
{
    options_t const saved = _options;
    auto guard = make_scope_guard([&]{ _options = saved; });

    file_contents_t const file("test.l", "%%\n(a|b)c x;\n[a-z] y;\n");

    std::vector<std::string> phases;
    lexer_t const lexer = compile_lexer(file, [&](char const* name) { phases.push_back(name); });
    REQUIRE(phases == std::vector<std::string>{ "parse", "nfa", "dfa", "minimize" });
    REQUIRE(lexer.dfa.size() < lexer.unminimized_size);

    _options.minimize = false;
    lexer_t const unminimized = compile_lexer(file);
    REQUIRE(unminimized.dfa.size() == unminimized.unminimized_size);
}

TEST_CASE("compile_lexer warnings", "[lexer_gen]")
{
    options_t const saved = _options;
    auto guard = make_scope_guard([&]{ _options = saved; });
    _options.werror = true;

    // Shadowed by the earlier rule.
    REQUIRE(compile_error("%%\n[a-z]+ x;\n\"if\" y;\n") == ERR_WARNING);

    // Matches the empty string.
    REQUIRE(compile_error("%%\na* x;\n") == ERR_WARNING);

    file_contents_t const clean("test.l", "%%\n\"if\" y;\n[a-z]+ x;\n");
    REQUIRE_NOTHROW(compile_lexer(clean));
}

TEST_CASE("simulate_lexer", "[lexer_gen]")
{
    file_contents_t const file("test.l",
        "%%\n"
        "\"if\"    k;\n"
        "[a-z]+  i;\n"
        "[ \\n]   s;\n");
    lexer_t const lexer = compile_lexer(file);

    {
        std::ostringstream ss;
        REQUIRE(simulate_lexer(lexer, file_contents_t("input", "if x\nifs"), ss));
        REQUIRE(ss.str() ==
            "0 1 \"if\"\n"
            "2 1 \" \"\n"
            "1 1 \"x\"\n"
            "2 1 \"\\n\"\n"
            "1 2 \"ifs\"\n");
    }

    {
        std::ostringstream ss;
        REQUIRE(!simulate_lexer(lexer, file_contents_t("input", "if 9"), ss));
        REQUIRE(ss.str() == "0 1 \"if\"\n2 1 \" \"\n");
    }
}
