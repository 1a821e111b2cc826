// A lexer generator; an alternative to 'lex' and 'flex'.

#include "lexer_gen.hpp"

#include <cstdio>

#include "byte_class.hpp"
#include "code_gen.hpp"
#include "compiler_error.hpp"
#include "format.hpp"
#include "minimize.hpp"
#include "options.hpp"
#include "scanner.hpp"

namespace
{

void check_rules(lexer_t const& lexer, file_contents_t const& file)
{
    syntax_file_t const& syntax = lexer.syntax;

    for(unsigned i : unmatched_rules(lexer.dfa))
    {
        compiler_warning(file, syntax.rule(i).pstring,
            fmt("Rule % can never be matched; earlier rules match everything it does.", i));
    }

    for(rule_t const& rule : syntax.rules)
    {
        if(nullable(*rule.regex))
        {
            compiler_warning(file, rule.pstring,
                fmt("Rule % can match the empty string, but empty tokens are never produced.", rule.index));
        }
    }
}

} // end anon namespace

lexer_t compile_lexer(file_contents_t const& file, phase_fn const& phase_done)
{
    auto const done = [&](char const* name)
    {
        if(phase_done)
            phase_done(name);
    };

    lexer_t lexer;

    lexer.syntax = parse_syntax_file(file);
    done("parse");

    lexer.nfa = build_nfa(lexer.syntax);
    done("nfa");

    lexer.dfa = nfa_to_dfa(lexer.nfa, lexer.syntax.rules.size());
    lexer.unminimized_size = lexer.dfa.size();
    done("dfa");

    check_rules(lexer, file);

    if(compiler_options().minimize)
    {
        lexer.dfa = minimize_dfa(lexer.dfa);
        done("minimize");
    }

    return lexer;
}

std::string gen_lexer_source(lexer_t const& lexer, file_contents_t const& file,
                             std::string const& output_name)
{
    std::string const name = output_name == "-" ? "<stdout>" : output_name;
    return gen_c_scanner(lexer.syntax, lexer.dfa, file.name(), name);
}

bool simulate_lexer(lexer_t const& lexer, file_contents_t const& input, std::ostream& o)
{
    std::string_view const view = input.view();
    scan_result_t const result = scan_all(lexer.dfa, view);

    unsigned line = 1;
    std::size_t counted = 0;
    auto const line_at = [&](std::size_t offset)
    {
        for(; counted < offset; ++counted)
            if(view[counted] == '\n')
                ++line;
        return line;
    };

    for(token_t const& token : result.tokens)
    {
        std::string text;
        for(char c : token.text(view))
            text += byte_to_string(c);
        o << fmt("% % \"%\"\n", token.rule, line_at(token.offset), text);
    }

    if(!result.ok())
    {
        std::fprintf(stderr, "%s", fmt_error(input, { std::uint32_t(result.error_pos), 1 },
            fmt("No rule matches '%'.", byte_to_string(view[result.error_pos]))).c_str());
        return false;
    }

    return true;
}

void print_stats(lexer_t const& lexer, std::ostream& o)
{
    o << "rules:         " << lexer.syntax.rules.size() << '\n';
    o << "conditions:    " << lexer.syntax.conditions.size() << '\n';
    o << "nfa states:    " << lexer.nfa.size() << '\n';
    o << "dfa states:    " << lexer.unminimized_size << '\n';
    o << "final states:  " << lexer.dfa.size() << '\n';
    o << "byte classes:  " << dfa_byte_classes(lexer.dfa).size() << '\n';
}
