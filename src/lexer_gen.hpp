#ifndef LEXER_GEN_HPP
#define LEXER_GEN_HPP

// Drives the pipeline:
//   syntax file -> NFA -> DFA -> minimized DFA -> C source

#include <functional>
#include <ostream>
#include <string>

#include "dfa.hpp"
#include "file.hpp"
#include "nfa.hpp"
#include "parser.hpp"

struct lexer_t
{
    syntax_file_t syntax;
    nfa_t nfa;
    dfa_t dfa; // Minimized, unless disabled by the options.
    std::size_t unminimized_size = 0;
};

// Called after each phase with its name. Used to print build times.
using phase_fn = std::function<void(char const*)>;

// Throws compiler_error_t on errors in 'file'.
// Issues warnings for rules which can never match or which match
// the empty string.
lexer_t compile_lexer(file_contents_t const& file, phase_fn const& phase_done = {});

std::string gen_lexer_source(lexer_t const& lexer, file_contents_t const& file,
                             std::string const& output_name);

// Scans 'input' with the INITIAL condition, printing one line per token.
// Returns false if it stopped at unrecognized input.
bool simulate_lexer(lexer_t const& lexer, file_contents_t const& input, std::ostream& o);

void print_stats(lexer_t const& lexer, std::ostream& o);

#endif
