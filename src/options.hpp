#ifndef OPTIONS_HPP
#define OPTIONS_HPP

// Generator options.

#include <string>
#include <filesystem>

namespace fs = ::std::filesystem;

constexpr char const* DEFAULT_OUTPUT = "lex.yy.c";

struct options_t
{
    bool graphviz = false;
    bool line_directives = true;
    bool minimize = true;
    bool build_time = false;
    bool stats = false;
    bool werror = false;

    // Empty means standard input.
    std::string input_file;
    // "-" means standard output.
    std::string output_file = DEFAULT_OUTPUT;
    // When set, tokens of this file are printed instead of generating code.
    std::string simulate_file;
};

extern options_t _options;
inline options_t const& compiler_options() { return _options; }

#endif
