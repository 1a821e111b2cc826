#ifndef CODE_GEN_HPP
#define CODE_GEN_HPP

// Emits the scanner as a single C source file.
// Output depends only on its arguments and the options,
// so identical syntax files produce byte-identical scanners.

#include <string>
#include <string_view>

struct dfa_t;
struct syntax_file_t;

// Counts output lines so that '#line' directives can point back
// into the generated file after a block of user code.
class code_writer_t
{
public:
    code_writer_t(std::string output_name, bool line_directives)
    : m_output_name(std::move(output_name))
    , m_line_directives(line_directives)
    {}

    code_writer_t& operator<<(std::string_view str);
    code_writer_t& operator<<(char c) { return *this << std::string_view(&c, 1); }
    code_writer_t& operator<<(unsigned u) { return *this << std::to_string(u); }

    // Points the following lines at 'line' of the syntax file.
    void line_to_source(unsigned line, std::string const& source_name);

    // Points the following lines back at the generated file.
    void line_to_output();

    // Number of complete lines written so far.
    unsigned lines() const { return m_lines; }

    std::string const& str() const { return m_out; }
private:
    std::string m_out;
    std::string m_output_name;
    unsigned m_lines = 0;
    bool m_line_directives;
};

std::string gen_c_scanner(syntax_file_t const& file, dfa_t const& dfa,
                          std::string const& source_name, std::string const& output_name);

// Name of the narrowest unsigned C type that holds 'max'.
char const* c_table_type(unsigned max);

#endif
