#include "compiler_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "format.hpp"
#include "options.hpp"
#include "assert.hpp"

namespace
{
    struct line_col_t
    {
        unsigned line;
        unsigned col;
    };

    line_col_t get_line_col(char const* src, pstring_t pstring)
    {
        line_col_t ret = { 1, 1 };

        for(std::size_t i = 0; i < pstring.offset; ++i)
        {
            if(src[i] == '\n')
            {
                ++ret.line;
                ret.col = 1;
            }
            else if(src[i] != '\r')
                ++ret.col;
        }

        return ret;
    }

    char const* get_line_begin(char const* src, pstring_t pstring)
    {
        while(pstring.offset && src[pstring.offset] == '\n')
            --pstring.offset;

        for(std::size_t i = pstring.offset;;--i)
        {
            if(src[i] == '\n')
                return src + std::min<std::size_t>(pstring.offset, i+1);
            if(i == 0)
                return src;
        }
    }

    char const* get_line_end(char const* src, pstring_t pstring)
    {
        auto const is_nl = [](char c) { return c == '\n' || c == '\r' || c == '\0'; };

        while(pstring.offset && src[pstring.offset] == '\n')
            --pstring.offset;

        for(std::size_t i = pstring.offset;; ++i)
            if(is_nl(src[i]))
                return src + i;
    }
} // end anon namespace

char const* to_string(error_kind_t kind)
{
    switch(kind)
    {
#define X(name, str) case name: return str;
    ERROR_KIND_XENUM
#undef X
    }
    return "?";
}

std::string fmt_source_pos(file_contents_t const& file, pstring_t pstring)
{
    line_col_t line_col = get_line_col(file.source(), pstring);
    return fmt(CONSOLE_BOLD "%:%:%" CONSOLE_RESET, file.name(), line_col.line, line_col.col);
}

std::string fmt_error(
    file_contents_t const& file, pstring_t pstring, std::string const& what,
    char const* color, char const* prefix)
{
    passert(pstring.offset <= file.size(), pstring.offset, file.size());

    std::string str(fmt("%: %%:" CONSOLE_RESET " %\n", fmt_source_pos(file, pstring), color, prefix, what));

    char const* line_begin = get_line_begin(file.source(), pstring);
    char const* line_end = get_line_end(file.source(), pstring);
    if(line_end <= line_begin)
        line_end = line_begin;

    std::string pre = fmt(" % | ", get_line_col(file.source(), pstring).line);

    str += pre;
    str.insert(str.end(), line_begin, line_end);
    str.push_back('\n');

    // Errors on line endings or past the end don't get a caret.
    char const* at = file.source() + pstring.offset;
    if(at < line_begin || at > line_end)
        return str;

    unsigned const caret_position = pre.size() + (at - line_begin);

    str.resize(str.size() + caret_position, ' ');

    str += color;

    // Don't underline past the end of the line.
    unsigned size = std::min<std::size_t>(pstring.size, line_end - at);
    while(size > 1 && std::isspace(static_cast<unsigned char>(at[size - 1])))
        --size;

    unsigned i = 0;
    do
        str.push_back('^');
    while(++i < size);

    str += CONSOLE_RESET;

    str.push_back('\n');
    return str;
}

std::string fmt_note(file_contents_t const& file, pstring_t pstring, std::string const& what)
{
    return fmt_error(file, pstring, what, CONSOLE_CYN CONSOLE_BOLD, "note");
}

std::string fmt_note(std::string const& what)
{
    return fmt(CONSOLE_BOLD CONSOLE_CYN "note: " CONSOLE_RESET "%\n", what);
}

std::string fmt_warning(file_contents_t const& file, pstring_t pstring, std::string const& what)
{
    return fmt_error(file, pstring, what, CONSOLE_YEL CONSOLE_BOLD, "warning");
}

std::string fmt_error(error_kind_t kind, std::string const& what)
{
    return fmt(CONSOLE_BOLD CONSOLE_RED "error[%]: " CONSOLE_RESET "%\n", to_string(kind), what);
}

std::string fmt_error(file_contents_t const& file, pstring_t pstring,
                      error_kind_t kind, std::string const& what)
{
    std::string const prefix = fmt("error[%]", to_string(kind));
    return fmt_error(file, pstring, what, CONSOLE_RED CONSOLE_BOLD, prefix.c_str());
}

void compiler_error(file_contents_t const& file, pstring_t pstring,
                    error_kind_t kind, std::string const& what)
{
    throw compiler_error_t(kind, fmt_error(file, pstring, kind, what), pstring.offset);
}

void compiler_error(error_kind_t kind, std::string const& what)
{
    throw compiler_error_t(kind, fmt_error(kind, what));
}

namespace
{
    void emit_warning(std::string msg, std::uint32_t offset)
    {
        if(compiler_options().werror)
        {
            msg += fmt_note("This is an error because --error-on-warning is enabled.");
            throw compiler_error_t(ERR_WARNING, std::move(msg), offset);
        }
        else
        {
            std::fputs(msg.c_str(), stderr);
            std::fflush(stderr);
        }
    }
}

void compiler_warning(file_contents_t const& file, pstring_t pstring, std::string const& what)
{
    emit_warning(fmt_warning(file, pstring, what), pstring.offset);
}
