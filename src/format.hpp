#ifndef FORMAT_HPP
#define FORMAT_HPP

// String formatting for diagnostics and generated code.

#include <cstdio>
#include <sstream>
#include <string>
#include <string_view>

template<char F>
void fmt_impl(std::ostringstream& ss, char const* str)
{
    while(*str)
        ss.rdbuf()->sputc(*str++);
}

template<char F, typename T, typename... Ts>
void fmt_impl(std::ostringstream& ss, char const* str, T const& t, Ts const&... ts)
{
    while(*str)
    {
        char const c = *str++;
        if(c == F)
        {
            ss << t;
            fmt_impl<F>(ss, str, ts...);
            return;
        }
        else
            ss.rdbuf()->sputc(c);
    }
}

// Each 'F' in 'str' is replaced by the next argument.
// Example use: fmt("rule % at line %", index, line)
// Use a different 'F' when the text itself holds '%', e.g. printf formats.
template<char F = '%', typename... Ts>
std::string fmt(char const* str, Ts const&... ts)
{
    std::ostringstream ss;
    fmt_impl<F>(ss, str, ts...);
    return ss.str();
}

// Two lowercase hex digits, e.g. "0a".
inline std::string hex_byte(unsigned char c)
{
    constexpr char digits[] = "0123456789abcdef";
    return { digits[c >> 4], digits[c & 0xF] };
}

// Escapes 'str' so it can appear inside a C string literal.
inline std::string c_escape(std::string_view str)
{
    std::string ret;
    ret.reserve(str.size());
    for(char c : str)
    {
        if(c == '\\' || c == '"')
            ret.push_back('\\');
        ret.push_back(c);
    }
    return ret;
}

#endif
