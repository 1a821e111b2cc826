#include "charset.hpp"

#include "format.hpp"

std::string byte_to_string(unsigned char c)
{
    switch(c)
    {
    case '\n': return "\\n";
    case '\t': return "\\t";
    case '\r': return "\\r";
    case '\f': return "\\f";
    case '\v': return "\\v";
    case '\0': return "\\0";
    case '\\': return "\\\\";
    case '"':  return "\\\"";
    case '-':  return "\\-";
    case '[':  return "\\[";
    case ']':  return "\\]";
    default:
        if(c < 0x20 || c >= 0x7F)
            return "\\x" + hex_byte(c);
        return std::string(1, char(c));
    }
}

std::string charset_t::to_string() const
{
    if(all_set())
        return "[\\x00-\\xff]";

    std::string str = "[";
    for_each_range([&](byte_range_t r)
    {
        str += byte_to_string(r.lo);
        if(r.hi == r.lo + 1)
            str += byte_to_string(r.hi);
        else if(r.hi != r.lo)
        {
            str += '-';
            str += byte_to_string(r.hi);
        }
    });
    str += "]";
    return str;
}
