#include "regex_parser.hpp"

#include <cctype>

#include "assert.hpp"
#include "compiler_error.hpp"
#include "format.hpp"

namespace
{

template<typename F>
charset_t pred(F f)
{
    charset_t set;
    for(unsigned c = 0; c < 128; ++c)
        if(f(c))
            set.set(c);
    return set;
}

class regex_parser_t
{
public:
    regex_parser_t(file_contents_t const& file, pstring_t pattern,
                   definition_table_t const& definitions, std::string_view defining)
    : file(file)
    , pattern(pattern)
    , definitions(definitions)
    , defining(defining)
    , begin(file.source() + pattern.offset)
    , end(begin + pattern.size)
    , ptr(begin)
    {}

    rptr parse()
    {
        if(begin == end)
            error(ERR_EMPTY_PATTERN, begin, "Empty pattern.");

        rptr ret = parse_union();

        if(ptr != end)
        {
            passert(*ptr == ')', *ptr);
            error(ERR_UNBALANCED_PAREN, ptr, "Unbalanced ')'.");
        }

        // Definitions spliced into definitions can also multiply out.
        if(expanded_size(*ret) > MAX_EXPANDED_SIZE)
            error(ERR_REPEAT_BOUNDS, begin, "Pattern is too large once its repetitions are expanded.", end - begin);

        return ret;
    }

private:
    file_contents_t const& file;
    pstring_t const pattern;
    definition_table_t const& definitions;
    std::string_view const defining;

    char const* const begin;
    char const* const end;
    char const* ptr;

    bool at_end() const { return ptr == end; }
    unsigned char peek(unsigned i = 0) const { return ptr + i < end ? ptr[i] : '\0'; }
    bool has(unsigned i = 0) const { return ptr + i < end; }

    pstring_t at(char const* p, std::size_t size = 1) const
        { return { pattern.offset + std::uint32_t(p - begin), std::uint32_t(size) }; }

    [[gnu::noreturn]]
    void error(error_kind_t kind, char const* p, std::string const& what, std::size_t size = 1) const
        { compiler_error(file, at(p, size), kind, what); }

    rptr parse_union()
    {
        rptr ret = parse_concat();
        while(has() && *ptr == '|')
        {
            ++ptr;
            ret = uor(std::move(ret), parse_concat());
        }
        return ret;
    }

    rptr parse_concat()
    {
        rptr ret;
        while(has() && *ptr != '|' && *ptr != ')')
        {
            rptr atom = parse_postfix();
            if(!ret)
                ret = std::move(atom);
            else
                ret = cat(std::move(ret), std::move(atom));
        }
        if(!ret)
            return empty();
        return ret;
    }

    static bool is_repeat_op(unsigned char c) { return c == '*' || c == '+' || c == '?'; }
    bool at_bounds() const { return has() && *ptr == '{' && std::isdigit(peek(1)); }

    rptr parse_postfix()
    {
        if(is_repeat_op(peek()) || at_bounds())
            error(ERR_NOTHING_TO_REPEAT, ptr, fmt("Nothing to repeat before '%'.", char(peek())));

        rptr ret = parse_atom();

        while(has())
        {
            switch(*ptr)
            {
            case '*': ++ptr; ret = kleene(std::move(ret)); continue;
            case '+': ++ptr; ret = many1(std::move(ret)); continue;
            case '?': ++ptr; ret = maybe(std::move(ret)); continue;
            case '{':
                if(!at_bounds())
                    return ret;
                ret = parse_bounds(std::move(ret));
                continue;
            default:
                return ret;
            }
        }

        return ret;
    }

    unsigned parse_uint(char const* start)
    {
        unsigned value = 0;
        while(has() && std::isdigit(peek()))
        {
            value = value * 10 + (*ptr++ - '0');
            if(value > MAX_REPEAT)
                error(ERR_REPEAT_BOUNDS, start, fmt("Repetition bound exceeds %.", MAX_REPEAT), ptr - start);
        }
        return value;
    }

    // Parses {n}, {n,} and {n,m}.
    rptr parse_bounds(rptr inner)
    {
        char const* const start = ptr;
        ++ptr; // Skip '{'

        unsigned const min = parse_uint(start);
        unsigned max = min;

        if(peek() == ',')
        {
            ++ptr;
            if(std::isdigit(peek()))
                max = parse_uint(start);
            else
                max = REPEAT_INF;
        }

        if(peek() != '}')
            error(ERR_REPEAT_BOUNDS, start, "Malformed repetition bounds.", ptr - start + 1);
        ++ptr;

        if(max != REPEAT_INF && min > max)
            error(ERR_REPEAT_BOUNDS, start, fmt("Invalid repetition bounds {%,%}.", min, max), ptr - start);

        rptr ret = repeat(std::move(inner), min, max);
        if(expanded_size(*ret) > MAX_EXPANDED_SIZE)
            error(ERR_REPEAT_BOUNDS, start, "Repetition is too large once expanded.", ptr - start);
        return ret;
    }

    rptr parse_atom()
    {
        char const* const start = ptr;
        unsigned char const c = *ptr++;

        switch(c)
        {
        case '(':
            {
                rptr inner = parse_union();
                if(!has() || *ptr != ')')
                    error(ERR_UNBALANCED_PAREN, start, "Unbalanced '('.");
                ++ptr;
                return inner;
            }

        case '[':
            return parse_bracket(start);

        case '"':
            return parse_string(start);

        case '.':
            return any();

        case '\\':
            return literal(parse_escape(start));

        case '{':
            return parse_reference(start);

        default:
            return literal(c);
        }
    }

    // Called after the backslash has been consumed.
    unsigned char parse_escape(char const* start)
    {
        if(at_end())
            error(ERR_BAD_ESCAPE, start, "Trailing backslash.");

        unsigned char const c = *ptr++;
        switch(c)
        {
        case 'n': return '\n';
        case 't': return '\t';
        case 'r': return '\r';
        case 'f': return '\f';
        case 'v': return '\v';
        case 'a': return '\a';
        case 'b': return '\b';

        case 'x':
            {
                unsigned value = 0;
                unsigned digits = 0;
                for(; digits < 2 && std::isxdigit(peek()); ++digits, ++ptr)
                {
                    unsigned char const d = *ptr;
                    value = value * 16 + (std::isdigit(d) ? d - '0' : std::tolower(d) - 'a' + 10);
                }
                if(digits == 0)
                    error(ERR_BAD_ESCAPE, start, "Expecting hex digits after \\x.", 2);
                return value;
            }

        default:
            if(c >= '0' && c <= '7')
            {
                unsigned value = c - '0';
                for(unsigned digits = 1; digits < 3 && peek() >= '0' && peek() <= '7'; ++digits)
                    value = value * 8 + (*ptr++ - '0');
                if(value > 0xFF)
                    error(ERR_BAD_ESCAPE, start, "Octal escape out of range.", ptr - start);
                return value;
            }
            return c;
        }
    }

    // Called after the opening quote has been consumed.
    rptr parse_string(char const* start)
    {
        std::string str;
        while(true)
        {
            if(at_end())
                error(ERR_UNTERMINATED_STRING, start, "Unterminated string.", ptr - start);

            char const* const c = ptr++;
            if(*c == '"')
                break;
            if(*c == '\\')
                str.push_back(parse_escape(c));
            else
                str.push_back(*c);
        }
        return word(str);
    }

    // Called after the opening bracket has been consumed.
    rptr parse_bracket(char const* start)
    {
        bc::small_vector<byte_range_t, 4> ranges;
        bool negated = false;

        if(peek() == '^' && has())
        {
            negated = true;
            ++ptr;
        }

        bool first = true;
        while(true)
        {
            if(at_end())
                error(ERR_UNTERMINATED_BRACKET, start, "Unterminated bracket expression.", ptr - start);

            if(*ptr == ']' && !first)
            {
                ++ptr;
                break;
            }
            first = false;

            // POSIX classes, e.g. [:digit:]
            if(*ptr == '[' && peek(1) == ':')
            {
                char const* const class_start = ptr;
                char const* name_end = ptr + 2;
                while(name_end + 1 < end && !(name_end[0] == ':' && name_end[1] == ']'))
                    ++name_end;

                if(name_end + 1 < end)
                {
                    std::string_view const name(class_start + 2, name_end - class_start - 2);
                    charset_t set;
                    if(!posix_class(name, set))
                        error(ERR_POSIX_CLASS, class_start, fmt("Unknown POSIX class [:%:].", name), name_end + 2 - class_start);
                    set.for_each_range([&](byte_range_t r) { ranges.push_back(r); });
                    ptr = name_end + 2;
                    continue;
                }
            }

            char const* const lo_start = ptr;
            unsigned char lo = *ptr++;
            if(lo == '\\')
                lo = parse_escape(lo_start);

            if(peek() == '-' && has(1) && peek(1) != ']')
            {
                ++ptr; // Skip '-'
                char const* const hi_start = ptr;
                unsigned char hi = *ptr++;
                if(hi == '\\')
                    hi = parse_escape(hi_start);
                if(lo > hi)
                    error(ERR_BAD_RANGE, lo_start, fmt("Invalid range %-%.", byte_to_string(lo), byte_to_string(hi)), ptr - lo_start);
                ranges.push_back({ lo, hi });
            }
            else
                ranges.push_back({ lo, lo });
        }

        return char_class(std::move(ranges), negated);
    }

    // Called after the opening brace has been consumed.
    rptr parse_reference(char const* start)
    {
        char const* const name_begin = ptr;
        while(has() && (std::isalnum(peek()) || peek() == '_'))
            ++ptr;
        std::string_view const name(name_begin, ptr - name_begin);

        if(name.empty() || !std::isalpha(static_cast<unsigned char>(name[0])))
            error(ERR_REPEAT_BOUNDS, start, "Expecting a definition name or repetition bounds after '{'.");

        if(!has() || *ptr != '}')
            error(ERR_UNDEFINED_MACRO, start, "Unterminated definition reference.", ptr - start);
        ++ptr;

        if(!defining.empty() && name == defining)
            error(ERR_CYCLIC_MACRO, start, fmt("Definition % refers to itself.", name), ptr - start);

        definition_t const* def = definitions.lookup(name);
        if(!def)
            error(ERR_UNDEFINED_MACRO, start, fmt("Undefined definition %.", name), ptr - start);

        return clone(*def->regex);
    }
};

} // end anon namespace

bool posix_class(std::string_view name, charset_t& result)
{
    using namespace std::literals;

    if(name == "alnum"sv)       result = pred([](unsigned c) { return std::isalnum(c); });
    else if(name == "alpha"sv)  result = pred([](unsigned c) { return std::isalpha(c); });
    else if(name == "blank"sv)  result = pred([](unsigned c) { return c == ' ' || c == '\t'; });
    else if(name == "cntrl"sv)  result = pred([](unsigned c) { return std::iscntrl(c); });
    else if(name == "digit"sv)  result = pred([](unsigned c) { return std::isdigit(c); });
    else if(name == "graph"sv)  result = pred([](unsigned c) { return std::isgraph(c); });
    else if(name == "lower"sv)  result = pred([](unsigned c) { return std::islower(c); });
    else if(name == "print"sv)  result = pred([](unsigned c) { return std::isprint(c); });
    else if(name == "punct"sv)  result = pred([](unsigned c) { return std::ispunct(c); });
    else if(name == "space"sv)  result = pred([](unsigned c) { return std::isspace(c); });
    else if(name == "upper"sv)  result = pred([](unsigned c) { return std::isupper(c); });
    else if(name == "xdigit"sv) result = pred([](unsigned c) { return std::isxdigit(c); });
    else
        return false;
    return true;
}

rptr parse_regex(file_contents_t const& file, pstring_t pattern,
                 definition_table_t const& definitions,
                 std::string_view defining)
{
    return regex_parser_t(file, pattern, definitions, defining).parse();
}
