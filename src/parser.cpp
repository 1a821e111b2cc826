#include "parser.hpp"

#include <algorithm>

#include "compiler_error.hpp"
#include "format.hpp"
#include "regex_parser.hpp"

using namespace std::literals;

namespace
{

struct line_t
{
    pstring_t pstring; // Excludes the line ending.
    unsigned number;
};

bool is_blank(char c) { return c == ' ' || c == '\t'; }

std::string_view trim_right(std::string_view v)
{
    while(v.size() && (is_blank(v.back()) || v.back() == '\r'))
        v.remove_suffix(1);
    return v;
}

std::string_view trim(std::string_view v)
{
    while(v.size() && is_blank(v.front()))
        v.remove_prefix(1);
    return trim_right(v);
}

bool is_separator(std::string_view v) { return trim_right(v) == "%%"sv; }

unsigned count_lines(std::string_view v) { return std::count(v.begin(), v.end(), '\n'); }

// Appends code, merging it into the previous block when the lines are adjacent.
void add_code(std::vector<code_block_t>& blocks, std::string_view text, unsigned line)
{
    if(blocks.size() && blocks.back().line + count_lines(blocks.back().text) == line)
        blocks.back().text += text;
    else
        blocks.push_back({ std::string(text), line });
}

class syntax_parser_t
{
public:
    explicit syntax_parser_t(file_contents_t const& file)
    : file(file)
    , src(file.source())
    , size(file.size())
    {}

    syntax_file_t parse()
    {
        result.conditions.push_back({ "INITIAL", false, {} });
        parse_definitions();
        parse_rules();
        return std::move(result);
    }

private:
    file_contents_t const& file;
    char const* const src;
    std::size_t const size;

    std::size_t next = 0; // Offset of the next unread line.
    unsigned line_number = 0; // Number of the last line read.

    syntax_file_t result;

    // Rules whose action is '|'. They take the action of the next rule
    // which has one, and are only committed once that action is known.
    struct pending_rule_t
    {
        pstring_t pstring;
        rptr regex;
        bc::small_vector<unsigned, 2> conditions;
    };
    bc::small_vector<pending_rule_t, 2> pending;

    std::string_view view(pstring_t p) const { return p.view(src); }
    pstring_t eof() const { return { std::uint32_t(size), 0 }; }

    [[gnu::noreturn]]
    void error(pstring_t at, error_kind_t kind, std::string const& what) const
        { compiler_error(file, at, kind, what); }

    bool read_line(line_t& line)
    {
        if(next >= size)
            return false;

        std::size_t const begin = next;
        std::size_t end = begin;
        while(end < size && src[end] != '\n')
            ++end;
        next = end < size ? end + 1 : end;

        if(end > begin && src[end-1] == '\r')
            --end;

        line = { { std::uint32_t(begin), std::uint32_t(end - begin) }, ++line_number };
        return true;
    }

    // Reads the lines of a '%{' block up to its closing '%}'.
    code_block_t read_code_block(line_t const& open)
    {
        code_block_t block;
        block.line = open.number + 1;

        line_t line;
        while(read_line(line))
        {
            std::string_view const v = view(line.pstring);
            if(v.starts_with("%}"sv))
                return block;
            block.text += v;
            block.text += '\n';
        }

        error(open.pstring.sub(0, 2), ERR_UNTERMINATED_CODE, "Unterminated %{ code block.");
    }

    // Reads a C comment starting at 'open', up to the line holding its '*/'.
    code_block_t read_comment(line_t const& open, std::size_t column)
    {
        code_block_t block;
        block.line = open.number;

        line_t line = open;
        std::string_view v = view(line.pstring);
        std::size_t search_from = column + 2;

        while(true)
        {
            block.text += v;
            block.text += '\n';

            if(v.find("*/"sv, std::min(search_from, v.size())) != std::string_view::npos)
                return block;

            if(!read_line(line))
                error(open.pstring.sub(column, 2), ERR_UNTERMINATED_CODE, "Unterminated comment.");
            v = view(line.pstring);
            search_from = 0;
        }
    }

    ///////////////////////////
    // Definitions section: //
    ///////////////////////////

    void parse_definitions()
    {
        line_t line;
        while(read_line(line))
        {
            std::string_view const v = view(line.pstring);

            if(is_separator(v))
                return;

            if(trim(v).empty())
                continue;

            if(v.starts_with("%{"sv))
                result.prologue.push_back(read_code_block(line));
            else if(v.starts_with("/*"sv))
                result.prologue.push_back(read_comment(line, 0));
            else if(is_blank(v.front()))
            {
                // Indented lines are code.
                add_code(result.prologue, std::string(v) + '\n', line.number);
            }
            else if(v.front() == '%')
                parse_directive(line);
            else
                parse_definition(line);
        }

        error(eof(), ERR_SECTION, "Missing %% separating definitions from rules.");
    }

    // Calls 'fn' with the pstring of each blank-separated word of 'line',
    // starting at column 'i'.
    template<typename Fn>
    void for_each_word(line_t const& line, std::size_t i, Fn const& fn)
    {
        std::string_view const v = view(line.pstring);
        while(true)
        {
            while(i < v.size() && is_blank(v[i]))
                ++i;
            if(i >= v.size())
                return;
            std::size_t const begin = i;
            while(i < v.size() && !is_blank(v[i]))
                ++i;
            fn(line.pstring.sub(begin, i - begin));
        }
    }

    void parse_directive(line_t const& line)
    {
        std::string_view const v = view(line.pstring);

        std::size_t i = 0;
        while(i < v.size() && !is_blank(v[i]))
            ++i;
        std::string_view const name = v.substr(0, i);

        if(name == "%x"sv || name == "%s"sv)
        {
            bool const exclusive = name == "%x"sv;
            bool any = false;
            for_each_word(line, i, [&](pstring_t word)
            {
                std::string_view const cond = view(word);
                if(!is_definition_name(cond))
                    error(word, ERR_DIRECTIVE, fmt("Malformed start condition name '%'.", cond));
                for(start_condition_t const& sc : result.conditions)
                    if(sc.name == cond)
                        error(word, ERR_DIRECTIVE, fmt("Duplicate start condition %.", cond));
                result.conditions.push_back({ std::string(cond), exclusive, word });
                any = true;
            });

            if(!any)
                error(line.pstring.sub(0, i), ERR_DIRECTIVE, fmt("Expecting start condition names after %.", name));
        }
        else if(name == "%option"sv)
        {
            for_each_word(line, i, [&](pstring_t word)
            {
                std::string_view const option = view(word);
                if(option == "noyywrap"sv)
                    result.yywrap = false;
                else if(option == "yywrap"sv)
                    result.yywrap = true;
                else if(option == "main"sv)
                    result.emit_main = true;
                else if(option == "nomain"sv)
                    result.emit_main = false;
                else if(option == "yylineno"sv)
                    ; // Line counting is always on.
                else
                    compiler_warning(file, word, fmt("Unknown option '%' ignored.", option));
            });
        }
        else
            error(line.pstring.sub(0, std::max<std::size_t>(i, 1)), ERR_DIRECTIVE, fmt("Unknown directive '%'.", name));
    }

    void parse_definition(line_t const& line)
    {
        std::string_view const v = view(line.pstring);

        std::size_t i = 0;
        while(i < v.size() && !is_blank(v[i]))
            ++i;
        std::string_view const name = v.substr(0, i);
        pstring_t const name_pstring = line.pstring.sub(0, i);

        if(!is_definition_name(name))
            error(name_pstring, ERR_SECTION, fmt("Malformed definition name '%'.", name));

        while(i < v.size() && is_blank(v[i]))
            ++i;
        std::size_t const end = trim_right(v).size();

        if(i >= end)
            error(name_pstring, ERR_EMPTY_PATTERN, fmt("Definition % has no pattern.", name));

        if(definition_t const* prev = result.definitions.lookup(name))
        {
            throw compiler_error_t(ERR_DUPLICATE_MACRO,
                fmt_error(file, name_pstring, ERR_DUPLICATE_MACRO, fmt("Duplicate definition %.", name))
                + fmt_note(file, prev->pstring, "Previous definition is here."),
                name_pstring.offset);
        }

        pstring_t const pattern = line.pstring.sub(i, end - i);
        rptr regex = parse_regex(file, pattern, result.definitions, name);
        result.definitions.define({ std::string(name), name_pstring, pattern, std::move(regex) });
    }

    /////////////////////
    // Rules section: //
    /////////////////////

    void parse_rules()
    {
        bool seen_rule = false;

        line_t line;
        while(read_line(line))
        {
            std::string_view const v = view(line.pstring);

            if(is_separator(v))
            {
                read_epilogue();
                break;
            }

            std::string_view const trimmed = trim(v);
            if(trimmed.empty())
                continue;

            if(v.starts_with("%{"sv))
            {
                if(seen_rule)
                    error(line.pstring.sub(0, 2), ERR_SECTION, "Code blocks in the rules section must precede the first rule.");
                code_block_t block = read_code_block(line);
                add_code(result.scan_prologue, block.text, block.line);
                continue;
            }

            if(is_blank(v.front()))
            {
                std::size_t const column = v.size() - trim(v).size() - (v.size() - trim_right(v).size());
                if(trimmed.starts_with("//"sv))
                    continue;
                if(trimmed.starts_with("/*"sv))
                {
                    read_comment(line, column);
                    continue;
                }
                if(!seen_rule)
                {
                    add_code(result.scan_prologue, std::string(v) + '\n', line.number);
                    continue;
                }
                error(line.pstring.sub(column, trimmed.size()), ERR_RULE,
                      "Unexpected indented line; patterns must start in the first column.");
            }

            parse_rule(line);
            seen_rule = true;
        }

        if(!pending.empty())
            error(pending.front().pstring, ERR_DANGLING_CONTINUATION,
                  "Rule uses the action of the next rule ('|'), but no rule follows.");

        if(result.rules.empty())
            error(eof(), ERR_NO_RULES, "No rules declared.");
    }

    void read_epilogue()
    {
        result.has_epilogue = true;
        result.epilogue.line = line_number + 1;
        result.epilogue.text.assign(src + next, src + size);
        next = size;
    }

    // Parses '<A,B>' or '<*>'. Returns the column after the '>'.
    std::size_t parse_condition_prefix(line_t const& line, bc::small_vector<unsigned, 2>& conditions)
    {
        std::string_view const v = view(line.pstring);
        std::size_t const close = v.find('>');
        if(close == std::string_view::npos)
            error(line.pstring.sub(0, 1), ERR_RULE, "Unterminated start condition list.");

        std::size_t i = 1;
        while(i < close)
        {
            std::size_t end = v.find(',', i);
            if(end == std::string_view::npos || end > close)
                end = close;

            pstring_t const word = line.pstring.sub(i, end - i);
            std::string_view const name = trim(view(word));

            if(name == "*"sv)
            {
                for(unsigned j = 0; j < result.conditions.size(); ++j)
                    conditions.push_back(j);
            }
            else
            {
                auto it = std::find_if(result.conditions.begin(), result.conditions.end(),
                                       [&](start_condition_t const& sc) { return sc.name == name; });
                if(it == result.conditions.end())
                    error(word, ERR_UNKNOWN_CONDITION, fmt("Unknown start condition '%'.", name));
                conditions.push_back(it - result.conditions.begin());
            }

            i = end + 1;
        }

        std::sort(conditions.begin(), conditions.end());
        conditions.erase(std::unique(conditions.begin(), conditions.end()), conditions.end());

        if(conditions.empty())
            error(line.pstring.sub(0, close + 1), ERR_RULE, "Empty start condition list.");

        return close + 1;
    }

    // Returns the column one past the end of the pattern starting at column 'i'.
    // The pattern ends at the first blank outside of quotes and brackets.
    std::size_t find_pattern_end(line_t const& line, std::size_t i)
    {
        char const* const begin = src + line.pstring.offset;
        char const* const end = begin + line.pstring.size;
        char const* p = begin + i;

        auto const at = [&](char const* ptr) { return line.pstring.sub(ptr - begin, end - ptr); };
        auto const skip_escape = [&]() { p = (p + 1 < end) ? p + 2 : end; };

        while(p < end && !is_blank(*p))
        {
            char const* const start = p;
            switch(*p)
            {
            case '\\':
                skip_escape();
                break;

            case '"':
                ++p;
                while(true)
                {
                    if(p >= end)
                        error(at(start), ERR_UNTERMINATED_STRING, "Unterminated string.");
                    if(*p == '\\')
                        skip_escape();
                    else if(*p++ == '"')
                        break;
                }
                break;

            case '[':
                ++p;
                if(p < end && *p == '^')
                    ++p;
                if(p < end && *p == ']')
                    ++p;
                while(true)
                {
                    if(p >= end)
                        error(at(start), ERR_UNTERMINATED_BRACKET, "Unterminated bracket expression.");
                    if(*p == '\\')
                        skip_escape();
                    else if(*p == '[' && p + 1 < end && p[1] == ':')
                    {
                        std::string_view const rest(p, end - p);
                        std::size_t const close = rest.find(":]"sv);
                        p = close == std::string_view::npos ? p + 1 : p + close + 2;
                    }
                    else if(*p++ == ']')
                        break;
                }
                break;

            default:
                ++p;
                break;
            }
        }

        return p - begin;
    }

    // Reads a brace-delimited action starting at column 'i' of 'line',
    // which may continue over the following lines.
    std::string read_action_block(line_t const& line, std::size_t i)
    {
        std::size_t const start = line.pstring.offset + i;
        std::size_t pos = start;
        int depth = 0;

        enum { CODE, STRING, CHAR, LINE_COMMENT, BLOCK_COMMENT } state = CODE;

        for(; pos < size; ++pos)
        {
            char const c = src[pos];

            if(c == '\n')
            {
                ++line_number;
                if(state == LINE_COMMENT)
                    state = CODE;
                continue;
            }

            switch(state)
            {
            case CODE:
                if(c == '{')
                    ++depth;
                else if(c == '}')
                {
                    if(--depth == 0)
                        goto closed;
                }
                else if(c == '"')
                    state = STRING;
                else if(c == '\'')
                    state = CHAR;
                else if(c == '/' && src[pos+1] == '/')
                    state = LINE_COMMENT;
                else if(c == '/' && src[pos+1] == '*')
                {
                    state = BLOCK_COMMENT;
                    ++pos;
                }
                break;

            case STRING:
            case CHAR:
                if(c == '\\' && src[pos+1] != '\n')
                    ++pos;
                else if(c == (state == STRING ? '"' : '\''))
                    state = CODE;
                break;

            case LINE_COMMENT:
                break;

            case BLOCK_COMMENT:
                if(c == '*' && src[pos+1] == '/')
                {
                    state = CODE;
                    ++pos;
                }
                break;
            }
        }

        error({ std::uint32_t(start), 1 }, ERR_UNTERMINATED_ACTION, "Unterminated action block.");

    closed:
        std::size_t const close = pos + 1;
        std::string text(src + start, src + close);

        // Skip the rest of the line holding the closing brace.
        std::size_t eol = close;
        while(eol < size && src[eol] != '\n')
            ++eol;

        std::string_view const rest = trim(std::string_view(src + close, eol - close));
        if(!rest.empty() && !rest.starts_with("//"sv) && !rest.starts_with("/*"sv))
            error({ std::uint32_t(close + (rest.data() - (src + close))), std::uint32_t(rest.size()) },
                  ERR_RULE, "Unexpected text after action block.");

        next = eol < size ? eol + 1 : eol;
        return text;
    }

    void parse_rule(line_t const& line)
    {
        std::string_view const v = view(line.pstring);

        bc::small_vector<unsigned, 2> conditions;
        std::size_t i = 0;

        if(v.front() == '<')
            i = parse_condition_prefix(line, conditions);
        else for(unsigned j = 0; j < result.conditions.size(); ++j)
            if(!result.conditions[j].exclusive)
                conditions.push_back(j);

        std::size_t const pattern_end = find_pattern_end(line, i);
        if(pattern_end == i)
            error(line.pstring.sub(i, 1), ERR_EMPTY_PATTERN, "Expecting a pattern.");

        pstring_t const pattern = line.pstring.sub(i, pattern_end - i);
        rptr regex = parse_regex(file, pattern, result.definitions);

        std::size_t action_begin = pattern_end;
        while(action_begin < v.size() && is_blank(v[action_begin]))
            ++action_begin;
        std::string_view const action_text = trim_right(v.substr(action_begin));

        if(action_text == "|"sv)
        {
            pending.push_back({ pattern, std::move(regex), std::move(conditions) });
            return;
        }

        action_t action;
        action.line = line.number;
        action.pstring = line.pstring.sub(action_begin, action_text.size());

        if(action_text.starts_with('{'))
            action.text = read_action_block(line, action_begin);
        else
            action.text = std::string(action_text);

        unsigned const action_i = result.actions.size();
        result.actions.push_back(std::move(action));

        for(pending_rule_t& p : pending)
            commit(p.pstring, std::move(p.regex), std::move(p.conditions), action_i);
        pending.clear();

        commit(pattern, std::move(regex), std::move(conditions), action_i);
    }

    void commit(pstring_t pattern, rptr regex, bc::small_vector<unsigned, 2> conditions, unsigned action_i)
    {
        unsigned const index = result.rules.size();
        result.rules.push_back({ index, pattern, std::move(regex), action_i, std::move(conditions) });
    }
};

} // end anon namespace

syntax_file_t parse_syntax_file(file_contents_t const& file)
{
    return syntax_parser_t(file).parse();
}
