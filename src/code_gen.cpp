#include "code_gen.hpp"

#include <algorithm>
#include <vector>

#include "byte_class.hpp"
#include "dfa.hpp"
#include "format.hpp"
#include "options.hpp"
#include "parser.hpp"

code_writer_t& code_writer_t::operator<<(std::string_view str)
{
    m_out += str;
    m_lines += std::count(str.begin(), str.end(), '\n');
    return *this;
}

void code_writer_t::line_to_source(unsigned line, std::string const& source_name)
{
    if(m_line_directives)
        *this << "#line " << line << " \"" << c_escape(source_name) << "\"\n";
}

void code_writer_t::line_to_output()
{
    // The directive itself sits on line 'm_lines + 1'.
    if(m_line_directives)
        *this << "#line " << (m_lines + 2) << " \"" << c_escape(m_output_name) << "\"\n";
}

char const* c_table_type(unsigned max)
{
    if(max <= 0xFF)
        return "unsigned char";
    if(max <= 0xFFFF)
        return "unsigned short";
    return "unsigned int";
}

namespace
{

constexpr unsigned TABLE_COLUMNS = 16;

class c_gen_t
{
public:
    c_gen_t(syntax_file_t const& file, dfa_t const& dfa,
            std::string const& source_name, std::string const& output_name)
    : file(file)
    , dfa(dfa)
    , source_name(source_name)
    , classes(dfa_byte_classes(dfa))
    , out(output_name, compiler_options().line_directives)
    {}

    std::string gen()
    {
        out << "/* Scanner generated by lexfab from " << c_escape(source_name) << ". Do not edit. */\n\n";

        gen_code_blocks(file.prologue);
        gen_runtime();
        gen_conditions();
        gen_tables();
        gen_fill();
        gen_driver();
        gen_entry_points();
        if(file.emit_main)
            gen_main();
        if(file.has_epilogue)
        {
            out << '\n';
            gen_code_block(file.epilogue);
        }

        return out.str();
    }

private:
    syntax_file_t const& file;
    dfa_t const& dfa;
    std::string const& source_name;
    byte_classes_t const classes;
    code_writer_t out;

    void gen_code_block(code_block_t const& block, bool restore = true)
    {
        if(block.text.empty())
            return;
        out.line_to_source(block.line, source_name);
        out << block.text;
        if(block.text.back() != '\n')
            out << '\n';
        if(restore)
            out.line_to_output();
    }

    void gen_code_blocks(std::vector<code_block_t> const& blocks)
    {
        for(code_block_t const& block : blocks)
            gen_code_block(block);
        if(!blocks.empty())
            out << '\n';
    }

    template<typename Fn>
    void gen_table(char const* name, unsigned size, Fn const& value)
    {
        unsigned max = 0;
        for(unsigned i = 0; i < size; ++i)
            max = std::max<unsigned>(max, value(i));

        out << "static const " << c_table_type(max) << ' ' << name << '[' << size << "] =\n{\n";
        for(unsigned i = 0; i < size; ++i)
        {
            if(i % TABLE_COLUMNS == 0)
                out << "    ";
            out << value(i) << ',';
            out << ((i % TABLE_COLUMNS == TABLE_COLUMNS - 1 || i + 1 == size) ? "\n" : " ");
        }
        out << "};\n\n";
    }

    void gen_runtime()
    {
        out <<
R"(#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#ifndef YY_BUF_SIZE
#define YY_BUF_SIZE 16384
#endif

#ifndef YY_FATAL_ERROR
#define YY_FATAL_ERROR(msg) do { fprintf(stderr, "%s\n", (msg)); exit(2); } while(0)
#endif

/* Reads at most one line, so that interactive input is scanned as it arrives. */
#ifndef YY_INPUT
#define YY_INPUT(in, buf, result, max_size) \
    do { \
        size_t yy_n = 0; \
        int yy_c; \
        while(yy_n < (max_size) && (yy_c = getc(in)) != EOF) \
        { \
            (buf)[yy_n++] = (char)yy_c; \
            if(yy_c == '\n') \
                break; \
        } \
        (result) = yy_n; \
    } while(0)
#endif

/* The state of one input stream. */
typedef struct yy_scanner_t
{
    FILE* in;         /* NULL reads stdin. */
    char* buf;
    size_t buf_size;
    size_t pos;       /* Start of the next token. */
    size_t end;       /* End of the data read into 'buf'. */
    int eof;
    int held;
    char hold;        /* Byte overwritten by the NUL ending 'text'. */
    char* text;
    int leng;
    int lineno;
    int column;       /* Column of the current token. */
    int next_column;
    int cond;
    int initialized;
} yy_scanner_t;

static yy_scanner_t yy_default_scanner;
static yy_scanner_t* yy_current = &yy_default_scanner;

#define yytext (yy_current->text)
#define yyleng (yy_current->leng)
#define yylineno (yy_current->lineno)
#define yycolumn (yy_current->column)
#define yyin (yy_current->in)

#define BEGIN yy_current->cond =
#define YY_START (yy_current->cond)
#define ECHO fwrite(yytext, (size_t)yyleng, 1, stdout)
#define yyterminate() return 0

)";

        if(file.yywrap)
            out << "int yywrap(void);\n\n";
        else
            out << "#define yywrap() 1\n\n";

        out <<
R"(void yy_scanner_init(yy_scanner_t* s, FILE* in);
void yy_scanner_destroy(yy_scanner_t* s);
int yylex_r(yy_scanner_t* s);
int yylex(void);

)";
    }

    void gen_conditions()
    {
        for(unsigned i = 0; i < file.conditions.size(); ++i)
            out << "#define " << file.conditions[i].name << ' ' << i << '\n';
        out << '\n';
    }

    void gen_tables()
    {
        unsigned const num_classes = classes.size();

        out << "#define YY_NUM_CLASSES " << num_classes << "\n";
        out << "#define YY_REJECT_STATE " << REJECT_STATE << "\n\n";

        out << "/* Byte to equivalence class. */\n";
        gen_table("yy_class", NUM_BYTES, [&](unsigned i) { return classes.class_of[i]; });

        out << "/* Indexed by state * YY_NUM_CLASSES + class. */\n";
        gen_table("yy_next", dfa.size() * num_classes, [&](unsigned i)
        {
            unsigned const state = i / num_classes;
            unsigned const c = i % num_classes;
            return dfa[state].next[classes.representative(c)];
        });

        out << "/* Accepted rule + 1, or 0. */\n";
        gen_table("yy_accept", dfa.size(), [&](unsigned i)
        {
            return dfa[i].accepting() ? dfa[i].accept + 1 : 0u;
        });

        out << "/* Start state of each condition. */\n";
        gen_table("yy_start_state", dfa.starts.size(), [&](unsigned i) { return dfa.starts[i]; });
    }

    void gen_fill()
    {
        out <<
R"(/* Reads more input into the buffer. Returns 0 at end of input. */
static int yy_fill(yy_scanner_t* s)
{
    size_t n = 0;

    if(s->eof)
        return 0;

    if(s->end + 1 >= s->buf_size)
    {
        size_t const size = s->buf_size ? s->buf_size * 2 : YY_BUF_SIZE;
        char* const buf = (char*)realloc(s->buf, size);
        if(!buf)
            YY_FATAL_ERROR("lexfab scanner: out of memory");
        s->buf = buf;
        s->buf_size = size;
    }

    YY_INPUT(s->in ? s->in : stdin, s->buf + s->end, n, s->buf_size - s->end - 1);
    if(n == 0)
    {
        s->eof = 1;
        return 0;
    }

    s->end += n;
    s->buf[s->end] = '\0';
    return 1;
}

/* Drops consumed text from the front of the buffer. */
static void yy_compact(yy_scanner_t* s)
{
    if(s->held)
    {
        s->buf[s->pos] = s->hold;
        s->held = 0;
    }

    if(s->pos == 0)
        return;

    memmove(s->buf, s->buf + s->pos, s->end - s->pos);
    s->end -= s->pos;
    s->pos = 0;
}

static void yy_count_lines(yy_scanner_t* s)
{
    int i;
    s->column = s->next_column;
    for(i = 0; i < s->leng; ++i)
    {
        if(s->text[i] == '\n')
        {
            ++s->lineno;
            s->next_column = 1;
        }
        else
            ++s->next_column;
    }
}

/* Invoked when no rule matches at the current position.
 * The default reports the byte and stops scanning without consuming it. */
#ifndef YY_NOMATCH
#define YY_NOMATCH \
    do { \
        fprintf(stderr, "unrecognized input '\\x%02x' at line %d, column %d\n", \
                (unsigned)(unsigned char)yy_s->buf[yy_s->pos], yy_s->lineno, yy_s->next_column); \
        return -1; \
    } while(0)
#endif

)";
    }

    void gen_driver()
    {
        out <<
R"(int yylex_r(yy_scanner_t* yy_s)
{
    yy_current = yy_s;

)";

        if(!file.scan_prologue.empty())
        {
            for(code_block_t const& block : file.scan_prologue)
                gen_code_block(block);
            out << '\n';
        }

        out <<
R"(    for(;;)
    {
        size_t yy_cp;
        size_t yy_last_pos;
        unsigned yy_state;
        unsigned yy_last_rule = 0;

        yy_compact(yy_s);

        yy_state = yy_start_state[yy_s->cond];
        yy_cp = yy_s->pos;
        yy_last_pos = yy_cp;

        /* Maximal munch: run until rejected, remembering the last accepting position. */
        for(;;)
        {
            if(yy_cp == yy_s->end && !yy_fill(yy_s))
                break;
            yy_state = yy_next[yy_state * YY_NUM_CLASSES + yy_class[(unsigned char)yy_s->buf[yy_cp]]];
            if(yy_state == YY_REJECT_STATE)
                break;
            ++yy_cp;
            if(yy_accept[yy_state])
            {
                yy_last_rule = yy_accept[yy_state];
                yy_last_pos = yy_cp;
            }
        }

        if(!yy_last_rule)
        {
            if(yy_s->pos == yy_s->end)
            {
                if(yywrap())
                    return 0;
                yy_s->eof = 0;
                continue;
            }
            YY_NOMATCH;
        }

        /* Bytes read past the last accepting position stay in the buffer. */
        yy_s->text = yy_s->buf + yy_s->pos;
        yy_s->leng = (int)(yy_last_pos - yy_s->pos);
        yy_s->hold = yy_s->buf[yy_last_pos];
        yy_s->buf[yy_last_pos] = '\0';
        yy_s->held = 1;
        yy_s->pos = yy_last_pos;
        yy_count_lines(yy_s);

        switch(yy_last_rule - 1)
        {
)";

        gen_actions();

        out <<
R"(        default:
            break;
        }
    }
}

)";
    }

    void gen_actions()
    {
        for(unsigned a = 0; a < file.actions.size(); ++a)
        {
            action_t const& action = file.actions[a];

            for(rule_t const& rule : file.rules)
                if(rule.action == a)
                    out << "        case " << rule.index << ":\n";

            if(!action.is_empty())
            {
                out.line_to_source(action.line, source_name);
                if(action.text.front() == '{')
                    out << action.text << '\n';
                else
                    out << "{ " << action.text << "\n}\n";
                out.line_to_output();
            }

            out << "            break;\n";
        }
    }

    void gen_entry_points()
    {
        out <<
R"(void yy_scanner_init(yy_scanner_t* s, FILE* in)
{
    memset(s, 0, sizeof(*s));
    s->in = in;
    s->lineno = 1;
    s->column = 1;
    s->next_column = 1;
    s->cond = INITIAL;
    s->initialized = 1;
}

void yy_scanner_destroy(yy_scanner_t* s)
{
    free(s->buf);
    s->buf = NULL;
    s->buf_size = 0;
    s->pos = s->end = 0;
    s->held = 0;
    s->text = NULL;
    if(yy_current == s)
        yy_current = &yy_default_scanner;
}

int yylex(void)
{
    if(!yy_default_scanner.initialized)
        yy_scanner_init(&yy_default_scanner, yy_default_scanner.in);
    return yylex_r(&yy_default_scanner);
}
)";
    }

    void gen_main()
    {
        out <<
R"(
int main(int argc, char** argv)
{
    FILE* file = NULL;
    int result;

    if(argc > 1)
    {
        file = fopen(argv[1], "r");
        if(!file)
        {
            perror(argv[1]);
            return EXIT_FAILURE;
        }
        yyin = file;
    }

    while((result = yylex()) > 0)
        ;

    if(file)
        fclose(file);
    yy_scanner_destroy(&yy_default_scanner);

    return result < 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
)";
    }
};

} // end anon namespace

std::string gen_c_scanner(syntax_file_t const& file, dfa_t const& dfa,
                          std::string const& source_name, std::string const& output_name)
{
    return c_gen_t(file, dfa, source_name, output_name).gen();
}
