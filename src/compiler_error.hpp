#ifndef COMPILER_ERROR_HPP
#define COMPILER_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "format.hpp"
#include "pstring.hpp"
#include "console.hpp"
#include "file.hpp"

#define ERROR_KIND_XENUM \
    /* Syntax errors */ \
    X(ERR_SECTION,               "section") \
    X(ERR_RULE,                  "rule") \
    X(ERR_UNTERMINATED_ACTION,   "unterminated action") \
    X(ERR_UNTERMINATED_CODE,     "unterminated code block") \
    X(ERR_DIRECTIVE,             "directive") \
    /* Pattern errors */ \
    X(ERR_UNTERMINATED_BRACKET,  "unterminated bracket") \
    X(ERR_UNTERMINATED_STRING,   "unterminated string") \
    X(ERR_POSIX_CLASS,           "posix class") \
    X(ERR_UNBALANCED_PAREN,      "unbalanced parenthesis") \
    X(ERR_UNDEFINED_MACRO,       "undefined definition") \
    X(ERR_REPEAT_BOUNDS,         "repetition bounds") \
    X(ERR_BAD_RANGE,             "range") \
    X(ERR_BAD_ESCAPE,            "escape") \
    X(ERR_NOTHING_TO_REPEAT,     "nothing to repeat") \
    X(ERR_EMPTY_PATTERN,         "empty pattern") \
    /* Semantic errors */ \
    X(ERR_CYCLIC_MACRO,          "cyclic definition") \
    X(ERR_DUPLICATE_MACRO,       "duplicate definition") \
    X(ERR_DANGLING_CONTINUATION, "dangling continuation") \
    X(ERR_NO_RULES,              "no rules") \
    X(ERR_UNKNOWN_CONDITION,     "unknown start condition") \
    /* I/O errors */ \
    X(ERR_READ,                  "read") \
    X(ERR_WRITE,                 "write") \
    /* Warnings promoted by --error-on-warning */ \
    X(ERR_WARNING,               "warning")

enum error_kind_t : std::uint8_t
{
#define X(name, str) name,
    ERROR_KIND_XENUM
#undef X
};

char const* to_string(error_kind_t kind);

constexpr std::uint32_t NO_OFFSET = ~std::uint32_t(0);

class compiler_error_t : public std::runtime_error
{
public:
    compiler_error_t(error_kind_t kind, std::string const& what, std::uint32_t offset = NO_OFFSET)
    : std::runtime_error(what)
    , kind(kind)
    , offset(offset)
    {}

    error_kind_t kind;
    // Byte offset into the syntax file, or NO_OFFSET.
    std::uint32_t offset;
};

std::string fmt_source_pos(file_contents_t const& file, pstring_t pstring);

std::string fmt_error(error_kind_t kind, std::string const& what);
std::string fmt_error(file_contents_t const& file, pstring_t pstring, std::string const& what,
                      char const* color = CONSOLE_RED CONSOLE_BOLD, char const* prefix = "error");
// Prefixes the message with the kind, as in "error[unterminated string]:".
std::string fmt_error(file_contents_t const& file, pstring_t pstring,
                      error_kind_t kind, std::string const& what);

std::string fmt_note(std::string const& what);
std::string fmt_note(file_contents_t const& file, pstring_t pstring, std::string const& what);

std::string fmt_warning(file_contents_t const& file, pstring_t pstring, std::string const& what);

[[gnu::noreturn]]
void compiler_error(file_contents_t const& file, pstring_t pstring,
                    error_kind_t kind, std::string const& what);

[[gnu::noreturn]]
void compiler_error(error_kind_t kind, std::string const& what);

void compiler_warning(file_contents_t const& file, pstring_t pstring, std::string const& what);

#endif
