#ifndef REGEX_PARSER_HPP
#define REGEX_PARSER_HPP

#include <string_view>

#include "file.hpp"
#include "macro.hpp"
#include "pstring.hpp"
#include "regex.hpp"

// Parses the pattern held at 'pattern' (a slice of 'file') into a tree.
// '{NAME}' references are resolved against 'definitions' and cloned in.
// 'defining' names the definition currently being parsed, if any;
// a reference to it is reported as a cyclic definition.
// Throws compiler_error_t on failure, located at the failing byte.
rptr parse_regex(file_contents_t const& file, pstring_t pattern,
                 definition_table_t const& definitions,
                 std::string_view defining = {});

// Looks up a POSIX class name such as "digit". Returns false if unknown.
bool posix_class(std::string_view name, charset_t& result);

#endif
