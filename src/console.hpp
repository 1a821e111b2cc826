#ifndef CONSOLE_HPP
#define CONSOLE_HPP

// Console colors used by diagnostics.
// Building with LEXFAB_NO_COLOR turns them into empty strings.

#ifdef LEXFAB_NO_COLOR
#define CONSOLE_RED   ""
#define CONSOLE_YEL   ""
#define CONSOLE_CYN   ""
#define CONSOLE_RESET ""
#define CONSOLE_BOLD  ""
#else
#define CONSOLE_RED   "\x1B[31m"
#define CONSOLE_YEL   "\x1B[33m"
#define CONSOLE_CYN   "\x1B[36m"
#define CONSOLE_RESET "\x1B[0m"
#define CONSOLE_BOLD  "\x1B[1m"
#endif

#endif
