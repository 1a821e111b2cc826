#ifndef ASSERT_HPP
#define ASSERT_HPP

#include <cstdio>
#include <cstdlib>

#include "format.hpp"

// passert is like assert, but also prints the values passed after the condition.
// Reserved for internal invariants of the automata; user errors throw.
#ifdef NDEBUG
#define passert(C, ...) ((void) 0)
#else
#define passert(C, ...) (void)((C) || (passert_fail(#C, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__), 0))
#endif

template<typename... Args>
[[noreturn]] void passert_fail(char const* expr, char const* file, long line, char const* fn, Args const&... args)
{
    std::ostringstream info;
    ((info << ' ' << args), ...);

    std::fflush(stdout);
    std::fputs(fmt("%:%: %: invariant `%' failed.\n   values:%\n", file, line, fn, expr, info.str()).c_str(), stderr);
    std::abort();
}

#endif
