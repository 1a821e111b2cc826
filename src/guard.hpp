#ifndef GUARD_HPP
#define GUARD_HPP

#include <exception>
#include <type_traits>
#include <utility>

// Calls 'fn' when the guard goes out of scope.
// With 'only_on_throw', the call happens only while an exception
// thrown after the guard's construction is unwinding the stack.
template<typename Fn, bool only_on_throw>
class exit_guard_t
{
public:
    explicit exit_guard_t(Fn fn)
    : fn(std::move(fn))
    , uncaught(std::uncaught_exceptions())
    {}

    exit_guard_t(exit_guard_t const&) = delete;
    exit_guard_t& operator=(exit_guard_t const&) = delete;

    ~exit_guard_t()
    {
        if(!only_on_throw || std::uncaught_exceptions() > uncaught)
            fn();
    }

private:
    Fn fn;
    int uncaught;
};

template<typename Fn>
using scope_guard_t = exit_guard_t<std::decay_t<Fn>, false>;

template<typename Fn>
using throw_guard_t = exit_guard_t<std::decay_t<Fn>, true>;

// Relies on guaranteed copy elision; guards can't be copied or moved.
template<typename Fn>
scope_guard_t<Fn> make_scope_guard(Fn&& fn) { return scope_guard_t<Fn>(std::forward<Fn>(fn)); }

template<typename Fn>
throw_guard_t<Fn> make_throw_guard(Fn&& fn) { return throw_guard_t<Fn>(std::forward<Fn>(fn)); }

#endif
