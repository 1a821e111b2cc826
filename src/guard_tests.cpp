#include <catch2/catch.hpp>
#include "guard.hpp"

#include <stdexcept>

TEST_CASE("make_scope_guard", "[guard]")
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]{ ++calls; });
        REQUIRE(calls == 0);
    }
    REQUIRE(calls == 1);

    try
    {
        auto guard = make_scope_guard([&]{ ++calls; });
        throw std::runtime_error("unwind");
    }
    catch(std::runtime_error const&) {}
    REQUIRE(calls == 2);
}

TEST_CASE("make_throw_guard", "[guard]")
{
    int calls = 0;
    {
        auto guard = make_throw_guard([&]{ ++calls; });
    }
    REQUIRE(calls == 0);

    try
    {
        auto guard = make_throw_guard([&]{ ++calls; });
        throw std::runtime_error("unwind");
    }
    catch(std::runtime_error const&) {}
    REQUIRE(calls == 1);
}

TEST_CASE("make_throw_guard inside a destructor during unwinding", "[guard]")
{
    // A guard made while an exception is already in flight only fires
    // for a newer one.
    int calls = 0;
    struct unwinder_t
    {
        int& calls;
        ~unwinder_t()
        {
            auto guard = make_throw_guard([&]{ ++calls; });
        }
    };

    try
    {
        unwinder_t unwinder{ calls };
        throw std::runtime_error("unwind");
    }
    catch(std::runtime_error const&) {}
    REQUIRE(calls == 0);
}
