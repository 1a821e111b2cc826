#ifndef PSTRING_HPP
#define PSTRING_HPP

#include <cstdint>
#include <string_view>

// Holds a slice of the syntax file's buffer.
// Convertible to std::string_view, and you'll probably want to do that.
struct pstring_t
{
    std::uint32_t offset;
    std::uint32_t size;

    std::string_view view(char const* buffer) const
        { return std::string_view(buffer + offset, size); }

    constexpr std::uint32_t end() const { return offset + size; }

    // A sub-slice, relative to this one.
    constexpr pstring_t sub(std::uint32_t at, std::uint32_t n = 1) const
        { return { offset + at, n }; }

    constexpr explicit operator bool() const { return size; }
};

#endif
