#ifndef CHARSET_HPP
#define CHARSET_HPP

// A fixed-size set of byte values, stored as a 256-bit bitset.

#include <array>
#include <bit>
#include <compare>
#include <cstdint>
#include <string>

constexpr unsigned NUM_BYTES = 256;

struct byte_range_t
{
    std::uint8_t lo;
    std::uint8_t hi;

    auto operator<=>(byte_range_t const&) const = default;
};

class charset_t
{
public:
    using word_t = std::uint64_t;
    static constexpr unsigned word_bits = sizeof(word_t) * 8;
    static constexpr unsigned num_words = NUM_BYTES / word_bits;

    constexpr charset_t() = default;

    static charset_t full() { charset_t cs; cs.words.fill(~word_t(0)); return cs; }
    static charset_t single(unsigned char c) { charset_t cs; cs.set(c); return cs; }
    static charset_t range(unsigned char lo, unsigned char hi) { charset_t cs; cs.set_range(lo, hi); return cs; }

    bool test(unsigned char c) const
        { return words[c / word_bits] & (word_t(1) << (c % word_bits)); }
    void set(unsigned char c)
        { words[c / word_bits] |= word_t(1) << (c % word_bits); }
    void clear(unsigned char c)
        { words[c / word_bits] &= ~(word_t(1) << (c % word_bits)); }

    // Sets every byte in [lo, hi].
    void set_range(unsigned char lo, unsigned char hi)
    {
        for(unsigned c = lo; c <= hi; ++c)
            set(c);
    }

    void clear_all() { words.fill(0); }
    void flip_all() { for(word_t& w : words) w = ~w; }

    bool all_clear() const
    {
        for(word_t w : words)
            if(w)
                return false;
        return true;
    }

    bool all_set() const
    {
        for(word_t w : words)
            if(w != ~word_t(0))
                return false;
        return true;
    }

    unsigned popcount() const
    {
        unsigned count = 0;
        for(word_t w : words)
            count += std::popcount(w);
        return count;
    }

    // Returns the lowest byte in the set, or -1 if empty.
    int lowest() const
    {
        for(unsigned i = 0; i < num_words; ++i)
            if(words[i])
                return i * word_bits + std::countr_zero(words[i]);
        return -1;
    }

    // Calls 'fn' for each byte in the set, in ascending order.
    template<typename Fn>
    void for_each(Fn fn) const
    {
        for(unsigned i = 0; i < num_words; ++i)
        {
            word_t w = words[i];
            while(w)
            {
                unsigned const bit = std::countr_zero(w);
                w &= w - 1;
                fn(static_cast<unsigned char>(i * word_bits + bit));
            }
        }
    }

    // Calls 'fn' with each maximal run of consecutive bytes, in ascending order.
    template<typename Fn>
    void for_each_range(Fn fn) const
    {
        unsigned c = 0;
        while(c < NUM_BYTES)
        {
            if(!test(c))
            {
                ++c;
                continue;
            }
            unsigned const lo = c;
            while(c + 1 < NUM_BYTES && test(c + 1))
                ++c;
            fn(byte_range_t{ std::uint8_t(lo), std::uint8_t(c) });
            ++c;
        }
    }

    charset_t& operator|=(charset_t const& o) { for(unsigned i = 0; i < num_words; ++i) words[i] |= o.words[i]; return *this; }
    charset_t& operator&=(charset_t const& o) { for(unsigned i = 0; i < num_words; ++i) words[i] &= o.words[i]; return *this; }
    charset_t& operator-=(charset_t const& o) { for(unsigned i = 0; i < num_words; ++i) words[i] &= ~o.words[i]; return *this; }

    friend charset_t operator|(charset_t a, charset_t const& b) { a |= b; return a; }
    friend charset_t operator&(charset_t a, charset_t const& b) { a &= b; return a; }
    friend charset_t operator-(charset_t a, charset_t const& b) { a -= b; return a; }
    friend charset_t operator~(charset_t a) { a.flip_all(); return a; }

    // Ordered so that charsets can key std::map and flat_set.
    auto operator<=>(charset_t const&) const = default;

    explicit operator bool() const { return !all_clear(); }

    // Used for debugging and diagnostics, e.g. "[a-z_]".
    std::string to_string() const;

private:
    std::array<word_t, num_words> words = {};
};

// Escapes a byte for display in diagnostics and Graphviz labels.
std::string byte_to_string(unsigned char c);

#endif
