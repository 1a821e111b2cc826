#ifndef REGEX_HPP
#define REGEX_HPP

// The abstract syntax tree of a pattern.
// Trees are owned top-down through unique_ptr; subtrees are never shared,
// so splicing a definition into a pattern always clones it.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

#include <boost/container/small_vector.hpp>

#include "charset.hpp"

namespace bc = ::boost::container;

struct regex_t;
using rptr = std::unique_ptr<regex_t>;

constexpr unsigned REPEAT_INF = ~0u;
constexpr unsigned MAX_REPEAT = 1000;
// Limit on expanded_size(), so nested bounds can't multiply out.
constexpr std::size_t MAX_EXPANDED_SIZE = 100000;

// Matches the empty string, e.g. "" or an empty alternative.
struct rx_empty_t {};
struct rx_literal_t { std::uint8_t byte; };
struct rx_any_t {};

struct rx_class_t
{
    bc::small_vector<byte_range_t, 4> ranges;
    bool negated = false;

    charset_t charset() const;
};

struct rx_concat_t { rptr l; rptr r; };
struct rx_union_t { rptr l; rptr r; };
struct rx_star_t { rptr inner; };
struct rx_plus_t { rptr inner; };
struct rx_optional_t { rptr inner; };

// 'max' is REPEAT_INF for bounds of the form {n,}.
struct rx_repeat_t { rptr inner; unsigned min; unsigned max; };

struct regex_t
{
    using variant_t = std::variant<
        rx_empty_t, rx_literal_t, rx_any_t, rx_class_t,
        rx_concat_t, rx_union_t, rx_star_t, rx_plus_t, rx_optional_t, rx_repeat_t>;

    variant_t v;
};

template<typename T>
constexpr bool is_leaf_regex = std::is_same_v<T, rx_empty_t>
                            || std::is_same_v<T, rx_literal_t>
                            || std::is_same_v<T, rx_any_t>
                            || std::is_same_v<T, rx_class_t>;

template<typename T>
inline constexpr bool always_false = false;

rptr clone(rptr const& a);
rptr clone(regex_t const& a);

// Builders, in the style of a parser combinator library:
rptr empty();
rptr literal(unsigned char c);
rptr any();
rptr char_class(charset_t const& set, bool negated = false);
rptr char_class(bc::small_vector<byte_range_t, 4> ranges, bool negated = false);
rptr cat(rptr a, rptr b);
rptr uor(rptr a, rptr b);
rptr kleene(rptr a);
rptr many1(rptr a);
rptr maybe(rptr a);
rptr repeat(rptr a, unsigned min, unsigned max);
rptr word(std::string_view str);

template<typename... T>
rptr cat(rptr a, rptr b, rptr c, T... t)
    { return cat(std::move(a), cat(std::move(b), std::move(c), std::move(t)...)); }
template<typename... T>
rptr uor(rptr a, rptr b, rptr c, T... t)
    { return uor(std::move(a), uor(std::move(b), std::move(c), std::move(t)...)); }

// True if the pattern can match the empty string.
bool nullable(regex_t const& regex);

// Number of nodes in the tree.
std::size_t regex_size(regex_t const& regex);

// Node count once bounded repetition is unrolled into copies.
// Saturates at SIZE_MAX.
std::size_t expanded_size(regex_t const& regex);

// Prints the tree in a fully parenthesized form, e.g. "(a|(b)*)".
// Used for debugging and tests.
std::string to_string(regex_t const& regex);

#endif
