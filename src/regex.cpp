#include "regex.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string_view>

#include "format.hpp"

charset_t rx_class_t::charset() const
{
    charset_t set;
    for(byte_range_t r : ranges)
        set.set_range(r.lo, r.hi);
    if(negated)
        set.flip_all();
    return set;
}

rptr clone(rptr const& a)
{
    if(!a)
        return nullptr;
    return clone(*a);
}

rptr clone(regex_t const& a)
{
    return std::visit([](auto const& node) -> rptr
    {
        using T = std::decay_t<decltype(node)>;
        if constexpr(is_leaf_regex<T>)
            return rptr(new regex_t{ node });
        else if constexpr(std::is_same_v<T, rx_concat_t> || std::is_same_v<T, rx_union_t>)
            return rptr(new regex_t{ T{ clone(node.l), clone(node.r) } });
        else if constexpr(std::is_same_v<T, rx_repeat_t>)
            return rptr(new regex_t{ rx_repeat_t{ clone(node.inner), node.min, node.max } });
        else
            return rptr(new regex_t{ T{ clone(node.inner) } });
    }, a.v);
}

rptr empty()
    { return rptr(new regex_t{ rx_empty_t{} }); }
rptr literal(unsigned char c)
    { return rptr(new regex_t{ rx_literal_t{ c } }); }
rptr any()
    { return rptr(new regex_t{ rx_any_t{} }); }
rptr cat(rptr a, rptr b)
    { return rptr(new regex_t{ rx_concat_t{ std::move(a), std::move(b) } }); }
rptr uor(rptr a, rptr b)
    { return rptr(new regex_t{ rx_union_t{ std::move(a), std::move(b) } }); }
rptr kleene(rptr a)
    { return rptr(new regex_t{ rx_star_t{ std::move(a) } }); }
rptr many1(rptr a)
    { return rptr(new regex_t{ rx_plus_t{ std::move(a) } }); }
rptr maybe(rptr a)
    { return rptr(new regex_t{ rx_optional_t{ std::move(a) } }); }
rptr repeat(rptr a, unsigned min, unsigned max)
    { return rptr(new regex_t{ rx_repeat_t{ std::move(a), min, max } }); }

rptr char_class(bc::small_vector<byte_range_t, 4> ranges, bool negated)
{
    rx_class_t node;
    node.ranges = std::move(ranges);
    node.negated = negated;
    return rptr(new regex_t{ std::move(node) });
}

rptr char_class(charset_t const& set, bool negated)
{
    bc::small_vector<byte_range_t, 4> ranges;
    set.for_each_range([&](byte_range_t r) { ranges.push_back(r); });
    return char_class(std::move(ranges), negated);
}

rptr word(std::string_view str)
{
    if(str.empty())
        return empty();
    rptr base;
    while(str.size())
    {
        unsigned char const c = str.back();
        if(!base)
            base = literal(c);
        else
            base = cat(literal(c), std::move(base));
        str.remove_suffix(1);
    }
    return base;
}

bool nullable(regex_t const& regex)
{
    return std::visit([](auto const& node) -> bool
    {
        using T = std::decay_t<decltype(node)>;
        if constexpr(std::is_same_v<T, rx_empty_t>)
            return true;
        else if constexpr(is_leaf_regex<T>)
            return false;
        else if constexpr(std::is_same_v<T, rx_concat_t>)
            return nullable(*node.l) && nullable(*node.r);
        else if constexpr(std::is_same_v<T, rx_union_t>)
            return nullable(*node.l) || nullable(*node.r);
        else if constexpr(std::is_same_v<T, rx_star_t> || std::is_same_v<T, rx_optional_t>)
            return true;
        else if constexpr(std::is_same_v<T, rx_plus_t>)
            return nullable(*node.inner);
        else if constexpr(std::is_same_v<T, rx_repeat_t>)
            return node.min == 0 || nullable(*node.inner);
        else
            static_assert(always_false<T>);
    }, regex.v);
}

std::size_t regex_size(regex_t const& regex)
{
    return std::visit([](auto const& node) -> std::size_t
    {
        using T = std::decay_t<decltype(node)>;
        if constexpr(is_leaf_regex<T>)
            return 1;
        else if constexpr(std::is_same_v<T, rx_concat_t> || std::is_same_v<T, rx_union_t>)
            return 1 + regex_size(*node.l) + regex_size(*node.r);
        else
            return 1 + regex_size(*node.inner);
    }, regex.v);
}

static std::size_t sat_mul(std::size_t a, std::size_t b)
{
    if(a && b > SIZE_MAX / a)
        return SIZE_MAX;
    return a * b;
}

static std::size_t sat_add(std::size_t a, std::size_t b)
{
    return b > SIZE_MAX - a ? SIZE_MAX : a + b;
}

std::size_t expanded_size(regex_t const& regex)
{
    return std::visit([](auto const& node) -> std::size_t
    {
        using T = std::decay_t<decltype(node)>;
        if constexpr(is_leaf_regex<T>)
            return 1;
        else if constexpr(std::is_same_v<T, rx_concat_t> || std::is_same_v<T, rx_union_t>)
            return sat_add(1, sat_add(expanded_size(*node.l), expanded_size(*node.r)));
        else if constexpr(std::is_same_v<T, rx_repeat_t>)
        {
            // {n,} unrolls to n copies followed by a star.
            std::size_t const copies = node.max == REPEAT_INF ? std::size_t(node.min) + 1 : node.max;
            return sat_add(1, sat_mul(std::max<std::size_t>(copies, 1), expanded_size(*node.inner)));
        }
        else
            return sat_add(1, expanded_size(*node.inner));
    }, regex.v);
}

static std::string literal_to_string(unsigned char c)
{
    using namespace std::literals;
    if("\\()[]{}|*+?.\"/"sv.find(char(c)) != std::string_view::npos)
        return std::string{ '\\', char(c) };
    if(c == '-')
        return "-";
    return byte_to_string(c);
}

std::string to_string(regex_t const& regex)
{
    return std::visit([](auto const& node) -> std::string
    {
        using T = std::decay_t<decltype(node)>;
        if constexpr(std::is_same_v<T, rx_empty_t>)
            return "()";
        else if constexpr(std::is_same_v<T, rx_literal_t>)
            return literal_to_string(node.byte);
        else if constexpr(std::is_same_v<T, rx_any_t>)
            return ".";
        else if constexpr(std::is_same_v<T, rx_class_t>)
        {
            charset_t set;
            for(byte_range_t r : node.ranges)
                set.set_range(r.lo, r.hi);
            std::string str = set.to_string();
            if(node.negated)
                str.insert(1, "^");
            return str;
        }
        else if constexpr(std::is_same_v<T, rx_concat_t>)
            return "(" + to_string(*node.l) + to_string(*node.r) + ")";
        else if constexpr(std::is_same_v<T, rx_union_t>)
            return "(" + to_string(*node.l) + "|" + to_string(*node.r) + ")";
        else if constexpr(std::is_same_v<T, rx_star_t>)
            return "(" + to_string(*node.inner) + ")*";
        else if constexpr(std::is_same_v<T, rx_plus_t>)
            return "(" + to_string(*node.inner) + ")+";
        else if constexpr(std::is_same_v<T, rx_optional_t>)
            return "(" + to_string(*node.inner) + ")?";
        else if constexpr(std::is_same_v<T, rx_repeat_t>)
        {
            if(node.max == REPEAT_INF)
                return fmt("(%){%,}", to_string(*node.inner), node.min);
            if(node.max == node.min)
                return fmt("(%){%}", to_string(*node.inner), node.min);
            return fmt("(%){%,%}", to_string(*node.inner), node.min, node.max);
        }
        else
            static_assert(always_false<T>);
    }, regex.v);
}
