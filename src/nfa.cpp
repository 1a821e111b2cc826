#include "nfa.hpp"

#include <algorithm>

#include "assert.hpp"
#include "parser.hpp"

namespace
{

nfa_fragment_t gen_edge(nfa_t& nfa, charset_t const& chars)
{
    nfa_fragment_t frag;
    frag.start = nfa.new_state();
    frag.accept = nfa.new_state();
    nfa[frag.start].edges.push_back({ chars, frag.accept });
    return frag;
}

nfa_fragment_t gen_empty(nfa_t& nfa)
{
    nfa_fragment_t frag;
    frag.start = nfa.new_state();
    frag.accept = nfa.new_state();
    nfa[frag.start].epsilon.push_back(frag.accept);
    return frag;
}

nfa_fragment_t gen_concat(nfa_t& nfa, nfa_fragment_t l, nfa_fragment_t r)
{
    nfa[l.accept].epsilon.push_back(r.start);
    return { l.start, r.accept };
}

nfa_fragment_t gen_union(nfa_t& nfa, nfa_fragment_t l, nfa_fragment_t r)
{
    nfa_fragment_t frag;
    frag.start = nfa.new_state();
    frag.accept = nfa.new_state();
    nfa[frag.start].epsilon.push_back(l.start);
    nfa[frag.start].epsilon.push_back(r.start);
    nfa[l.accept].epsilon.push_back(frag.accept);
    nfa[r.accept].epsilon.push_back(frag.accept);
    return frag;
}

nfa_fragment_t gen_kleene(nfa_t& nfa, nfa_fragment_t x)
{
    nfa_fragment_t frag;
    frag.start = nfa.new_state();
    frag.accept = nfa.new_state();
    nfa[frag.start].epsilon.push_back(x.start);
    nfa[frag.start].epsilon.push_back(frag.accept);
    nfa[x.accept].epsilon.push_back(x.start);
    nfa[x.accept].epsilon.push_back(frag.accept);
    return frag;
}

// Bounded repetition: 'min' mandatory copies, followed by either
// 'max - min' optional copies, or a star when unbounded.
nfa_fragment_t gen_repeat(nfa_t& nfa, rx_repeat_t const& node)
{
    nfa_fragment_t frag = gen_empty(nfa);

    for(unsigned i = 0; i < node.min; ++i)
        frag = gen_concat(nfa, frag, build_nfa(*node.inner, nfa));

    if(node.max == REPEAT_INF)
        return gen_concat(nfa, frag, gen_kleene(nfa, build_nfa(*node.inner, nfa)));

    for(unsigned i = node.min; i < node.max; ++i)
        frag = gen_concat(nfa, frag, gen_union(nfa, build_nfa(*node.inner, nfa), gen_empty(nfa)));

    return frag;
}

} // end anon namespace

nfa_fragment_t build_nfa(regex_t const& regex, nfa_t& nfa)
{
    return std::visit([&](auto const& node) -> nfa_fragment_t
    {
        using T = std::decay_t<decltype(node)>;
        if constexpr(std::is_same_v<T, rx_empty_t>)
            return gen_empty(nfa);
        else if constexpr(std::is_same_v<T, rx_literal_t>)
            return gen_edge(nfa, charset_t::single(node.byte));
        else if constexpr(std::is_same_v<T, rx_any_t>)
            return gen_edge(nfa, charset_t::full());
        else if constexpr(std::is_same_v<T, rx_class_t>)
            return gen_edge(nfa, node.charset());
        else if constexpr(std::is_same_v<T, rx_concat_t>)
        {
            nfa_fragment_t const l = build_nfa(*node.l, nfa);
            nfa_fragment_t const r = build_nfa(*node.r, nfa);
            return gen_concat(nfa, l, r);
        }
        else if constexpr(std::is_same_v<T, rx_union_t>)
        {
            nfa_fragment_t const l = build_nfa(*node.l, nfa);
            nfa_fragment_t const r = build_nfa(*node.r, nfa);
            return gen_union(nfa, l, r);
        }
        else if constexpr(std::is_same_v<T, rx_star_t>)
            return gen_kleene(nfa, build_nfa(*node.inner, nfa));
        else if constexpr(std::is_same_v<T, rx_plus_t>)
        {
            nfa_fragment_t const once = build_nfa(*node.inner, nfa);
            nfa_fragment_t const more = gen_kleene(nfa, build_nfa(*node.inner, nfa));
            return gen_concat(nfa, once, more);
        }
        else if constexpr(std::is_same_v<T, rx_optional_t>)
        {
            nfa_fragment_t const x = build_nfa(*node.inner, nfa);
            return gen_union(nfa, x, gen_empty(nfa));
        }
        else if constexpr(std::is_same_v<T, rx_repeat_t>)
            return gen_repeat(nfa, node);
        else
            static_assert(always_false<T>, "Unhandled regex node.");
    }, regex.v);
}

nfa_fragment_t build_rule_nfa(regex_t const& regex, unsigned rule, nfa_t& nfa)
{
    nfa_fragment_t const frag = build_nfa(regex, nfa);
    nfa[frag.accept].accept = rule;
    return frag;
}

nfa_t build_nfa(syntax_file_t const& file)
{
    nfa_t nfa;

    for(unsigned i = 0; i < file.conditions.size(); ++i)
        nfa.starts.push_back(nfa.new_state());

    for(rule_t const& rule : file.rules)
    {
        passert(rule.regex, rule.index);
        nfa_fragment_t const frag = build_rule_nfa(*rule.regex, rule.index, nfa);
        for(unsigned cond : rule.conditions)
            nfa[nfa.starts.at(cond)].epsilon.push_back(frag.start);
    }

    return nfa;
}

nfa_set_t eclosure(nfa_t const& nfa, nfa_set_t set)
{
    std::vector<unsigned> todo(set.begin(), set.end());
    while(todo.size())
    {
        unsigned const s = todo.back();
        todo.pop_back();
        for(unsigned target : nfa[s].epsilon)
            if(set.insert(target).second)
                todo.push_back(target);
    }
    return set;
}

nfa_set_t nfa_move(nfa_t const& nfa, nfa_set_t const& set, unsigned char byte)
{
    nfa_set_t ret;
    for(unsigned s : set)
        for(nfa_edge_t const& edge : nfa[s].edges)
            if(edge.chars.test(byte))
                ret.insert(edge.target);
    return ret;
}

unsigned lowest_accept(nfa_t const& nfa, nfa_set_t const& set)
{
    unsigned ret = NO_RULE;
    for(unsigned s : set)
        ret = std::min(ret, nfa[s].accept);
    return ret;
}

std::vector<charset_t> edge_charsets(nfa_t const& nfa)
{
    bc::flat_set<charset_t> sets;
    for(nfa_state_t const& state : nfa.states)
        for(nfa_edge_t const& edge : state.edges)
            sets.insert(edge.chars);
    return std::vector<charset_t>(sets.begin(), sets.end());
}
