#ifndef NFA_HPP
#define NFA_HPP

// Thompson's construction.
// States live in an arena and refer to each other by index,
// so the loops created by '*' and '+' are just data.

#include <cstdint>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>

#include "charset.hpp"
#include "regex.hpp"

namespace bc = ::boost::container;

struct syntax_file_t;

constexpr unsigned NO_RULE = ~0u;

struct nfa_edge_t
{
    charset_t chars;
    unsigned target;
};

struct nfa_state_t
{
    bc::small_vector<unsigned, 2> epsilon;
    bc::small_vector<nfa_edge_t, 1> edges;
    unsigned accept = NO_RULE; // Rule index, if accepting.
};

// A piece of NFA with one entry and one exit.
struct nfa_fragment_t
{
    unsigned start;
    unsigned accept;
};

struct nfa_t
{
    std::vector<nfa_state_t> states;

    // One synthetic start state per start condition.
    std::vector<unsigned> starts;

    unsigned new_state()
    {
        states.emplace_back();
        return states.size() - 1;
    }

    nfa_state_t& operator[](unsigned i) { return states[i]; }
    nfa_state_t const& operator[](unsigned i) const { return states[i]; }
    std::size_t size() const { return states.size(); }
};

using nfa_set_t = bc::flat_set<unsigned>;

nfa_fragment_t build_nfa(regex_t const& regex, nfa_t& nfa);

// Like above, but tags the fragment's accepting state with 'rule'.
nfa_fragment_t build_rule_nfa(regex_t const& regex, unsigned rule, nfa_t& nfa);

// Builds every rule of 'file', then links each condition's start state
// to the rules active in it, in declaration order.
nfa_t build_nfa(syntax_file_t const& file);

nfa_set_t eclosure(nfa_t const& nfa, nfa_set_t set);

// The states reachable from 'set' by consuming 'byte', before closure.
nfa_set_t nfa_move(nfa_t const& nfa, nfa_set_t const& set, unsigned char byte);

// Lowest rule index accepted by any state of 'set', or NO_RULE.
unsigned lowest_accept(nfa_t const& nfa, nfa_set_t const& set);

// The distinct edge labels of the automaton, used to compute byte classes.
std::vector<charset_t> edge_charsets(nfa_t const& nfa);

#endif
