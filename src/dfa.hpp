#ifndef DFA_HPP
#define DFA_HPP

// Subset construction.
//
// State 0 is always the reject state: it has an empty closure,
// never accepts, and every byte leads back to it.
// Every state's transition function is total over the 256 bytes.

#include <array>
#include <string_view>
#include <vector>

#include "charset.hpp"
#include "nfa.hpp"

constexpr unsigned REJECT_STATE = 0;

struct dfa_state_t
{
    std::array<unsigned, NUM_BYTES> next;
    unsigned accept = NO_RULE;

    bool accepting() const { return accept != NO_RULE; }
};

struct dfa_t
{
    std::vector<dfa_state_t> states;

    // Start state of each start condition.
    std::vector<unsigned> starts;

    unsigned num_rules = 0;

    std::size_t size() const { return states.size(); }
    dfa_state_t const& operator[](unsigned i) const { return states[i]; }

    unsigned new_state()
    {
        dfa_state_t& state = states.emplace_back();
        state.next.fill(REJECT_STATE);
        return states.size() - 1;
    }
};

// Each distinct closure becomes one state. States are numbered in the order
// they are discovered, breadth-first from the start states, so the result
// depends only on the order of the rules.
// When several rules accept in one closure, the lowest index wins.
// Throws std::logic_error if no start state leads anywhere.
dfa_t nfa_to_dfa(nfa_t const& nfa, unsigned num_rules);

// Rule indexes which tag no state, in ascending order.
// Such rules are shadowed by earlier ones and can never match.
std::vector<unsigned> unmatched_rules(dfa_t const& dfa);

// Follows 'input' from 'state'. Used by tests.
unsigned dfa_walk(dfa_t const& dfa, unsigned state, std::string_view input);

#endif
