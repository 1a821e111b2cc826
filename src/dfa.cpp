#include "dfa.hpp"

#include <deque>
#include <map>
#include <stdexcept>

#include "byte_class.hpp"

dfa_t nfa_to_dfa(nfa_t const& nfa, unsigned num_rules)
{
    bool any_rules = false;
    for(unsigned start : nfa.starts)
        any_rules |= !nfa[start].epsilon.empty();
    if(!any_rules)
        throw std::logic_error("Cannot build a DFA from an NFA without rules.");

    // Only one representative per class needs to be followed.
    byte_classes_t const classes = refine_byte_classes(edge_charsets(nfa));

    dfa_t dfa;
    dfa.num_rules = num_rules;

    using node_t = std::pair<nfa_set_t const, unsigned>;
    std::map<nfa_set_t, unsigned> nodes;
    std::deque<node_t const*> todo;

    auto const add = [&](nfa_set_t set) -> unsigned
    {
        auto result = nodes.emplace(std::move(set), dfa.size());
        if(result.second)
        {
            unsigned const id = dfa.new_state();
            dfa.states[id].accept = lowest_accept(nfa, result.first->first);
            todo.push_back(&*result.first);
        }
        return result.first->second;
    };

    // The empty closure is the reject state.
    add(nfa_set_t());
    todo.clear();

    for(unsigned start : nfa.starts)
        dfa.starts.push_back(add(eclosure(nfa, { start })));

    while(todo.size())
    {
        node_t const& node = *todo.front();
        todo.pop_front();

        for(unsigned c = 0; c < classes.size(); ++c)
        {
            nfa_set_t moved = nfa_move(nfa, node.first, classes.representative(c));
            unsigned const target = add(eclosure(nfa, std::move(moved)));
            classes.members[c].for_each([&](unsigned char byte)
            {
                dfa.states[node.second].next[byte] = target;
            });
        }
    }

    return dfa;
}

std::vector<unsigned> unmatched_rules(dfa_t const& dfa)
{
    std::vector<bool> matched(dfa.num_rules, false);
    for(dfa_state_t const& state : dfa.states)
        if(state.accepting())
            matched.at(state.accept) = true;

    std::vector<unsigned> ret;
    for(unsigned i = 0; i < matched.size(); ++i)
        if(!matched[i])
            ret.push_back(i);
    return ret;
}

unsigned dfa_walk(dfa_t const& dfa, unsigned state, std::string_view input)
{
    for(char c : input)
        state = dfa[state].next[static_cast<unsigned char>(c)];
    return state;
}
