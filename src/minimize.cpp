#include "minimize.hpp"

#include <map>
#include <vector>

#include "assert.hpp"
#include "byte_class.hpp"

dfa_t minimize_dfa(dfa_t const& dfa)
{
    std::size_t const n = dfa.size();
    byte_classes_t const bytes = dfa_byte_classes(dfa);

    // Initial partition: by accept tag.
    std::vector<unsigned> partition(n);
    unsigned num_classes;
    {
        std::map<unsigned, unsigned> by_accept;
        for(unsigned s = 0; s < n; ++s)
            partition[s] = by_accept.emplace(dfa[s].accept, by_accept.size()).first->second;
        num_classes = by_accept.size();
    }

    // Refine until no class splits.
    // A state's key is its class followed by the classes of its targets.
    // Since the key includes the old class, each pass can only split classes.
    std::map<std::vector<unsigned>, unsigned> keys;
    std::vector<unsigned> key;
    std::vector<unsigned> next(n);
    while(true)
    {
        keys.clear();
        for(unsigned s = 0; s < n; ++s)
        {
            key.clear();
            key.push_back(partition[s]);
            for(unsigned c = 0; c < bytes.size(); ++c)
                key.push_back(partition[dfa[s].next[bytes.representative(c)]]);
            next[s] = keys.emplace(key, keys.size()).first->second;
        }

        if(keys.size() == num_classes)
            break;

        num_classes = keys.size();
        partition.swap(next);
    }

    // Classes were numbered by first appearance, so the reject state's is 0.
    passert(partition[REJECT_STATE] == REJECT_STATE, partition[REJECT_STATE]);

    dfa_t ret;
    ret.num_rules = dfa.num_rules;
    std::vector<bool> built(num_classes, false);

    for(unsigned i = 0; i < num_classes; ++i)
        ret.new_state();

    for(unsigned s = 0; s < n; ++s)
    {
        unsigned const c = partition[s];
        if(built[c])
            continue;
        built[c] = true;

        dfa_state_t& state = ret.states[c];
        state.accept = dfa[s].accept;
        for(unsigned b = 0; b < NUM_BYTES; ++b)
            state.next[b] = partition[dfa[s].next[b]];
    }

    for(unsigned start : dfa.starts)
        ret.starts.push_back(partition[start]);

    return ret;
}
