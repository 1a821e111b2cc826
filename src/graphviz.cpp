#include "graphviz.hpp"

#include <map>
#include <string>

#include "dfa.hpp"
#include "format.hpp"
#include "parser.hpp"

static std::string gv_id(unsigned state) { return "state_" + std::to_string(state); }

static std::string gv_escape(std::string const& str)
{
    std::string ret;
    for(char c : str)
    {
        if(c == '"' || c == '\\')
            ret.push_back('\\');
        ret.push_back(c);
    }
    return ret;
}

void graphviz_dfa(std::ostream& o, dfa_t const& dfa, syntax_file_t const& file)
{
    o << "digraph {\n";
    o << "rankdir=LR;\n";
    o << "node [shape=circle];\n";

    for(unsigned i = 0; i < file.conditions.size() && i < dfa.starts.size(); ++i)
    {
        o << "start_" << i << " [shape=plaintext label=\"" << gv_escape(file.conditions[i].name) << "\"];\n";
        o << "start_" << i << " -> " << gv_id(dfa.starts[i]) << ";\n";
    }

    for(unsigned s = 0; s < dfa.size(); ++s)
    {
        if(s == REJECT_STATE)
            continue;

        dfa_state_t const& state = dfa[s];
        o << gv_id(s);
        if(state.accepting())
            o << fmt(" [shape=doublecircle label=\"%\\nrule %\"]", s, state.accept);
        else
            o << fmt(" [label=\"%\"]", s);
        o << ";\n";

        // Group bytes by target, so each target gets a single edge.
        std::map<unsigned, charset_t> targets;
        for(unsigned b = 0; b < NUM_BYTES; ++b)
            if(state.next[b] != REJECT_STATE)
                targets[state.next[b]].set(b);

        for(auto const& pair : targets)
        {
            o << gv_id(s) << " -> " << gv_id(pair.first);
            o << " [label=\"" << gv_escape(pair.second.to_string()) << "\"];\n";
        }
    }

    o << "}\n";
}
