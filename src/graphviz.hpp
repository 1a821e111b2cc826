#ifndef GRAPHVIZ_HPP
#define GRAPHVIZ_HPP

#include <ostream>

struct dfa_t;
struct syntax_file_t;

// Accepting states are double circles labelled with their rule.
// Edges into the reject state are omitted.
void graphviz_dfa(std::ostream& o, dfa_t const& dfa, syntax_file_t const& file);

#endif
