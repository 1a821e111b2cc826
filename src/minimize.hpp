#ifndef MINIMIZE_HPP
#define MINIMIZE_HPP

#include "dfa.hpp"

// Merges states which are indistinguishable: same accept tag, and for
// every byte, transitions into merged states. Uses partition refinement
// starting from the partition by accept tag, iterated to a fixed point.
// The reject state stays at index 0; other states keep the relative
// order of their first member, so the result is deterministic.
dfa_t minimize_dfa(dfa_t const& dfa);

#endif
