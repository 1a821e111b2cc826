#ifndef BYTE_CLASS_HPP
#define BYTE_CLASS_HPP

// Byte equivalence classes: a partition of the 256 byte values into
// classes whose members behave identically in an automaton.
// Classes are numbered in order of their lowest member.

#include <array>
#include <vector>

#include "charset.hpp"

struct dfa_t;

struct byte_classes_t
{
    std::array<unsigned, NUM_BYTES> class_of = {};
    std::vector<charset_t> members;

    unsigned size() const { return members.size(); }

    // The lowest byte of class 'i'.
    unsigned char representative(unsigned i) const { return members[i].lowest(); }
};

// The coarsest partition in which every set of 'sets' is a union of classes.
byte_classes_t refine_byte_classes(std::vector<charset_t> const& sets);

// Bytes are equivalent when every state of 'dfa' sends them to the same state.
byte_classes_t dfa_byte_classes(dfa_t const& dfa);

#endif
