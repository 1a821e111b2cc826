#include "byte_class.hpp"

#include <algorithm>
#include <map>

#include "dfa.hpp"

namespace
{

// Numbers the classes by their lowest byte and fills in 'class_of'.
byte_classes_t number_classes(std::vector<charset_t> classes)
{
    std::sort(classes.begin(), classes.end(), [](charset_t const& a, charset_t const& b)
    {
        return a.lowest() < b.lowest();
    });

    byte_classes_t ret;
    ret.members = std::move(classes);
    for(unsigned i = 0; i < ret.members.size(); ++i)
        ret.members[i].for_each([&](unsigned char c) { ret.class_of[c] = i; });
    return ret;
}

} // end anon namespace

byte_classes_t refine_byte_classes(std::vector<charset_t> const& sets)
{
    std::vector<charset_t> classes = { charset_t::full() };
    std::vector<charset_t> next;

    for(charset_t const& set : sets)
    {
        next.clear();
        for(charset_t const& c : classes)
        {
            charset_t const in = c & set;
            charset_t const out = c - set;
            if(in)
                next.push_back(in);
            if(out)
                next.push_back(out);
        }
        classes.swap(next);
    }

    return number_classes(std::move(classes));
}

byte_classes_t dfa_byte_classes(dfa_t const& dfa)
{
    // Group bytes by their column of the transition table.
    std::map<std::vector<unsigned>, charset_t> columns;
    std::vector<unsigned> column(dfa.size());

    for(unsigned c = 0; c < NUM_BYTES; ++c)
    {
        for(unsigned s = 0; s < dfa.size(); ++s)
            column[s] = dfa.states[s].next[c];
        columns[column].set(c);
    }

    std::vector<charset_t> classes;
    classes.reserve(columns.size());
    for(auto const& pair : columns)
        classes.push_back(pair.second);

    return number_classes(std::move(classes));
}
