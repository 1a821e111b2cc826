#ifndef MACRO_HPP
#define MACRO_HPP

// Named definitions ("macros") from the first section of a syntax file.
// Each maps a name to an already-parsed pattern, which '{NAME}' references
// clone into the tree being built.

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "pstring.hpp"
#include "regex.hpp"

struct definition_t
{
    std::string name;
    pstring_t pstring; // Location of the name.
    pstring_t pattern; // Location of the pattern text.
    rptr regex;
};

class definition_table_t
{
public:
    definition_t const* lookup(std::string_view name) const
    {
        auto it = m_map.find(name);
        return it == m_map.end() ? nullptr : &it->second;
    }

    // Returns false if the name was already defined.
    bool define(definition_t def);

    std::size_t size() const { return m_map.size(); }

    // Definitions in the order they were declared.
    std::vector<definition_t const*> const& ordered() const { return m_order; }

private:
    std::map<std::string, definition_t, std::less<>> m_map;
    std::vector<definition_t const*> m_order;
};

bool is_definition_name(std::string_view name);

#endif
