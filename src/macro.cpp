#include "macro.hpp"

#include <cctype>

bool definition_table_t::define(definition_t def)
{
    std::string name = def.name;
    auto result = m_map.emplace(std::move(name), std::move(def));
    if(!result.second)
        return false;
    m_order.push_back(&result.first->second);
    return true;
}

// Names match [a-zA-Z][a-zA-Z0-9_]*
bool is_definition_name(std::string_view name)
{
    if(name.empty() || !std::isalpha(static_cast<unsigned char>(name[0])))
        return false;
    for(char c : name)
        if(c != '_' && !std::isalnum(static_cast<unsigned char>(c)))
            return false;
    return true;
}
