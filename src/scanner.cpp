#include "scanner.hpp"

match_t next_token(dfa_t const& dfa, std::string_view input, std::size_t pos, unsigned condition)
{
    match_t last;
    unsigned state = dfa.starts.at(condition);

    // The start state's own acceptance is ignored: tokens are never empty.
    for(std::size_t i = pos; i < input.size(); ++i)
    {
        state = dfa[state].next[static_cast<unsigned char>(input[i])];
        if(state == REJECT_STATE)
            break;
        if(dfa[state].accepting())
            last = { dfa[state].accept, i + 1 - pos };
    }

    return last;
}

scan_result_t scan_all(dfa_t const& dfa, std::string_view input, unsigned condition)
{
    scan_result_t result;
    std::size_t pos = 0;

    while(pos < input.size())
    {
        match_t const match = next_token(dfa, input, pos, condition);
        if(!match)
        {
            result.error_pos = pos;
            break;
        }
        result.tokens.push_back({ match.rule, pos, match.length });
        pos += match.length;
    }

    return result;
}
