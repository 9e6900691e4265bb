//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//

#include "regex_functions.h"
#include <cstring>


namespace blockgrep {
    using namespace std;

    size_t
    search_all(const char* first,
               const char* last,
               const regex& e,
               const MatchVisitor& visit)
    {
        size_t found = 0;
        const cregex_iterator end;
        for(cregex_iterator it(first, last, e); it != end; ++it)
        {
            const auto begin = static_cast<size_t>(it->position(0));
            visit(begin, begin + static_cast<size_t>(it->length(0)));
            ++found;
        }
        return found;
    }

    string escape_literal(const string& s)
    {
        static const char* const special = "\\^$.|?*+()[]{}";
        string escaped;
        escaped.reserve(s.size() * 2);
        for(const char c : s)
        {
            if(c != '\0' && std::strchr(special, c))
            {
                escaped.push_back('\\');
            }
            escaped.push_back(c);
        }
        return escaped;
    }
}
