//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
// Thin wrappers over the standard library's regex templates, kept out of line
// to get a clean line in profiles.
//
#ifndef BLOCKGREP_REGEX_FUNCTIONS_H
#define BLOCKGREP_REGEX_FUNCTIONS_H

#include <cstddef>
#include <functional>
#include <regex>
#include <string>

namespace blockgrep {

    /**
     * Receives [begin, end) of one match, relative to the searched range.
     */
    using MatchVisitor = std::function<void(std::size_t begin, std::size_t end)>;

    /**
     * Report every non-overlapping match of e in [first, last), leftmost first.
     * The range is searched as one complete line, so ^ and $ anchor at its
     * ends.
     * @return Number of matches reported.
     * @throws std::regex_error if the engine runs out of resources.
     */
    std::size_t search_all(const char* first,
                           const char* last,
                           const std::regex& e,
                           const MatchVisitor& visit);

    /**
     * Escape every ECMAScript metacharacter so the result matches s literally.
     */
    std::string escape_literal(const std::string& s);
}
#endif //BLOCKGREP_REGEX_FUNCTIONS_H
