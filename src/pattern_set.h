//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#ifndef BLOCKGREP_PATTERN_SET_H
#define BLOCKGREP_PATTERN_SET_H

#include "types.h"
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace blockgrep {

    /**
     * Grammar the pattern strings are written in. Maps onto the grammars
     * std::regex accepts.
     */
    enum class Syntax
    {
        ECMAScript,
        Basic,
        Extended,
        Awk,
        Grep,
        Egrep
    };

    struct PatternOptions
    {
        bool ignoreCase = false;
        /// Treat every pattern as a fixed string (fgrep). Overrides syntax.
        bool literal = false;
        Syntax syntax = Syntax::ECMAScript;
        /// Longest line, in bytes without its terminator, handed to the
        /// engine. std::regex matches by recursion, so its stack use grows with
        /// the line; longer lines fail the scan with ScanEngineError instead
        /// of overflowing the stack. 0 removes the limit.
        std::size_t maxLineLength = 8 * 1024;
    };

    /**
     * A set of patterns compiled once and then matched against any number of
     * buffers. Immutable after compile(), so one instance may be shared by
     * concurrent scans of different inputs.
     */
    class PatternSet
    {
    public:
        /**
         * Compile patterns in order. Pattern ids are indices into the list.
         * @throws PatternCompileError naming the first pattern the engine rejects.
         * @throws std::invalid_argument if patterns is empty.
         */
        static PatternSet compile(const std::vector<std::string>& patterns, const PatternOptions& options = {});

        /**
         * Scan a buffer of whole lines and append a MatchEvent per match.
         *
         * Matching is line by line: anchors bind to line boundaries and no
         * match crosses a terminator. Events come out grouped by line, then by
         * pattern id, then leftmost first. Offsets are relative to buffer.
         *
         * @throws ScanEngineError if the engine fails part way through, or a
         * line is longer than PatternOptions::maxLineLength.
         */
        void scan(std::string_view buffer, std::vector<MatchEvent>& events) const;

        std::size_t size() const { return regexes_.size(); }
        const std::string& pattern(PatternId id) const { return patterns_.at(id); }
        const PatternOptions& options() const { return options_; }

    private:
        PatternSet(std::vector<std::string> patterns, std::vector<std::regex> regexes, const PatternOptions& options);

        std::vector<std::string> patterns_;
        std::vector<std::regex> regexes_;
        PatternOptions options_;
    };
}

#endif //BLOCKGREP_PATTERN_SET_H
