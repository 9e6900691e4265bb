//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
// Exceptions thrown out of a scan. Anything a caller's handler throws is
// propagated untouched and is not wrapped in one of these.
//
#ifndef BLOCKGREP_ERRORS_H
#define BLOCKGREP_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace blockgrep {

    /**
     * Failure opening or reading the input source.
     */
    class ReadError : public std::runtime_error
    {
    public:
        ReadError(const std::string& source, const std::string& reason) :
            std::runtime_error("read error on " + source + ": " + reason),
            source_(source)
        {}

        const std::string& source() const { return source_; }

    private:
        std::string source_;
    };

    /**
     * A pattern was rejected by the regex engine. Raised by PatternSet::compile,
     * so always before any input is read.
     */
    class PatternCompileError : public std::runtime_error
    {
    public:
        PatternCompileError(std::size_t index, const std::string& pattern, const std::string& diagnostic) :
            std::runtime_error("cannot compile pattern #" + std::to_string(index) + " \"" + pattern + "\": " + diagnostic),
            index_(index),
            pattern_(pattern),
            diagnostic_(diagnostic)
        {}

        std::size_t index() const { return index_; }
        const std::string& pattern() const { return pattern_; }
        const std::string& diagnostic() const { return diagnostic_; }

    private:
        std::size_t index_;
        std::string pattern_;
        std::string diagnostic_;
    };

    /**
     * The engine gave up part way through a buffer (regex complexity or stack
     * limits).
     */
    class ScanEngineError : public std::runtime_error
    {
    public:
        ScanEngineError(unsigned patternId, const std::string& diagnostic) :
            std::runtime_error("pattern #" + std::to_string(patternId) + " failed during scan: " + diagnostic),
            patternId_(patternId)
        {}

        unsigned patternId() const { return patternId_; }

    private:
        unsigned patternId_;
    };
}

#endif //BLOCKGREP_ERRORS_H
