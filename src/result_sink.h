//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#ifndef BLOCKGREP_RESULT_SINK_H
#define BLOCKGREP_RESULT_SINK_H

#include "types.h"
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blockgrep {

    /**
     * Streaming delivery: called synchronously once per (line, pattern) match,
     * in ascending line order. The text view dies when the call returns.
     * Anything thrown aborts the scan and reaches the caller unchanged.
     */
    using MatchHandler = std::function<void(LineNumber lineNumber, PatternId pattern, std::string_view line)>;

    using NumberedLine = std::pair<LineNumber, std::string>;

    /**
     * Batch delivery of (line number, text) pairs. A line matched by several
     * patterns is kept once.
     */
    class NumberedLineCollector
    {
    public:
        void operator()(LineNumber lineNumber, PatternId pattern, std::string_view line);

        MatchHandler handler();
        const std::vector<NumberedLine>& results() const { return results_; }
        std::vector<NumberedLine> take() { return std::move(results_); }

    private:
        std::vector<NumberedLine> results_;
    };

    /**
     * Batch delivery of bare line text, for when line numbers are not wanted.
     */
    class LineCollector
    {
    public:
        void operator()(LineNumber lineNumber, PatternId pattern, std::string_view line);

        MatchHandler handler();
        const std::vector<std::string>& results() const { return results_; }
        std::vector<std::string> take() { return std::move(results_); }

    private:
        std::vector<std::string> results_;
        LineNumber last_ = 0;
    };
}

#endif //BLOCKGREP_RESULT_SINK_H
