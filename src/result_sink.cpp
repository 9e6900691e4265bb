//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include "result_sink.h"

namespace blockgrep
{
    // Deliveries arrive in ascending line order, so a repeat can only be the
    // most recent line.

    void NumberedLineCollector::operator()(LineNumber lineNumber, PatternId, std::string_view line)
    {
        if(results_.empty() || results_.back().first != lineNumber)
        {
            results_.emplace_back(lineNumber, std::string(line));
        }
    }

    MatchHandler NumberedLineCollector::handler()
    {
        return [this](LineNumber lineNumber, PatternId pattern, std::string_view line) {
            (*this)(lineNumber, pattern, line);
        };
    }

    void LineCollector::operator()(LineNumber lineNumber, PatternId, std::string_view line)
    {
        if(last_ != lineNumber)
        {
            results_.emplace_back(line);
            last_ = lineNumber;
        }
    }

    MatchHandler LineCollector::handler()
    {
        return [this](LineNumber lineNumber, PatternId pattern, std::string_view line) {
            (*this)(lineNumber, pattern, line);
        };
    }
}
