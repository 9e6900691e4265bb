//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include "line_indexer.h"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace blockgrep
{
    // See line_indexer.h
    void LineIndexer::index(std::string_view bytes, std::uint64_t baseOffset, LineNumber linesBefore)
    {
        bytes_ = bytes;
        baseOffset_ = baseOffset;
        linesBefore_ = linesBefore;
        spans_.clear();
        terminated_ = false;

        const char* const data = bytes.data();
        const std::size_t size = bytes.size();
        std::size_t start = 0;
        while(start < size)
        {
            const void* hit = std::memchr(data + start, '\n', size - start);
            if(!hit)
            {
                spans_.push_back({start, size, size});
                terminated_ = false;
                return;
            }
            const std::size_t newline = static_cast<const char*>(hit) - data;
            std::size_t end = newline;
            if(end > start && data[end - 1] == '\r')
            {
                --end;
            }
            spans_.push_back({start, end, newline + 1});
            terminated_ = true;
            start = newline + 1;
        }
    }

    // See line_indexer.h
    std::size_t LineIndexer::line_of(std::uint64_t offset) const
    {
        if(offset < baseOffset_ || offset > baseOffset_ + bytes_.size() || spans_.empty())
        {
            throw std::out_of_range("offset " + std::to_string(offset) + " is outside the indexed chunk");
        }
        const std::size_t local = static_cast<std::size_t>(offset - baseOffset_);
        // First line starting after the offset; the owner is the one before it.
        const auto after = std::upper_bound(spans_.begin(), spans_.end(), local,
                                            [](std::size_t value, const LineSpan& span) {
                                                return value < span.start;
                                            });
        if(after == spans_.begin())
        {
            return 0;
        }
        // An offset one past the end of the chunk can only be the last line's.
        return std::min<std::size_t>(after - spans_.begin() - 1, spans_.size() - 1);
    }

    // See line_indexer.h
    std::size_t LineIndexer::line_ending_at(std::uint64_t endOffset) const
    {
        const std::size_t line = line_of(endOffset);
        const std::size_t local = static_cast<std::size_t>(endOffset - baseOffset_);
        if(line > 0 && local == spans_[line].start)
        {
            return line - 1;
        }
        return line;
    }

    LineRecord LineIndexer::record(std::size_t line) const
    {
        const LineSpan& span = spans_.at(line);
        return {linesBefore_ + line + 1, bytes_.substr(span.start, span.end - span.start)};
    }
}
