//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#ifndef BLOCKGREP_LINE_INDEXER_H
#define BLOCKGREP_LINE_INDEXER_H

#include "types.h"
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace blockgrep {

    /**
     * Byte range of one line inside the indexed buffer. [start, end) is the
     * text, [end, next) the terminator ("\n", "\r\n" or nothing for an
     * unterminated last line).
     */
    struct LineSpan
    {
        std::size_t start;
        std::size_t end;
        std::size_t next;
    };

    /**
     * Maps absolute byte offsets in the input back onto 1-based line numbers
     * and line text, one chunk at a time.
     */
    class LineIndexer
    {
    public:
        /**
         * Index the lines of a chunk, replacing any previous index.
         *
         * @param bytes The chunk. Must outlive any LineRecord handed out.
         * @param baseOffset Absolute offset of bytes[0].
         * @param linesBefore Number of lines in the input before this chunk.
         */
        void index(std::string_view bytes, std::uint64_t baseOffset, LineNumber linesBefore);

        std::size_t size() const { return spans_.size(); }
        bool empty() const { return spans_.empty(); }
        const std::vector<LineSpan>& spans() const { return spans_; }

        /// True if the last indexed line ends with a terminator.
        bool terminated() const { return terminated_; }

        /**
         * Index of the line owning the byte at an absolute offset. An offset
         * sitting on a terminator belongs to the line the terminator ends.
         * @throws std::out_of_range if the offset is outside the indexed chunk.
         */
        std::size_t line_of(std::uint64_t offset) const;

        /**
         * Index of the line owning a match that ends (exclusively) at an
         * absolute offset. An end that falls exactly on a line boundary belongs
         * to the preceding line.
         * @throws std::out_of_range if the offset is outside the indexed chunk.
         */
        std::size_t line_ending_at(std::uint64_t endOffset) const;

        LineRecord record(std::size_t line) const;

        /// Line count carried forward into the next chunk.
        LineNumber lines_through() const { return linesBefore_ + spans_.size(); }

    private:
        std::string_view bytes_;
        std::uint64_t baseOffset_ = 0;
        LineNumber linesBefore_ = 0;
        std::vector<LineSpan> spans_;
        bool terminated_ = false;
    };
}

#endif //BLOCKGREP_LINE_INDEXER_H
