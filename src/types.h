//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#ifndef BLOCKGREP_TYPES_H
#define BLOCKGREP_TYPES_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace blockgrep {

    using LineNumber = std::uint64_t;
    using PatternId = unsigned;

    /**
     * A raw match as reported by PatternSet::scan. Offsets are relative to the
     * scanned buffer until the driver rebases them onto the file.
     */
    struct MatchEvent
    {
        PatternId pattern;
        std::uint64_t end;
        std::optional<std::uint64_t> start;
    };

    /**
     * A resolved line, 1-based, text without its terminator. The text is only
     * valid for the duration of the call it is handed to.
     */
    struct LineRecord
    {
        LineNumber number;
        std::string_view text;
    };
}

#endif //BLOCKGREP_TYPES_H
