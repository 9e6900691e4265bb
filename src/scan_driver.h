//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#ifndef BLOCKGREP_SCAN_DRIVER_H
#define BLOCKGREP_SCAN_DRIVER_H

#include "chunk_reader.h"
#include "line_indexer.h"
#include "pattern_set.h"
#include "result_sink.h"
#include "types.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>

namespace blockgrep {

    struct ScanOptions
    {
        /// Bytes requested from the input per read. Lines longer than this
        /// are still read whole.
        std::size_t chunkSize = 1 << 20;
    };

    struct ScanStats
    {
        std::uint64_t chunks = 0;
        std::uint64_t bytes = 0;
        LineNumber lines = 0;
        std::uint64_t events = 0;
        std::uint64_t deliveries = 0;
        bool cancelled = false;
    };

    /**
     * Everything carried from one chunk to the next during a single scan.
     */
    struct ScanState
    {
        LineNumber linesBefore = 0;
        std::uint64_t bytesConsumed = 0;
        /// (line, pattern) pairs already delivered for lines still open.
        std::set<std::pair<LineNumber, PatternId>> reported;
        std::vector<MatchEvent> events;
        std::vector<std::pair<LineNumber, PatternId>> pending;
        ScanStats stats;
        bool handlerFailed = false;
    };

    /**
     * Runs one scan: pulls chunks, matches them, resolves match offsets to
     * lines and hands each (line, pattern) to the handler exactly once, in
     * file order.
     *
     * Single threaded. A driver borrows its PatternSet and may be reused for
     * further scans once run() has returned.
     */
    class ScanDriver
    {
    public:
        enum class State
        {
            Idle,
            Reading,
            Scanning,
            Resolving,
            Delivering,
            Done,
            Error
        };

        explicit ScanDriver(const PatternSet& patterns, ScanOptions options = {});

        /**
         * Scan reader to the end, or until cancel().
         *
         * The reader is closed on every way out of here. Deliveries made before
         * an exception remain valid.
         *
         * @throws ReadError, ScanEngineError, or whatever the handler throws.
         */
        ScanStats run(ChunkReader& reader, const MatchHandler& handler);

        /**
         * Ask a running scan to stop. Matches already resolved for the current
         * chunk are still delivered; no further chunk is read. May be called
         * from the handler or another thread.
         */
        void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

        State state() const { return state_.load(std::memory_order_relaxed); }

    private:
        void resolve(const Chunk& chunk, ScanState& scan);
        void deliver(ScanState& scan, const MatchHandler& handler);

        const PatternSet& patterns_;
        ScanOptions options_;
        LineIndexer indexer_;
        std::atomic<bool> cancelled_{false};
        std::atomic<State> state_{State::Idle};
    };

    const char* to_string(ScanDriver::State state);
}

#endif //BLOCKGREP_SCAN_DRIVER_H
