//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include "scan_driver.h"
#include "errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace blockgrep
{
    ScanDriver::ScanDriver(const PatternSet& patterns, ScanOptions options) :
        patterns_(patterns),
        options_(options)
    {
        if(options_.chunkSize == 0)
        {
            throw std::invalid_argument("chunk size must be greater than zero");
        }
    }

    // See scan_driver.h
    ScanStats ScanDriver::run(ChunkReader& reader, const MatchHandler& handler)
    {
        cancelled_.store(false, std::memory_order_relaxed);
        ScanState scan;
        spdlog::debug("scanning {} for {} pattern(s), chunk size {}", reader.name(), patterns_.size(), options_.chunkSize);

        try
        {
            Chunk chunk;
            while(true)
            {
                if(cancelled_.load(std::memory_order_relaxed))
                {
                    scan.stats.cancelled = true;
                    spdlog::debug("scan of {} cancelled after {} bytes", reader.name(), scan.bytesConsumed);
                    break;
                }

                state_ = State::Reading;
                if(!reader.next_chunk(chunk, options_.chunkSize))
                {
                    break;
                }
                ++scan.stats.chunks;

                state_ = State::Scanning;
                scan.events.clear();
                patterns_.scan(chunk.bytes, scan.events);

                state_ = State::Resolving;
                resolve(chunk, scan);

                state_ = State::Delivering;
                deliver(scan, handler);

                scan.linesBefore = indexer_.lines_through();
                scan.bytesConsumed += chunk.bytes.size();
                spdlog::trace("chunk @{} ({} bytes): {} line(s), {} event(s), {} delivered",
                              chunk.offset, chunk.bytes.size(), indexer_.size(), scan.events.size(), scan.pending.size());
            }
        }
        catch(const ReadError& e)
        {
            state_ = State::Error;
            reader.close();
            spdlog::error("{}", e.what());
            throw;
        }
        catch(const ScanEngineError& e)
        {
            state_ = State::Error;
            reader.close();
            spdlog::error("{} ({} after {} bytes)", e.what(), reader.name(), scan.bytesConsumed);
            throw;
        }
        catch(...)
        {
            // Handler exceptions travel to the caller as thrown; deliver() has logged them.
            state_ = State::Error;
            reader.close();
            if(!scan.handlerFailed)
            {
                spdlog::error("scan of {} aborted after line {}", reader.name(), scan.linesBefore);
            }
            throw;
        }

        reader.close();
        state_ = State::Done;
        scan.stats.bytes = scan.bytesConsumed;
        scan.stats.lines = scan.linesBefore;
        spdlog::debug("scan of {} done: {} line(s), {} match(es) delivered", reader.name(), scan.stats.lines, scan.stats.deliveries);
        return scan.stats;
    }

    void ScanDriver::resolve(const Chunk& chunk, ScanState& scan)
    {
        indexer_.index(chunk.bytes, chunk.offset, scan.linesBefore);
        scan.pending.clear();
        for(MatchEvent& event : scan.events)
        {
            event.end += chunk.offset;
            std::size_t line;
            if(event.start)
            {
                *event.start += chunk.offset;
                line = indexer_.line_of(*event.start);
            } else {
                line = indexer_.line_ending_at(event.end);
            }
            const LineNumber number = scan.linesBefore + line + 1;
            if(scan.reported.emplace(number, event.pattern).second)
            {
                scan.pending.emplace_back(number, event.pattern);
            }
        }
        std::sort(scan.pending.begin(), scan.pending.end());
        scan.stats.events += scan.events.size();
    }

    void ScanDriver::deliver(ScanState& scan, const MatchHandler& handler)
    {
        for(const auto& [number, pattern] : scan.pending)
        {
            const LineRecord record = indexer_.record(static_cast<std::size_t>(number - scan.linesBefore - 1));
            try
            {
                handler(record.number, pattern, record.text);
            }
            catch(...)
            {
                scan.handlerFailed = true;
                spdlog::debug("handler threw on line {}, pattern #{}", record.number, pattern);
                throw;
            }
            ++scan.stats.deliveries;
        }
        // Chunks end on a terminator, so no line seen so far can match again.
        scan.reported.clear();
    }

    const char* to_string(ScanDriver::State state)
    {
        switch(state)
        {
            case ScanDriver::State::Idle:       return "Idle";
            case ScanDriver::State::Reading:    return "Reading";
            case ScanDriver::State::Scanning:   return "Scanning";
            case ScanDriver::State::Resolving:  return "Resolving";
            case ScanDriver::State::Delivering: return "Delivering";
            case ScanDriver::State::Done:       return "Done";
            case ScanDriver::State::Error:      return "Error";
        }
        return "Unknown";
    }
}
