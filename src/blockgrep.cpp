/**
 * Block grep.
 * Copyright Andrew Helge Cox 2017.
 * All rights reserved worldwide.
 */
#include "blockgrep.h"
#include "chunk_reader.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

namespace blockgrep
{
    using std::istream;
    using std::ostream;
    using std::string;
    using std::vector;

    // See blockgrep.h
    vector<string> grep(const string& path, const vector<string>& patterns,
                        const PatternOptions& patternOptions, const ScanOptions& scanOptions)
    {
        const PatternSet compiled = PatternSet::compile(patterns, patternOptions);
        LineCollector collector;
        scan_file(path, compiled, collector.handler(), scanOptions);
        return collector.take();
    }

    // See blockgrep.h
    vector<NumberedLine> grep_numbered(const string& path, const vector<string>& patterns,
                                       const PatternOptions& patternOptions, const ScanOptions& scanOptions)
    {
        const PatternSet compiled = PatternSet::compile(patterns, patternOptions);
        NumberedLineCollector collector;
        scan_file(path, compiled, collector.handler(), scanOptions);
        return collector.take();
    }

    // See blockgrep.h
    ScanStats scan_file(const string& path, const PatternSet& patterns,
                        const MatchHandler& handler, const ScanOptions& options)
    {
        ScanDriver driver(patterns, options);
        ChunkReader reader = ChunkReader::open(path);
        return driver.run(reader, handler);
    }

    // See blockgrep.h
    ScanStats scan_stream(istream& input, const PatternSet& patterns,
                          const MatchHandler& handler, const ScanOptions& options)
    {
        ScanDriver driver(patterns, options);
        ChunkReader reader(input);
        return driver.run(reader, handler);
    }

    // See blockgrep.h
    std::uint64_t count_matches(const string& path, const PatternSet& patterns, const ScanOptions& options)
    {
        std::uint64_t count = 0;
        LineNumber last = 0;
        scan_file(path, patterns, [&count, &last](LineNumber lineNumber, PatternId, std::string_view) {
            if(lineNumber != last)
            {
                ++count;
                last = lineNumber;
            }
        }, options);
        return count;
    }

    // See blockgrep.h
    void grep_stream(istream& input, const string& pattern, ostream& output, bool lineNumbers)
    {
        const PatternSet toFind = PatternSet::compile({pattern});

        scan_stream(input, toFind, [&output, lineNumbers](LineNumber lineNumber, PatternId, std::string_view line) {
            if(lineNumbers)
            {
                output << lineNumber << ':' << line << '\n';
            } else {
                output << line << '\n';
            }
        });
        output.flush();
    }

    // See blockgrep.h
    vector<FileResult> grep_files(const vector<string>& paths, const PatternSet& patterns,
                                  const ScanOptions& options, unsigned threads)
    {
        vector<FileResult> results(paths.size());
        if(paths.empty())
        {
            return results;
        }
        if(threads == 0)
        {
            threads = std::max(1u, std::thread::hardware_concurrency());
        }
        threads = std::min<unsigned>(threads, static_cast<unsigned>(paths.size()));

        std::atomic<std::size_t> next{0};
        auto worker = [&]() {
            for(std::size_t i = next++; i < paths.size(); i = next++)
            {
                FileResult& result = results[i];
                result.path = paths[i];
                NumberedLineCollector collector;
                try
                {
                    result.stats = scan_file(paths[i], patterns, collector.handler(), options);
                }
                catch(const std::exception& e)
                {
                    spdlog::warn("{}: search failed: {}", paths[i], e.what());
                    result.error = std::current_exception();
                }
                result.lines = collector.take();
            }
        };

        spdlog::debug("searching {} file(s) on {} thread(s)", paths.size(), threads);
        vector<std::thread> workers;
        workers.reserve(threads - 1);
        try
        {
            for(unsigned t = 1; t < threads; ++t)
            {
                workers.emplace_back(worker);
            }
        }
        catch(const std::system_error& e)
        {
            // Started workers still hold references into this frame.
            spdlog::error("cannot start search thread: {}", e.what());
            for(auto& thread : workers)
            {
                thread.join();
            }
            throw;
        }
        // The calling thread takes a share of the files too.
        worker();
        for(auto& thread : workers)
        {
            thread.join();
        }
        return results;
    }
}
