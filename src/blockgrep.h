//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//

#ifndef BLOCKGREP_BLOCKGREP_H
#define BLOCKGREP_BLOCKGREP_H

#include "errors.h"
#include "pattern_set.h"
#include "result_sink.h"
#include "scan_driver.h"
#include "types.h"
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace blockgrep {

    /**
     * Lines of a file matching any of the patterns, in file order, each once.
     *
     * @param path File to search.
     * @param patterns Non-empty list of patterns; any one matching selects the line.
     * @throws PatternCompileError before the file is opened.
     * @throws ReadError if the file cannot be opened or read.
     */
    std::vector<std::string> grep(const std::string& path,
                                  const std::vector<std::string>& patterns,
                                  const PatternOptions& patternOptions = {},
                                  const ScanOptions& scanOptions = {});

    /**
     * As grep(), but each line comes with its 1-based line number.
     */
    std::vector<NumberedLine> grep_numbered(const std::string& path,
                                            const std::vector<std::string>& patterns,
                                            const PatternOptions& patternOptions = {},
                                            const ScanOptions& scanOptions = {});

    /**
     * Stream every (line, pattern) match of a file to a handler.
     */
    ScanStats scan_file(const std::string& path,
                        const PatternSet& patterns,
                        const MatchHandler& handler,
                        const ScanOptions& options = {});

    /**
     * Stream every (line, pattern) match of an open stream to a handler.
     * The stream is read to its end but not closed.
     */
    ScanStats scan_stream(std::istream& input,
                          const PatternSet& patterns,
                          const MatchHandler& handler,
                          const ScanOptions& options = {});

    /**
     * Number of lines in the file matching at least one pattern.
     */
    std::uint64_t count_matches(const std::string& path,
                                const PatternSet& patterns,
                                const ScanOptions& options = {});

    /**
     * Grep for an expression on a single stream and output results on an outstream
     * provided.
     *
     * @param input A stream to scan line by line for regex matches.
     * @param pattern The regex to scan for.
     * @param output A stream to output matching lines to.
     * @param lineNumbers If true, matching lines are prefixed with their line
     * numbers, else they are ouput exactly as read.
     */
    void grep_stream(std::istream& input, const std::string& pattern, std::ostream& output, bool lineNumbers = true);

    struct FileResult
    {
        std::string path;
        std::vector<NumberedLine> lines;
        ScanStats stats;
        /// Set if this file's scan failed; lines holds what was delivered first.
        std::exception_ptr error;
    };

    /**
     * Search several files at once, one scan per file on a pool of threads,
     * all sharing the same compiled patterns.
     *
     * @param threads Worker count; 0 picks std::thread::hardware_concurrency().
     * @return One result per path, in the order given. A failure in one file
     * is recorded in its result and does not stop the others.
     */
    std::vector<FileResult> grep_files(const std::vector<std::string>& paths,
                                       const PatternSet& patterns,
                                       const ScanOptions& options = {},
                                       unsigned threads = 0);
}

#endif //BLOCKGREP_BLOCKGREP_H
