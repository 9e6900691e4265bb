//
// Copyright Andrew Cox 2017
// All rights reserved worldwide
//
#include "blockgrep.h"
#include <benchmark/benchmark.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

namespace benchmark_helpers
{
    std::string RandomString(unsigned len, std::default_random_engine& generator) {
        std::uniform_int_distribution<int> capitals('A', 'Z');
        std::uniform_int_distribution<int> lower('a', 'z');
        std::uniform_int_distribution<int> numbers('0', '9');
        std::uniform_int_distribution<int> choose(0, 2);

        std::string s;
        s.reserve(len);
        for (unsigned i = 0; i < len; ++i) {
            const auto choice = choose(generator);
            s.push_back(static_cast<char>(choice == 0 ? capitals(generator) : choice == 1 ? lower(generator) : numbers(generator)));
        }
        return s;
    }

    /**
     * Make a text file which can be read in and grepped over by benchmarks.
     */
    static std::string CreateTempFile(const std::vector<std::string>& prefixes, unsigned minLen, unsigned maxLen, unsigned numLines, const std::string& filename)
    {
        using namespace std;
        const auto fullPath = (std::filesystem::temp_directory_path() / filename).string();
        ofstream file(fullPath, ios_base::trunc);

        std::default_random_engine gen;
        std::uniform_int_distribution<unsigned> prefixSelect(0, prefixes.size() - 1);
        std::uniform_int_distribution<unsigned> lenSelect(minLen, maxLen);

        for(unsigned i = 0; i < numLines; ++i)
        {
            file << prefixes[prefixSelect(gen)] << RandomString(lenSelect(gen), gen) << '\n';
        }

        file.close();
        return fullPath;
    }

    static const std::vector<std::string> kPrefixes {
            "[DEBUG]: ",
            "[WARNING]: ",
            "[INFO]: ",
            "[ERROR]: "
    };

    // Find errors that start and end with digits (the rest of the pattern is just to increase complexity):
    static const std::string kErrorPattern {"^\\[ERROR\\] *: *[[:digit:]]+.*[a-z]+.*[A-Z]+.*[[:digit:]]$"};
}

namespace benchmarks
{
    using namespace benchmark_helpers;

    static void BM_PatternSetCompile(benchmark::State &state) {
        std::vector<std::string> patterns;
        for (int i = 0; i < state.range(0); ++i) {
            patterns.push_back(kErrorPattern);
        }
        for (auto _ : state) {
            auto compiled = blockgrep::PatternSet::compile(patterns);
            benchmark::DoNotOptimize(compiled);
        }
    }
    // Arg is the number of patterns in the set:
    BENCHMARK(BM_PatternSetCompile)->Arg(1)->Arg(4)->Arg(16);

    // Scan one file with a range of chunk sizes, all lines delivered to a counting handler:
    static void BM_ScanChunkSize(benchmark::State &state) {
        const std::string fullPath = CreateTempFile(kPrefixes, 10, 120, 20000, "BM_ScanChunkSize_input.log");
        const auto patterns = blockgrep::PatternSet::compile({kErrorPattern});
        blockgrep::ScanOptions options;
        options.chunkSize = static_cast<std::size_t>(state.range(0));

        std::uint64_t delivered = 0;
        for (auto _ : state) {
            const auto stats = blockgrep::scan_file(fullPath, patterns, [&delivered](blockgrep::LineNumber, blockgrep::PatternId, std::string_view) {
                ++delivered;
            }, options);
            state.SetBytesProcessed(state.bytes_processed() + static_cast<int64_t>(stats.bytes));
        }
        benchmark::DoNotOptimize(delivered);
    }
    // Arg is the chunk size in bytes:
    BENCHMARK(BM_ScanChunkSize)->Unit(benchmark::kMillisecond)->Arg(64)->Arg(4096)->Arg(1 << 16)->Arg(1 << 20);

    static void BM_ScanPatternCount(benchmark::State &state) {
        const std::string fullPath = CreateTempFile(kPrefixes, 10, 120, 5000, "BM_ScanPatternCount_input.log");
        std::vector<std::string> patterns;
        for (int i = 0; i < state.range(0); ++i) {
            patterns.push_back("[qz]" + std::to_string(i));
        }
        const auto compiled = blockgrep::PatternSet::compile(patterns);

        for (auto _ : state) {
            benchmark::DoNotOptimize(blockgrep::count_matches(fullPath, compiled));
        }
    }
    BENCHMARK(BM_ScanPatternCount)->Unit(benchmark::kMillisecond)->Arg(1)->Arg(4)->Arg(16);

    // Benchmark of simple grep over a file, writing to a second file:
    static void BM_RegexGrep(benchmark::State &state) {
        using namespace std;

        const auto numLines = state.range(0);
        const string fullPath = CreateTempFile(kPrefixes, 10, 120, numLines, "BM_RegexGrep_input.log");
        const string outPath = (std::filesystem::temp_directory_path() / "blockgrep_benchmark_out.log").string();

        for (auto _ : state)
        {
            ifstream in(fullPath);
            ofstream out(outPath, ios_base::trunc);
            blockgrep::grep_stream(in, kErrorPattern, out, true);
            in.close();
            out.close();
        }
    }
    BENCHMARK(BM_RegexGrep)->Unit(benchmark::kMillisecond)->Repetitions(3)->ReportAggregatesOnly(true)->Arg(100)->Arg(1000)->Arg(2000)->Arg(3000)->ComputeStatistics("max", [](const std::vector<double>& v) -> double {
        return *(std::max_element(std::begin(v), std::end(v)));
    })->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });

    // Many files searched in parallel; arg is the worker count:
    static void BM_GrepFiles(benchmark::State &state) {
        std::vector<std::string> paths;
        for (int i = 0; i < 8; ++i) {
            paths.push_back(CreateTempFile(kPrefixes, 10, 120, 5000, "BM_GrepFiles_" + std::to_string(i) + ".log"));
        }
        const auto compiled = blockgrep::PatternSet::compile({kErrorPattern});

        for (auto _ : state) {
            auto results = blockgrep::grep_files(paths, compiled, {}, static_cast<unsigned>(state.range(0)));
            benchmark::DoNotOptimize(results);
        }
    }
    BENCHMARK(BM_GrepFiles)->Unit(benchmark::kMillisecond)->UseRealTime()->Arg(1)->Arg(2)->Arg(4);
}

BENCHMARK_MAIN();
