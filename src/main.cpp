//
// Created by Andrew Cox on 04/10/2017.
//
#include "blockgrep.h"
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace std;

namespace
{
    void usage(const char* argv0)
    {
        cerr << "usage: " << argv0 << " [-n] [-i] [-F] [-E|-G] [-c] [-v] [-j threads] [-s chunk_bytes] [-L max_line_bytes]"
             << " {-e pattern}... | pattern  file..." << endl;
    }

    void print_line(const string& prefix, bool lineNumbers, blockgrep::LineNumber lineNumber, const string& line)
    {
        cout << prefix;
        if(lineNumbers)
        {
            cout << lineNumber << ':';
        }
        cout << line << '\n';
    }
}

int main(int argc, char* argv[])
{
    using namespace blockgrep;

    // Matches go to stdout, so diagnostics go to stderr. SPDLOG_LEVEL sets the level.
    spdlog::set_default_logger(spdlog::stderr_color_mt("blockgrep"));
    spdlog::cfg::load_env_levels();

    bool lineNumbers = false;
    bool countOnly = false;
    unsigned threads = 0;
    PatternOptions patternOptions;
    ScanOptions scanOptions;
    vector<string> patterns;

    int opt;
    while((opt = getopt(argc, argv, "niFEGcvj:s:L:e:h")) != -1)
    {
        switch(opt)
        {
            case 'n': lineNumbers = true; break;
            case 'i': patternOptions.ignoreCase = true; break;
            case 'F': patternOptions.literal = true; break;
            case 'E': patternOptions.syntax = Syntax::Egrep; break;
            case 'G': patternOptions.syntax = Syntax::Grep; break;
            case 'c': countOnly = true; break;
            case 'v': spdlog::set_level(spdlog::level::debug); break;
            case 'j': threads = static_cast<unsigned>(std::strtoul(optarg, nullptr, 10)); break;
            case 's': scanOptions.chunkSize = std::strtoull(optarg, nullptr, 10); break;
            case 'L': patternOptions.maxLineLength = std::strtoull(optarg, nullptr, 10); break;
            case 'e': patterns.emplace_back(optarg); break;
            default:
                usage(argv[0]);
                return opt == 'h' ? 0 : 2;
        }
    }

    if(patterns.empty())
    {
        if(optind >= argc)
        {
            usage(argv[0]);
            return 2;
        }
        patterns.emplace_back(argv[optind++]);
    }
    const vector<string> files(argv + optind, argv + argc);
    if(files.empty())
    {
        usage(argv[0]);
        return 2;
    }
    if(scanOptions.chunkSize == 0)
    {
        cerr << argv[0] << ": chunk size must be a positive number of bytes" << endl;
        return 2;
    }

    try
    {
        const PatternSet compiled = PatternSet::compile(patterns, patternOptions);
        const bool prefixFiles = files.size() > 1;

        int status = 1;
        for(const FileResult& result : grep_files(files, compiled, scanOptions, threads))
        {
            const string prefix = prefixFiles ? result.path + ":" : string();
            if(countOnly)
            {
                cout << prefix << result.lines.size() << '\n';
            } else {
                for(const auto& line : result.lines)
                {
                    print_line(prefix, lineNumbers, line.first, line.second);
                }
            }
            if(result.error)
            {
                try
                {
                    std::rethrow_exception(result.error);
                }
                catch(const std::exception& e)
                {
                    cerr << argv[0] << ": " << e.what() << endl;
                }
                status = 2;
            } else if(!result.lines.empty() && status != 2) {
                status = 0;
            }
        }
        cout.flush();
        return status;
    }
    catch(const PatternCompileError& e)
    {
        cerr << argv[0] << ": " << e.what() << endl;
        return 2;
    }
}
