//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include "pattern_set.h"
#include "errors.h"
#include "regex_functions.h"
#include <spdlog/spdlog.h>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace blockgrep
{
    using std::regex;
    using std::string;
    using std::string_view;
    using std::vector;

    namespace
    {
        regex::flag_type flags_for(const PatternOptions& options)
        {
            regex::flag_type flags = regex::ECMAScript;
            if(!options.literal)
            {
                switch(options.syntax)
                {
                    case Syntax::ECMAScript: flags = regex::ECMAScript; break;
                    case Syntax::Basic:      flags = regex::basic;      break;
                    case Syntax::Extended:   flags = regex::extended;   break;
                    case Syntax::Awk:        flags = regex::awk;        break;
                    case Syntax::Grep:       flags = regex::grep;       break;
                    case Syntax::Egrep:      flags = regex::egrep;      break;
                }
            }
            if(options.ignoreCase)
            {
                flags |= regex::icase;
            }
            return flags | regex::optimize;
        }
    }

    PatternSet::PatternSet(vector<string> patterns, vector<regex> regexes, const PatternOptions& options) :
        patterns_(std::move(patterns)),
        regexes_(std::move(regexes)),
        options_(options)
    {}

    // See pattern_set.h
    PatternSet PatternSet::compile(const vector<string>& patterns, const PatternOptions& options)
    {
        if(patterns.empty())
        {
            throw std::invalid_argument("at least one pattern is required");
        }
        const auto flags = flags_for(options);

        vector<regex> regexes;
        regexes.reserve(patterns.size());
        for(std::size_t i = 0; i < patterns.size(); ++i)
        {
            const string& source = options.literal ? escape_literal(patterns[i]) : patterns[i];
            try
            {
                regexes.emplace_back(source, flags);
            }
            catch(const std::regex_error& e)
            {
                spdlog::error("pattern #{} \"{}\" rejected: {}", i, patterns[i], e.what());
                throw PatternCompileError(i, patterns[i], e.what());
            }
        }
        spdlog::debug("compiled {} pattern(s)", regexes.size());
        return PatternSet(patterns, std::move(regexes), options);
    }

    // See pattern_set.h
    void PatternSet::scan(string_view buffer, vector<MatchEvent>& events) const
    {
        const char* const data = buffer.data();
        const std::size_t size = buffer.size();
        std::size_t start = 0;
        while(start < size)
        {
            const void* hit = std::memchr(data + start, '\n', size - start);
            const std::size_t newline = hit ? static_cast<const char*>(hit) - data : size;
            std::size_t end = newline;
            if(hit && end > start && data[end - 1] == '\r')
            {
                --end;
            }

            if(options_.maxLineLength && end - start > options_.maxLineLength)
            {
                throw ScanEngineError(0, "line of " + std::to_string(end - start) + " bytes exceeds the " +
                                         std::to_string(options_.maxLineLength) + " byte line limit");
            }

            for(PatternId id = 0; id < regexes_.size(); ++id)
            {
                try
                {
                    search_all(data + start, data + end, regexes_[id],
                               [&events, id, start](std::size_t from, std::size_t to) {
                                   events.push_back({id, start + to, start + from});
                               });
                }
                catch(const std::regex_error& e)
                {
                    throw ScanEngineError(id, e.what());
                }
            }
            start = newline + 1;
        }
    }
}
