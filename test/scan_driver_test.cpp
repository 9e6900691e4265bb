//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include <gtest/gtest.h>
#include "errors.h"
#include "scan_driver.h"
#include "test_util.h"
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using namespace blockgrep;

namespace
{
    using Delivery = std::tuple<LineNumber, PatternId, std::string>;

    std::vector<Delivery> run_scan(const std::string& text, const std::vector<std::string>& patterns,
                                   std::size_t chunkSize, ScanStats* stats = nullptr)
    {
        const auto compiled = PatternSet::compile(patterns);
        ScanOptions options;
        options.chunkSize = chunkSize;
        ScanDriver driver(compiled, options);

        std::istringstream in(text);
        ChunkReader reader(in);
        std::vector<Delivery> deliveries;
        const auto result = driver.run(reader, [&deliveries](LineNumber n, PatternId p, std::string_view line) {
            deliveries.emplace_back(n, p, std::string(line));
        });
        if(stats)
        {
            *stats = result;
        }
        return deliveries;
    }
}

TEST(ScanDriverTest, DeliversMatchedLinesInOrder) {
    const auto deliveries = run_scan("foobar\nbarfoo\nfood\n", {"bar"}, 1024);
    EXPECT_EQ(deliveries, (std::vector<Delivery>{{1, 0, "foobar"}, {2, 0, "barfoo"}}));
}

TEST(ScanDriverTest, EachPatternOncePerLine) {
    const auto deliveries = run_scan("foobar\nbarfoo\nfood\n", {"bar", "food"}, 1024);
    EXPECT_EQ(deliveries, (std::vector<Delivery>{{1, 0, "foobar"}, {2, 0, "barfoo"}, {3, 1, "food"}}));
}

TEST(ScanDriverTest, RepeatedMatchesOnALineAreDeliveredOnce) {
    ScanStats stats;
    const auto deliveries = run_scan("abababab\nxx\nab\n", {"ab"}, 1024, &stats);
    EXPECT_EQ(deliveries, (std::vector<Delivery>{{1, 0, "abababab"}, {3, 0, "ab"}}));
    EXPECT_EQ(stats.events, 5u);
    EXPECT_EQ(stats.deliveries, 2u);
}

TEST(ScanDriverTest, SeveralPatternsOnOneLineComeInPatternOrder) {
    const auto deliveries = run_scan("zzz yyy\n", {"y+", "z+"}, 1024);
    EXPECT_EQ(deliveries, (std::vector<Delivery>{{1, 0, "zzz yyy"}, {1, 1, "zzz yyy"}}));
}

TEST(ScanDriverTest, EveryLineReportedWhatEverTheChunkSize) {
    const std::string text = blockgrep_test::numbered_lines(137);
    const auto reference = run_scan(text, {"."}, text.size());
    ASSERT_EQ(reference.size(), 137u);

    for(const std::size_t chunkSize : {std::size_t(1), std::size_t(3), std::size_t(16), std::size_t(1024)})
    {
        EXPECT_EQ(run_scan(text, {"."}, chunkSize), reference) << "chunk size " << chunkSize;
    }
    for(std::size_t i = 0; i < reference.size(); ++i)
    {
        EXPECT_EQ(std::get<0>(reference[i]), i + 1);
        EXPECT_EQ(std::get<2>(reference[i]), "line " + std::to_string(i + 1));
    }
}

TEST(ScanDriverTest, NoDuplicatePairsAcrossChunks) {
    const std::string text = blockgrep_test::numbered_lines(300, "x1y2z3 ");
    const auto deliveries = run_scan(text, {"[0-9]", "[a-z]", "x1"}, 16);

    std::set<std::pair<LineNumber, PatternId>> seen;
    for(const auto& d : deliveries)
    {
        EXPECT_TRUE(seen.emplace(std::get<0>(d), std::get<1>(d)).second);
    }
    EXPECT_EQ(deliveries.size(), 900u);
}

TEST(ScanDriverTest, LongLineIsMatchedWhole) {
    const std::string longLine = std::string(3000, 'a') + "needle" + std::string(3000, 'b');
    const auto deliveries = run_scan("short\n" + longLine + "\ntail\n", {"needle"}, 64);
    ASSERT_EQ(deliveries.size(), 1u);
    EXPECT_EQ(std::get<0>(deliveries[0]), 2u);
    EXPECT_EQ(std::get<2>(deliveries[0]), longLine);
}

TEST(ScanDriverTest, FinalLineWithoutTerminator) {
    const auto deliveries = run_scan("one\ntwo\nthree", {"three"}, 5);
    EXPECT_EQ(deliveries, (std::vector<Delivery>{{3, 0, "three"}}));
}

TEST(ScanDriverTest, EmptyInput) {
    ScanStats stats;
    const auto deliveries = run_scan("", {"anything", ""}, 16, &stats);
    EXPECT_TRUE(deliveries.empty());
    EXPECT_EQ(stats.lines, 0u);
    EXPECT_EQ(stats.chunks, 0u);
}

TEST(ScanDriverTest, CrLfLinesHaveTerminatorStripped) {
    const auto deliveries = run_scan("alpha\r\nbeta\r\ngamma\r\n", {"a$"}, 4);
    EXPECT_EQ(deliveries, (std::vector<Delivery>{{1, 0, "alpha"}, {2, 0, "beta"}, {3, 0, "gamma"}}));
}

TEST(ScanDriverTest, StatsDescribeTheScan) {
    ScanStats stats;
    const std::string text = "foobar\nbarfoo\nfood\n";
    run_scan(text, {"bar"}, 7, &stats);
    EXPECT_EQ(stats.bytes, text.size());
    EXPECT_EQ(stats.lines, 3u);
    EXPECT_EQ(stats.chunks, 3u);
    EXPECT_EQ(stats.deliveries, 2u);
    EXPECT_FALSE(stats.cancelled);
}

TEST(ScanDriverTest, StateEndsDone) {
    const auto compiled = PatternSet::compile({"x"});
    ScanDriver driver(compiled);
    EXPECT_EQ(driver.state(), ScanDriver::State::Idle);

    std::istringstream in("x\n");
    ChunkReader reader(in);
    driver.run(reader, [](LineNumber, PatternId, std::string_view) {});
    EXPECT_EQ(driver.state(), ScanDriver::State::Done);
    EXPECT_FALSE(reader.is_open());
    EXPECT_STREQ(to_string(driver.state()), "Done");
}

TEST(ScanDriverTest, CancelFromHandlerStopsAfterCurrentChunk) {
    const std::string text = blockgrep_test::numbered_lines(100);
    const auto compiled = PatternSet::compile({"line"});
    ScanOptions options;
    // "line 1\n" .. "line 9\n" are 7 bytes; each chunk of 14 holds two lines.
    options.chunkSize = 14;
    ScanDriver driver(compiled, options);

    std::istringstream in(text);
    ChunkReader reader(in);
    std::vector<LineNumber> delivered;
    const auto stats = driver.run(reader, [&](LineNumber n, PatternId, std::string_view) {
        delivered.push_back(n);
        if(n == 3)
        {
            driver.cancel();
        }
    });

    EXPECT_TRUE(stats.cancelled);
    EXPECT_EQ(delivered, (std::vector<LineNumber>{1, 2, 3, 4}));
    EXPECT_FALSE(reader.is_open());
    EXPECT_EQ(driver.state(), ScanDriver::State::Done);
}

TEST(ScanDriverTest, HandlerExceptionPropagatesUnchanged) {
    const auto compiled = PatternSet::compile({"o"});
    ScanDriver driver(compiled);
    std::istringstream in("one\ntwo\nthree\nfour\n");
    ChunkReader reader(in);

    std::vector<LineNumber> delivered;
    EXPECT_THROW(driver.run(reader, [&delivered](LineNumber n, PatternId, std::string_view) {
        delivered.push_back(n);
        if(n == 2)
        {
            throw std::logic_error("handler gave up");
        }
    }), std::logic_error);

    EXPECT_EQ(delivered, (std::vector<LineNumber>{1, 2}));
    EXPECT_EQ(driver.state(), ScanDriver::State::Error);
    EXPECT_FALSE(reader.is_open());
}

TEST(ScanDriverTest, DriverCanBeReused) {
    const auto compiled = PatternSet::compile({"b"});
    ScanDriver driver(compiled);

    for(int pass = 0; pass < 2; ++pass)
    {
        std::istringstream in("a\nb\n");
        ChunkReader reader(in);
        std::vector<LineNumber> delivered;
        driver.run(reader, [&delivered](LineNumber n, PatternId, std::string_view) {
            delivered.push_back(n);
        });
        EXPECT_EQ(delivered, (std::vector<LineNumber>{2}));
    }
}

TEST(ScanDriverTest, ZeroChunkSizeIsRejected) {
    const auto compiled = PatternSet::compile({"x"});
    ScanOptions options;
    options.chunkSize = 0;
    EXPECT_THROW({ ScanDriver driver(compiled, options); }, std::invalid_argument);
}

TEST(ScanDriverTest, ReadErrorKeepsEarlierDeliveries) {
    const auto compiled = PatternSet::compile({"o"});
    ScanOptions options;
    options.chunkSize = 8;
    ScanDriver driver(compiled, options);

    blockgrep_test::FailingBuf buf("one\ntwo\n");
    std::istream in(&buf);
    ChunkReader reader(in, "failing");
    std::vector<LineNumber> delivered;
    EXPECT_THROW(driver.run(reader, [&delivered](LineNumber n, PatternId, std::string_view) {
        delivered.push_back(n);
    }), ReadError);

    EXPECT_EQ(delivered, (std::vector<LineNumber>{1, 2}));
    EXPECT_EQ(driver.state(), ScanDriver::State::Error);
    EXPECT_FALSE(reader.is_open());
}

TEST(ScanDriverTest, EngineErrorKeepsEarlierDeliveries) {
    PatternOptions patternOptions;
    patternOptions.maxLineLength = 32;
    const auto compiled = PatternSet::compile({"x", "(a|b)*c"}, patternOptions);
    ScanOptions options;
    options.chunkSize = 4;
    ScanDriver driver(compiled, options);

    std::istringstream in("x1\nac\n" + std::string(100, 'a') + "c\nx4\n");
    ChunkReader reader(in);
    std::vector<std::pair<LineNumber, PatternId>> delivered;
    try
    {
        driver.run(reader, [&delivered](LineNumber n, PatternId p, std::string_view) {
            delivered.emplace_back(n, p);
        });
        FAIL() << "expected ScanEngineError";
    }
    catch(const ScanEngineError& e)
    {
        EXPECT_EQ(e.patternId(), 0u);
    }

    EXPECT_EQ(delivered, (std::vector<std::pair<LineNumber, PatternId>>{{1, 0}, {2, 1}}));
    EXPECT_EQ(driver.state(), ScanDriver::State::Error);
    EXPECT_FALSE(reader.is_open());
}
