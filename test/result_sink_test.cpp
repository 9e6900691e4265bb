//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include <gtest/gtest.h>
#include "result_sink.h"
#include <string>
#include <vector>

using namespace blockgrep;

TEST(ResultSinkTest, NumberedCollectorKeepsOneEntryPerLine) {
    NumberedLineCollector collector;
    auto handler = collector.handler();
    handler(1, 0, "foobar");
    handler(1, 1, "foobar");
    handler(4, 0, "barbar");

    EXPECT_EQ(collector.results(), (std::vector<NumberedLine>{{1, "foobar"}, {4, "barbar"}}));
}

TEST(ResultSinkTest, LineCollectorDropsNumbers) {
    LineCollector collector;
    collector(2, 0, "a");
    collector(2, 3, "a");
    collector(3, 0, "b");

    const auto lines = collector.take();
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b"}));
}

TEST(ResultSinkTest, CollectorsCopyText) {
    LineCollector collector;
    {
        std::string transient = "short lived";
        collector(1, 0, transient);
        transient.assign("overwritten");
    }
    EXPECT_EQ(collector.results().front(), "short lived");
}
