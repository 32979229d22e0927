/******************************************************************************
 * aggregator_test.cpp
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#include <algorithm>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "algorithms/aggregation/algorithms.h"
#include "algorithms/aggregation/batch_aggregator.h"
#include "algorithms/aggregation/streaming_aggregator.h"
#include "data_structure/best_result.h"
#include "gtest/gtest.h"
#include "io/record_io.h"
#include "tlx/logger.hpp"

namespace {

const char* example =
    "Epic|Availity|123|197\n"
    "Availity|Optum|123|197\n"
    "Optum|Epic|123|197\n"
    "Epic|Availity|891|45\n"
    "Availity|Epic|891|45\n";

std::string run(cycle_aggregator* aggregator, const std::string& input) {
    std::istringstream in(input);
    return aggregator->aggregate(in).toString();
}

std::string run_batch(const std::string& input) {
    batch_aggregator batch(0);
    return run(&batch, input);
}

std::string run_streaming(const std::string& input) {
    streaming_aggregator streaming(0);
    return run(&streaming, input);
}

group_key key_of(const std::string& line) {
    edge_record record;
    record_io::parseRecord(line, &record);
    return record.key;
}

std::string join(const std::vector<std::string>& lines) {
    std::string out;
    for (const std::string& line : lines) {
        out += line + "\n";
    }
    return out;
}

// random small groups, each with a handful of nodes named after claim
std::vector<std::string> random_records(std::mt19937* eng, size_t groups) {
    std::uniform_int_distribution<size_t> num_nodes(1, 6);
    std::uniform_int_distribution<size_t> num_edges(0, 10);
    std::uniform_int_distribution<size_t> status(0, 2);
    std::vector<std::string> lines;

    for (size_t g = 0; g < groups; ++g) {
        std::string claim = "c" + std::to_string(g / 3);
        std::string code = std::to_string(status(*eng));
        size_t n = num_nodes(*eng);
        size_t m = num_edges(*eng);
        std::uniform_int_distribution<size_t> node(0, n - 1);
        for (size_t e = 0; e < m; ++e) {
            lines.push_back("N" + std::to_string(node(*eng)) + "|N"
                            + std::to_string(node(*eng)) + "|" + claim
                            + "|" + code);
        }
    }
    return lines;
}

}  // namespace

TEST(BatchAggregatorTest, Example) {
    ASSERT_EQ(run_batch(example), "123,197,3");
}

TEST(BatchAggregatorTest, EmptyInput) {
    ASSERT_EQ(run_batch(""), "0,0,0");
    ASSERT_EQ(run_batch("\n\n\n"), "0,0,0");
}

TEST(BatchAggregatorTest, NoCycle) {
    ASSERT_EQ(run_batch("A|B|1|2\n"), "0,0,0");
    ASSERT_EQ(run_batch("A|B|1|2\nB|C|1|2\nA|C|1|2\n"), "0,0,0");
}

TEST(BatchAggregatorTest, SelfLoop) {
    ASSERT_EQ(run_batch("A|A|1|2\n"), "1,2,1");
}

TEST(BatchAggregatorTest, TwoCycle) {
    ASSERT_EQ(run_batch("A|B|99|88\nB|A|99|88\n"), "99,88,2");
}

TEST(BatchAggregatorTest, TieTakesSmallestKey) {
    ASSERT_EQ(run_batch("X|Y|b|1\nY|X|b|1\nX|Y|a|1\nY|X|a|1\n"), "a,1,2");
    ASSERT_EQ(run_batch("X|Y|a|2\nY|X|a|2\nX|Y|a|1\nY|X|a|1\n"), "a,1,2");
}

TEST(BatchAggregatorTest, LongestWins) {
    ASSERT_EQ(run_batch("A|B|g1|s1\nB|A|g1|s1\n"
                        "P|Q|g2|s2\nQ|R|g2|s2\nR|P|g2|s2\n"),
              "g2,s2,3");
}

TEST(BatchAggregatorTest, UnsortedGroupsAreMerged) {
    ASSERT_EQ(run_batch("A|B|1|2\nX|Y|3|4\nB|C|1|2\nY|X|3|4\nC|A|1|2\n"),
              "1,2,3");
}

TEST(BatchAggregatorTest, NodeNamesSharedAcrossGroups) {
    // the same names in different groups must not connect
    ASSERT_EQ(run_batch("A|B|1|1\nB|C|2|2\nC|A|3|3\n"), "0,0,0");
}

TEST(BatchAggregatorTest, MalformedLinesIgnored) {
    ASSERT_EQ(run_batch("A|B|1|2\nbad\nC|D|1|2\nD|C|1|2\n"), "1,2,2");
    ASSERT_EQ(run_batch("\n\nA|B|1|2\n\nB|A|1|2\n\n"), "1,2,2");
}

TEST(BatchAggregatorTest, Statistics) {
    batch_aggregator batch(0);
    std::istringstream in(std::string(example) + "bad\n\n");
    batch.aggregate(in);
    ASSERT_EQ(batch.stats().records, 5);
    ASSERT_EQ(batch.stats().malformed_lines, 1);
    ASSERT_EQ(batch.stats().empty_lines, 1);
    ASSERT_EQ(batch.number_of_groups(), 2);
}

TEST(StreamingAggregatorTest, Example) {
    ASSERT_EQ(run_streaming("Epic|Availity|123|197\n"
                            "Availity|Optum|123|197\n"
                            "Optum|Epic|123|197\n"
                            "Availity|Epic|891|45\n"
                            "Epic|Availity|891|45\n"),
              "123,197,3");
}

TEST(StreamingAggregatorTest, EmptyInput) {
    ASSERT_EQ(run_streaming(""), "0,0,0");
    ASSERT_EQ(run_streaming("\n"), "0,0,0");
}

TEST(StreamingAggregatorTest, LastGroupIsSearched) {
    ASSERT_EQ(run_streaming("A|B|1|2\nB|A|1|2\n"), "1,2,2");
    ASSERT_EQ(run_streaming("A|B|1|1\nA|B|1|2\nB|C|1|2\nC|A|1|2\n"),
              "1,2,3");
}

TEST(StreamingAggregatorTest, SingleRecordGroups) {
    ASSERT_EQ(run_streaming("A|A|1|1\nA|B|1|2\nB|B|1|3\n"), "1,1,1");
}

TEST(StreamingAggregatorTest, TieTakesSmallestKey) {
    ASSERT_EQ(run_streaming("X|Y|a|1\nY|X|a|1\nX|Y|b|1\nY|X|b|1\n"),
              "a,1,2");
}

TEST(StreamingAggregatorTest, DuplicateEdges) {
    ASSERT_EQ(run_streaming("A|B|1|2\nB|A|1|2\nA|B|1|2\nA|B|1|2\n"),
              "1,2,2");
}

TEST(StreamingAggregatorTest, MalformedLinesDoNotSplitGroups) {
    ASSERT_EQ(run_streaming("A|B|1|2\nbad\n\nB|C|1|2\nx|y\nC|A|1|2\n"),
              "1,2,3");
}

TEST(StreamingAggregatorTest, UnsortedInputSplitsGroups) {
    // sortedness is not checked, the 3-cycle of group 1,2 is torn apart
    std::string input = "A|B|1|2\nB|C|1|2\nX|Y|3|4\nY|X|3|4\nC|A|1|2\n";
    ASSERT_EQ(run_streaming(input), "3,4,2");
    ASSERT_EQ(run_batch(input), "1,2,3");
}

TEST(StreamingAggregatorTest, SmallGroupsArePruned) {
    // after the 4-cycle is found, groups with less than 4 edges are skipped
    streaming_aggregator streaming(0);
    std::string input = "A|B|a|0\nB|C|a|0\nC|D|a|0\nD|A|a|0\n";
    for (size_t i = 0; i < 50; ++i) {
        input += "A|B|b" + std::to_string(i) + "|0\nB|A|b"
                 + std::to_string(i) + "|0\n";
    }
    std::istringstream in(input);
    best_result best = streaming.aggregate(in);
    ASSERT_EQ(best.toString(), "a,0,4");
    ASSERT_EQ(streaming.number_of_groups(), 51);
    ASSERT_EQ(streaming.number_of_searches(), 1);
}

TEST(StreamingAggregatorTest, Statistics) {
    streaming_aggregator streaming(0);
    std::istringstream in("A|B|1|2\nB|A|1|2\nbad\nA|B|1|3\nA|B|2|3\n");
    streaming.aggregate(in);
    ASSERT_EQ(streaming.stats().records, 4);
    ASSERT_EQ(streaming.stats().malformed_lines, 1);
    ASSERT_EQ(streaming.number_of_groups(), 3);
}

TEST(StreamingAggregatorTest, ReusableAfterScan) {
    streaming_aggregator streaming(0);
    ASSERT_EQ(run(&streaming, example), "123,197,3");
    ASSERT_EQ(run(&streaming, "A|B|1|2\nB|A|1|2\n"), "1,2,2");
    ASSERT_EQ(run(&streaming, ""), "0,0,0");
}

TEST(AggregatorTest, BatchEqualsStreamingOnSortedInput) {
    std::mt19937 eng(4711);

    for (size_t round = 0; round < 25; ++round) {
        std::vector<std::string> lines = random_records(&eng, 40);
        std::shuffle(lines.begin(), lines.end(), eng);
        std::string batch_result = run_batch(join(lines));

        std::stable_sort(lines.begin(), lines.end(),
                         [](const std::string& a, const std::string& b) {
                             return key_of(a) < key_of(b);
                         });
        ASSERT_EQ(run_streaming(join(lines)), batch_result);
    }
}

TEST(AggregatorTest, BadLinesDoNotChangeResult) {
    std::mt19937 eng(815);
    std::vector<std::string> noise = { "", "garbage", "a|b|c", "a|b|c|d|e" };
    std::uniform_int_distribution<size_t> pick(0, noise.size() - 1);

    for (size_t round = 0; round < 10; ++round) {
        std::vector<std::string> lines = random_records(&eng, 30);
        std::string clean = join(lines);

        std::vector<std::string> noisy;
        for (const std::string& line : lines) {
            noisy.push_back(noise[pick(eng)]);
            noisy.push_back(line);
        }
        ASSERT_EQ(run_batch(join(noisy)), run_batch(clean));
    }
}

TEST(AggregatorTest, SelectAggregator) {
    std::unique_ptr<cycle_aggregator> sorted = selectAggregator(true, 0);
    std::unique_ptr<cycle_aggregator> unsorted = selectAggregator(false, 0);
    ASSERT_EQ(sorted->name(), "streaming");
    ASSERT_EQ(unsorted->name(), "batch");
    ASSERT_EQ(run(sorted.get(), "A|B|1|2\nB|A|1|2\n"), "1,2,2");
    ASSERT_EQ(run(unsorted.get(), "A|B|1|2\nB|A|1|2\n"), "1,2,2");
}

TEST(AggregatorTest, ProgressNotices) {
    std::string input;
    for (size_t i = 0; i < 5; ++i) {
        input += "A|B|" + std::to_string(i) + "|0\n";
    }

    {
        tlx::LoggerCollectOutput log;
        batch_aggregator batch(2);
        run(&batch, input);
        std::string out = log.get();
        ASSERT_NE(out.find("Progress: 2/5 groups"), std::string::npos);
        ASSERT_NE(out.find("Progress: 4/5 groups"), std::string::npos);
        ASSERT_EQ(out.find("Progress: 5/5 groups"), std::string::npos);
    }

    {
        tlx::LoggerCollectOutput log;
        streaming_aggregator streaming(2);
        run(&streaming, input);
        std::string out = log.get();
        ASSERT_NE(out.find("Progress: 2 groups"), std::string::npos);
        ASSERT_NE(out.find("Progress: 4 groups"), std::string::npos);
        ASSERT_EQ(out.find("Progress: 3 groups"), std::string::npos);
    }

    {
        tlx::LoggerCollectOutput log;
        batch_aggregator quiet(0);
        run(&quiet, input);
        ASSERT_EQ(log.get().find("Progress"), std::string::npos);
    }
}
