#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "sample_collector.hpp"
#include "test_util.hpp"

static Collection collect_lines(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line: lines) {
        text += line;
        text += '\n';
    }
    std::istringstream in(text);
    return collect_samples(in);
}

TEST(SampleCollectorTest, FoldsIdenticalStacks) {
    Collection collection = collect_lines({ "PROFILE;foo;bar", "PROFILE;foo;bar", "PROFILE;baz" });

    SampleTable expected { { "foo;bar", 2 }, { "baz", 1 } };
    EXPECT_EQ(collection.table, expected);
    EXPECT_EQ(total_samples(collection.table), 3u);
    EXPECT_EQ(collection.stats.tagged_lines, 3u);
}

TEST(SampleCollectorTest, IgnoresDebuggerChatter) {
    Collection collection = collect_lines({
        "Attaching to process 1234",
        "[New LWP 1235]",
        "Catchpoint 1 (signal SIGUSR1)",
        "Catchpoint 2 (signal SIGUSR2)",
        "PROFILE;base:GHC.Conc.Sync.forkIO;main:Main.loop",
        "[Inferior 1 (process 1234) detached]",
    });

    SampleTable expected { { "base:GHC.Conc.Sync.forkIO;main:Main.loop", 1 } };
    EXPECT_EQ(collection.table, expected);
}

TEST(SampleCollectorTest, StripsSurroundingWhitespace) {
    Collection collection = collect_lines({ "PROFILE;  a;b  ", "PROFILE;a;b\r", "PROFILE;\ta;b" });

    SampleTable expected { { "a;b", 3 } };
    EXPECT_EQ(collection.table, expected);
}

TEST(SampleCollectorTest, CountsEmptyStacksAndCapabilityErrors) {
    Collection collection = collect_lines({
        "PROFILE;",
        "PROFILE;   ",
        "PROFILE;x",
        "error: Cannot access memory at address 0x42",
        " PROFILE;indented",
        "noise PROFILE;y",
    });

    SampleTable expected { { "x", 1 } };
    EXPECT_EQ(collection.table, expected);
    EXPECT_EQ(collection.stats.tagged_lines, 3u);
    EXPECT_EQ(collection.stats.empty_stacks, 2u);
    EXPECT_EQ(collection.stats.capability_errors, 1u);
}

TEST(SampleCollectorTest, SumEqualsNonEmptyTaggedLines) {
    std::vector<std::string> lines;
    uint64_t expected_total = 0;
    for (int i = 0; i < 200; ++i) {
        if (i % 7 == 0) {
            lines.push_back("PROFILE; ");
        } else if (i % 5 == 0) {
            lines.push_back("Continuing.");
        } else {
            lines.push_back("PROFILE;main;f" + std::to_string(i % 4));
            ++expected_total;
        }
    }

    Collection collection = collect_lines(lines);
    EXPECT_EQ(total_samples(collection.table), expected_total);
    EXPECT_EQ(collection.stats.tagged_lines - collection.stats.empty_stacks, expected_total);
    EXPECT_EQ(collection.table.size(), 4u);
}

TEST(SampleCollectorTest, OrderIndependent) {
    std::vector<std::string> lines { "PROFILE;a", "PROFILE;b;c", "noise", "PROFILE;a", "PROFILE;d" };
    std::sort(lines.begin(), lines.end());

    SampleTable first = collect_lines(lines).table;
    int permutations = 0;
    while (std::next_permutation(lines.begin(), lines.end())) {
        EXPECT_EQ(collect_lines(lines).table, first);
        ++permutations;
    }
    EXPECT_GT(permutations, 0);
}

TEST(SampleCollectorTest, NoSamplesIsNotAnError) {
    std::string path = temp_path("empty.log");
    write_file(path, "Attaching to process 1\n");

    auto collected = collect_samples(path);
    ASSERT_TRUE(collected.isOk());
    EXPECT_TRUE(collected.getOkRef().table.empty());
    EXPECT_EQ(total_samples(collected.getOkRef().table), 0u);

    unlink(path.c_str());
}

TEST(SampleCollectorTest, ReadsSessionFile) {
    std::string path = temp_path("session.log");
    write_file(path, "PROFILE;foo;bar\nPROFILE;baz\nPROFILE;foo;bar\n");

    auto collected = collect_samples(path);
    ASSERT_TRUE(collected.isOk());
    SampleTable expected { { "foo;bar", 2 }, { "baz", 1 } };
    EXPECT_EQ(collected.getOkRef().table, expected);

    unlink(path.c_str());
}

TEST(SampleCollectorTest, MissingSessionFileFails) {
    auto collected = collect_samples(temp_path("never-written.log"));
    EXPECT_FALSE(collected.isOk());
}
