#include <gtest/gtest.h>

#include "GatewayLog.h"

TEST(GatewayLogTest, LinesAreTimestampedAndCapped) {
    ClearLogs();
    for (size_t i = 0; i < g_log_max_lines + 10; ++i) {
        AddLog("entry " + std::to_string(i));
    }

    std::vector<std::string> lines;
    GetLogs(lines);
    ASSERT_EQ(lines.size(), g_log_max_lines);
    EXPECT_EQ(lines.back().substr(0, 1), "[");
    EXPECT_NE(lines.back().find("] entry " + std::to_string(g_log_max_lines + 9)), std::string::npos);
}

TEST(GatewayLogTest, SequenceAdvancesOnceLogIsFull) {
    for (size_t i = 0; i < g_log_max_lines; ++i) {
        AddLog("fill " + std::to_string(i));
    }
    std::vector<std::string> before;
    const uint64_t sequence_before = GetLogs(before);
    ASSERT_EQ(before.size(), g_log_max_lines);

    AddLog("newest");
    std::vector<std::string> after;
    const uint64_t sequence_after = GetLogs(after);

    EXPECT_EQ(after.size(), before.size());
    EXPECT_EQ(sequence_after, sequence_before + 1);
    EXPECT_NE(after.back().find("newest"), std::string::npos);
}
