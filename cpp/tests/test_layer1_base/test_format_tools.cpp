/**
 * @file test_format_tools.cpp
 * @brief Layer 1 tests for format_tools helpers.
 */
#include "smx_base.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

using namespace shmmutex::format_tools;
using ::testing::MatchesRegex;

TEST(FormatToolsTest, FormattedTime_HasMicrosecondPrecision)
{
    const std::string s = formatted_time(std::chrono::system_clock::now());
    EXPECT_THAT(s, MatchesRegex(R"(^[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{6}$)"));
}

TEST(FormatToolsTest, BytesToHex_LowercaseTwoDigitsPerByte)
{
    const std::uint8_t data[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(bytes_to_hex(data, sizeof(data)), "000fa0ff");
    EXPECT_EQ(bytes_to_hex(nullptr, 4), "");
    EXPECT_EQ(bytes_to_hex(data, 0), "");
}

TEST(FormatToolsTest, TrimWhitespace)
{
    EXPECT_EQ(trim_whitespace("  info\t\n"), "info");
    EXPECT_EQ(trim_whitespace("debug"), "debug");
    EXPECT_EQ(trim_whitespace(" \t "), "");
    EXPECT_EQ(trim_whitespace(""), "");
}

TEST(FormatToolsTest, FilenameOnly_StripsBothSeparators)
{
    static_assert(filename_only("a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("C:\\src\\lock.cpp"), "lock.cpp");
    EXPECT_EQ(filename_only("mixed/dir\\file.h"), "file.h");
    EXPECT_EQ(filename_only("plain.cpp"), "plain.cpp");
}

TEST(FormatToolsTest, MakeBuffer_FormatsIntoMemoryBuffer)
{
    auto mb = make_buffer("lock '{}' after {} attempt(s)", "bus", 3);
    EXPECT_EQ(fmt::to_string(mb), "lock 'bus' after 3 attempt(s)");

    auto rt = make_buffer_rt("{}-{}", 1, 2);
    EXPECT_EQ(fmt::to_string(rt), "1-2");
}
