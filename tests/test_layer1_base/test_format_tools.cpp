/**
 * @file test_format_tools.cpp
 * @brief Tests for the formatting helpers in utils/format_tools.hpp.
 */
#include "locklab_base.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <chrono>
#include <regex>

using namespace locklab::format_tools;

TEST(FormatToolsTest, FilenameOnly_StripsDirectories)
{
    static_assert(filename_only("/a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("src/locks/mcs_lock.cpp"), "mcs_lock.cpp");
    EXPECT_EQ(filename_only("C:\\dir\\file.hpp"), "file.hpp");
    EXPECT_EQ(filename_only("mixed/dir\\file.h"), "file.h");
    EXPECT_EQ(filename_only("plain.cpp"), "plain.cpp");
    EXPECT_EQ(filename_only("trailing/"), "");
}

TEST(FormatToolsTest, FormattedTime_HasMicrosecondPrecision)
{
    const std::string text = formatted_time(std::chrono::system_clock::now());
    const std::regex pattern(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6}$)");
    EXPECT_TRUE(std::regex_match(text, pattern)) << text;
}

TEST(FormatToolsTest, FormattedTime_KeepsSubSecondPart)
{
    using namespace std::chrono;
    const auto base = time_point_cast<seconds>(system_clock::now());
    const std::string text = formatted_time(base + microseconds(42));
    EXPECT_EQ(text.substr(text.size() - 7), ".000042");
}

TEST(FormatToolsTest, ExtractValue_FindsKeysAndTrimsWhitespace)
{
    const std::string_view config = " level = debug ;file=/tmp/x.log;  empty= ";
    EXPECT_EQ(extract_value_from_string("level", config), "debug");
    EXPECT_EQ(extract_value_from_string("file", config), "/tmp/x.log");
    EXPECT_EQ(extract_value_from_string("empty", config), "");
    EXPECT_FALSE(extract_value_from_string("missing", config).has_value());
}

TEST(FormatToolsTest, ExtractValue_CustomSeparators)
{
    EXPECT_EQ(extract_value_from_string("b", "a:1,b:2", ',', ':'), "2");
    EXPECT_FALSE(extract_value_from_string("a", "", ',', ':').has_value());
}

TEST(FormatToolsTest, MakeBuffer_FormatsIntoMemoryBuffer)
{
    auto mb = make_buffer("{}-{:03d}", "slot", 7);
    EXPECT_EQ(fmt::to_string(mb), "slot-007");
}
