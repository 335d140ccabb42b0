// tests/test_layer1_base/test_format_tools.cpp
#include "fed_base.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace federator::format_tools;

class FormatToolsTest : public federator::tests::PureApiTest
{
};

TEST_F(FormatToolsTest, TrimStripsAsciiWhitespace)
{
    EXPECT_EQ(trim("  nationality \t"), "nationality");
    EXPECT_EQ(trim(" \n "), "");
    EXPECT_EQ(trim("GBR"), "GBR");
}

TEST_F(FormatToolsTest, ToUpperAndIequals)
{
    EXPECT_EQ(to_upper("gbr-fra_1"), "GBR-FRA_1");
    EXPECT_TRUE(iequals("Security-Label", "security-label"));
    EXPECT_FALSE(iequals("Security-Label", "Security-Labels"));
}

TEST_F(FormatToolsTest, FilenameOnlyHandlesBothSeparators)
{
    static_assert(filename_only("/src/transfer/chunk_streamer.cpp") == "chunk_streamer.cpp");
    EXPECT_EQ(filename_only("C:\\src\\main.cpp"), "main.cpp");
    EXPECT_EQ(filename_only("plain.cpp"), "plain.cpp");
}

TEST_F(FormatToolsTest, FormattedTimeHasMicroseconds)
{
    const std::string s = formatted_time(std::chrono::system_clock::now());
    // "YYYY-MM-DD HH:MM:SS.uuuuuu"
    ASSERT_EQ(s.size(), 26u);
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[10], ' ');
    EXPECT_EQ(s[19], '.');
}

TEST_F(FormatToolsTest, MakeBufferFormats)
{
    auto mb = make_buffer("seq {} chunk {}/{}", 12, 1, 3);
    EXPECT_EQ(std::string(mb.data(), mb.size()), "seq 12 chunk 1/3");
}
