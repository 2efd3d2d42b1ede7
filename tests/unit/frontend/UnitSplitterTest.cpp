#include <gtest/gtest.h>

#include <string>

#include "unit_splitter.hpp"

namespace sceneasm::frontend
{
namespace
{
    std::string joined(const std::vector<SourceSegment>& segments)
    {
        std::string result;
        for (const auto& segment : segments)
        {
            result += std::string{segment.text};
        }
        return result;
    }

    TEST(UnitSplitterTest, SplitsAtItemHeaders)
    {
        const std::string source =
            "def LIMIT = 3\n"
            "ENTRY:\n"
            "    gosub SUB\n"
            "subroutine SUB\n"
            "INNER:\n"
            "    retsub\n"
            "endsub\n"
            "function F($a)\n"
            "    return\n"
            "endfun\n";

        const auto segments = splitUnits(source);
        ASSERT_EQ(segments.size(), 4u);
        EXPECT_EQ(segments[0].text, "def LIMIT = 3\n");
        EXPECT_EQ(segments[1].text, "ENTRY:\n    gosub SUB\n");
        EXPECT_EQ(segments[2].text, "subroutine SUB\nINNER:\n    retsub\nendsub\n");
        EXPECT_EQ(segments[3].text, "function F($a)\n    return\nendfun\n");
        EXPECT_EQ(joined(segments), source);
    }

    TEST(UnitSplitterTest, RecordsSegmentOrigins)
    {
        const std::string source = "A:\n    j B\nB:\n    j A\n";

        const auto segments = splitUnits(source);
        ASSERT_EQ(segments.size(), 2u);
        EXPECT_EQ(segments[0].origin.line, 1u);
        EXPECT_EQ(segments[0].origin.offset, 0u);
        EXPECT_EQ(segments[1].origin.line, 3u);
        EXPECT_EQ(segments[1].origin.column, 1u);
        EXPECT_EQ(segments[1].origin.offset, 11u);
    }

    TEST(UnitSplitterTest, IgnoresHeadersInsideBlockComments)
    {
        const std::string source = "A:\n/* B:\n   function X */\n    j A\n";

        const auto segments = splitUnits(source);
        ASSERT_EQ(segments.size(), 1u);
        EXPECT_EQ(segments[0].text, source);
    }

    TEST(UnitSplitterTest, IgnoresContinuedLines)
    {
        const std::string source = "A:\n    push 1, \\\nB: 2\n";

        const auto segments = splitUnits(source);
        ASSERT_EQ(segments.size(), 1u);
    }

    TEST(UnitSplitterTest, KeepsLeadingCommentsWithTheFirstItem)
    {
        const std::string source = "// banner\n\nENTRY:\n    EXIT 0, 0\n";

        const auto segments = splitUnits(source);
        ASSERT_EQ(segments.size(), 2u);
        EXPECT_EQ(segments[0].text, "// banner\n\n");
        EXPECT_EQ(joined(segments), source);
    }

    TEST(UnitSplitterTest, EmptySourceIsOneSegment)
    {
        const auto segments = splitUnits("");
        ASSERT_EQ(segments.size(), 1u);
        EXPECT_TRUE(segments[0].text.empty());
    }
} // namespace
} // namespace sceneasm::frontend
