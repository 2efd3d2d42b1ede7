#include <gtest/gtest.h>

#include "diagnostic.hpp"

namespace sceneasm::common
{
namespace
{
    SourceSpan spanAt(std::uint32_t line, std::uint32_t column, std::uint32_t offset)
    {
        return {{line, column, offset}, {line, column + 1, offset + 1}};
    }

    TEST(DiagnosticTest, FormatsCodeLocationAndMessage)
    {
        Diagnostic diagnostic;
        diagnostic.code = "SASM-E2201";
        diagnostic.message = "Undefined name 'foo'.";
        diagnostic.span = spanAt(3, 5, 40);

        EXPECT_EQ(format(diagnostic), "SASM-E2201 L3:C5 -> Undefined name 'foo'.");
    }

    TEST(DiagnosticTest, FormatsSecondaryLabelsAsNotes)
    {
        Diagnostic diagnostic;
        diagnostic.code = "SASM-E2200";
        diagnostic.message = "Duplicate label 'A'.";
        diagnostic.span = spanAt(7, 1, 60);
        diagnostic.secondary.push_back(DiagnosticLabel{spanAt(2, 1, 10), "first declared here"});

        EXPECT_EQ(format(diagnostic), "SASM-E2200 L7:C1 -> Duplicate label 'A'.\n    note L2:C1 -> first declared here");
    }

    TEST(DiagnosticTest, BagCountsErrorsAndWarnings)
    {
        DiagnosticBag bag;
        EXPECT_TRUE(bag.empty());

        bag.warning("SASM-W4003", "duplicate case", spanAt(1, 1, 0));
        EXPECT_FALSE(bag.hasErrors());

        bag.error("SASM-E4001", "overflow", spanAt(2, 1, 5));
        bag.error("SASM-E4006", "unresolved", spanAt(3, 1, 9));

        EXPECT_TRUE(bag.hasErrors());
        EXPECT_EQ(bag.errorCount(), 2u);
        EXPECT_EQ(bag.warningCount(), 1u);

        const auto grouped = bag.bySeverity();
        ASSERT_EQ(grouped.count(Severity::Error), 1u);
        EXPECT_EQ(grouped.at(Severity::Error).size(), 2u);
        EXPECT_EQ(grouped.at(Severity::Warning).front().code, "SASM-W4003");
    }

    TEST(DiagnosticTest, TakeEmptiesTheBag)
    {
        DiagnosticBag bag;
        bag.error("SASM-E2100", "bad", spanAt(1, 1, 0));

        const auto taken = bag.take();
        EXPECT_EQ(taken.size(), 1u);
        EXPECT_TRUE(bag.empty());
    }

    TEST(DiagnosticTest, RebaseShiftsColumnsOnlyOnTheFirstLine)
    {
        const SourceLocation origin{4, 9, 100};

        const SourceSpan firstLine = rebase(spanAt(1, 3, 2), origin);
        EXPECT_EQ(firstLine.begin.line, 4u);
        EXPECT_EQ(firstLine.begin.column, 11u);
        EXPECT_EQ(firstLine.begin.offset, 102u);

        const SourceSpan laterLine = rebase(spanAt(2, 3, 20), origin);
        EXPECT_EQ(laterLine.begin.line, 5u);
        EXPECT_EQ(laterLine.begin.column, 3u);
        EXPECT_EQ(laterLine.begin.offset, 120u);
    }

    TEST(DiagnosticTest, AppendWithOriginRebasesSecondaryLabels)
    {
        Diagnostic diagnostic;
        diagnostic.code = "SASM-E2205";
        diagnostic.message = "Duplicate definition.";
        diagnostic.span = spanAt(2, 1, 10);
        diagnostic.secondary.push_back(DiagnosticLabel{spanAt(1, 5, 4), "previous"});

        DiagnosticBag bag;
        bag.append({diagnostic}, SourceLocation{10, 1, 200});

        ASSERT_EQ(bag.all().size(), 1u);
        EXPECT_EQ(bag.all().front().span.begin.line, 11u);
        EXPECT_EQ(bag.all().front().span.begin.offset, 210u);
        EXPECT_EQ(bag.all().front().secondary.front().span.begin.line, 10u);
        EXPECT_EQ(bag.all().front().secondary.front().span.begin.column, 5u);
    }

    TEST(DiagnosticTest, HasErrorsIgnoresWarnings)
    {
        Diagnostic warning;
        warning.severity = Severity::Warning;
        EXPECT_FALSE(hasErrors({warning}));

        Diagnostic error;
        EXPECT_TRUE(hasErrors({warning, error}));
        EXPECT_EQ(toString(Severity::Warning), "warning");
    }
} // namespace
} // namespace sceneasm::common
