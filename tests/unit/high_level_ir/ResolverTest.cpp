#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <string_view>

#include "parser.hpp"
#include "resolver.hpp"

namespace sceneasm::hir
{
namespace
{
    struct Resolved
    {
        frontend::ParseResult parsed;
        GlobalScope scope;
        std::vector<Diagnostic> collectDiagnostics;
        std::vector<Unit> units;
        std::vector<Diagnostic> diagnostics;
    };

    Resolved resolveSource(std::string_view source)
    {
        Resolved result;
        result.parsed = frontend::parseSource(source);
        EXPECT_TRUE(result.parsed.diagnostics.empty()) << "unexpected parse diagnostics";

        const std::vector<SegmentTree> segments{SegmentTree{result.parsed.root.get(), {}}};
        Collector collector{segments};
        result.scope = collector.collect();
        result.collectDiagnostics = collector.diagnostics();

        Resolver resolver{result.scope, *result.parsed.root};
        result.units = resolver.resolve();
        result.diagnostics = resolver.diagnostics();
        return result;
    }

    std::size_t countCode(const std::vector<Diagnostic>& diagnostics, std::string_view code)
    {
        return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
            [code](const Diagnostic& diagnostic) { return diagnostic.code == code; }));
    }

    const Unit* findUnit(const std::vector<Unit>& units, std::string_view name)
    {
        for (const auto& unit : units)
        {
            if (unit.name == name)
            {
                return &unit;
            }
        }
        return nullptr;
    }

    TEST(ResolverTest, BindsParameterAliasesToArgumentRegisters)
    {
        const std::string source =
            "function GCD($a, $b)\n"
            "    jc $b != 0, _RECUR\n"
            "    mov $v1, $a\n"
            "    return\n"
            "_RECUR:\n"
            "    exp $a, $a mod $b\n"
            "    call GCD, $b, $a\n"
            "endfun\n";

        const auto resolved = resolveSource(source);
        EXPECT_TRUE(resolved.collectDiagnostics.empty());
        EXPECT_TRUE(resolved.diagnostics.empty());
        ASSERT_EQ(resolved.units.size(), 1u);

        const Unit& gcd = resolved.units.front();
        EXPECT_EQ(gcd.kind, UnitKind::Function);
        EXPECT_EQ(gcd.name, "GCD");
        EXPECT_EQ(gcd.parameterCount, 2u);
        ASSERT_EQ(gcd.statements.size(), 6u);

        const Statement& jump = gcd.statements[0];
        EXPECT_EQ(jump.name, "jc");
        ASSERT_EQ(jump.operands.size(), 2u);
        const Expression& condition = jump.operands[0].expression;
        ASSERT_EQ(condition.kind, ExpressionKind::Binary);
        EXPECT_EQ(condition.binaryOperator, BinaryOperator::NotEqual);
        ASSERT_EQ(condition.operands[0].kind, ExpressionKind::Register);
        EXPECT_EQ(condition.operands[0].reg, *common::Register::argument(1));
        EXPECT_EQ(jump.operands[1].expression.kind, ExpressionKind::CodeAddress);
        EXPECT_EQ(jump.operands[1].expression.text, "_RECUR");

        const Statement& move = gcd.statements[1];
        EXPECT_EQ(move.operands[0].expression.reg, *common::Register::value(1));
        EXPECT_EQ(move.operands[1].expression.reg, *common::Register::argument(0));

        EXPECT_EQ(gcd.statements[3].kind, StatementKind::Label);
        EXPECT_EQ(gcd.statements[3].name, "_RECUR");

        const Statement& call = gcd.statements[5];
        ASSERT_EQ(call.operands.size(), 3u);
        const Expression& callee = call.operands[0].expression;
        EXPECT_EQ(callee.kind, ExpressionKind::CodeAddress);
        EXPECT_EQ(callee.text, "GCD");
        EXPECT_EQ(callee.symbolKind, SymbolKind::Function);
        EXPECT_EQ(callee.parameterCount, 2u);
    }

    TEST(ResolverTest, UndefinedAliasDoesNotStopSiblingFunctions)
    {
        const std::string source =
            "function BROKEN($a)\n"
            "    mov $v0, $missing\n"
            "endfun\n"
            "function FINE($x)\n"
            "    mov $v0, $x\n"
            "endfun\n";

        const auto resolved = resolveSource(source);
        EXPECT_EQ(countCode(resolved.diagnostics, "SASM-E2202"), 1u);
        ASSERT_EQ(resolved.units.size(), 2u);

        const Unit* fine = findUnit(resolved.units, "FINE");
        ASSERT_NE(fine, nullptr);
        ASSERT_EQ(fine->statements.size(), 1u);
        EXPECT_EQ(fine->statements[0].operands[1].expression.kind, ExpressionKind::Register);
        EXPECT_EQ(fine->statements[0].operands[1].expression.reg, *common::Register::argument(0));
    }

    TEST(ResolverTest, AliasesDoNotLeakIntoOtherFunctions)
    {
        const std::string source =
            "function F($a)\n"
            "    return\n"
            "endfun\n"
            "function G()\n"
            "    mov $v0, $a\n"
            "endfun\n";

        const auto resolved = resolveSource(source);
        EXPECT_EQ(countCode(resolved.diagnostics, "SASM-E2202"), 1u);
    }

    TEST(ResolverTest, ReportsUndefinedSymbol)
    {
        const auto resolved = resolveSource("START:\n    j NOWHERE\n");
        ASSERT_EQ(countCode(resolved.diagnostics, "SASM-E2201"), 1u);
        EXPECT_NE(resolved.diagnostics.front().message.find("NOWHERE"), std::string::npos);
    }

    TEST(ResolverTest, ReportsDuplicateDeclarationWithNote)
    {
        const auto resolved = resolveSource("A:\n    nop\nA:\n    nop\n");
        ASSERT_EQ(countCode(resolved.collectDiagnostics, "SASM-E2200"), 1u);
        const Diagnostic& duplicate = resolved.collectDiagnostics.front();
        EXPECT_EQ(duplicate.span.begin.line, 3u);
        ASSERT_EQ(duplicate.secondary.size(), 1u);
        EXPECT_EQ(duplicate.secondary.front().span.begin.line, 1u);
    }

    TEST(ResolverTest, FoldsDefinitionsInAnyOrder)
    {
        const std::string source =
            "def TOTAL = BASE + 2\n"
            "def BASE = 40\n"
            "def $counter = $v7\n"
            "START:\n"
            "    mov $counter, TOTAL\n";

        const auto resolved = resolveSource(source);
        EXPECT_TRUE(resolved.collectDiagnostics.empty());
        EXPECT_TRUE(resolved.diagnostics.empty());

        const auto total = resolved.scope.findValue("TOTAL");
        ASSERT_TRUE(total.has_value());
        EXPECT_EQ(total->value, 42);
        EXPECT_EQ(resolved.scope.findRegister("$counter"), common::Register::value(7));

        ASSERT_EQ(resolved.units.size(), 1u);
        const Statement& move = resolved.units.front().statements.front();
        EXPECT_EQ(move.operands[0].expression.reg, *common::Register::value(7));
        ASSERT_EQ(move.operands[1].expression.kind, ExpressionKind::Literal);
        EXPECT_EQ(move.operands[1].expression.literal.value, 42);
    }

    TEST(ResolverTest, ReportsCyclicDefinitions)
    {
        const auto resolved = resolveSource("def A = B + 1\ndef B = A + 1\n");
        EXPECT_EQ(countCode(resolved.collectDiagnostics, "SASM-E2213"), 1u);
        EXPECT_FALSE(resolved.scope.findValue("A").has_value());
    }

    TEST(ResolverTest, RejectsRegistersInConstantDefinitions)
    {
        const auto resolved = resolveSource("def A = $v0 + 1\n");
        EXPECT_EQ(countCode(resolved.collectDiagnostics, "SASM-E2215"), 1u);
    }

    TEST(ResolverTest, RejectsBuiltinRegisterRedefinition)
    {
        const auto resolved = resolveSource("def $v0 = $v1\n");
        EXPECT_EQ(countCode(resolved.collectDiagnostics, "SASM-E2216"), 1u);
    }

    TEST(ResolverTest, RejectsDefinitionNamedLikeALabel)
    {
        const auto resolved = resolveSource("def START = 1\nSTART:\n    nop\n");
        EXPECT_EQ(countCode(resolved.collectDiagnostics, "SASM-E2205"), 1u);
    }

    TEST(ResolverTest, ReportsInstructionWithoutLabel)
    {
        const auto resolved = resolveSource("    nop\nSTART:\n    nop\n");
        EXPECT_EQ(countCode(resolved.diagnostics, "SASM-E2203"), 1u);
        ASSERT_EQ(resolved.units.size(), 1u);
        EXPECT_EQ(resolved.units.front().statements.size(), 1u);
    }

    TEST(ResolverTest, RejectsBuiltinParameterNames)
    {
        const auto resolved = resolveSource("function F($v0)\n    return\nendfun\n");
        EXPECT_EQ(countCode(resolved.diagnostics, "SASM-E2208"), 1u);
    }

    TEST(ResolverTest, RejectsDuplicateParameters)
    {
        const auto resolved = resolveSource("function F($x, $x)\n    return\nendfun\n");
        EXPECT_EQ(countCode(resolved.diagnostics, "SASM-E2206"), 1u);
    }

    TEST(ResolverTest, LimitsParameterCount)
    {
        std::string header = "function F(";
        for (int index = 0; index < 17; ++index)
        {
            header += (index == 0 ? "$p" : ", $p") + std::to_string(index);
        }
        header += ")\n    return\nendfun\n";

        const auto resolved = resolveSource(header);
        EXPECT_EQ(countCode(resolved.diagnostics, "SASM-E2207"), 1u);
    }

    TEST(ResolverTest, ExpandsPreservedRanges)
    {
        const auto resolved = resolveSource("function F($x), [$v2-$v4, $v8]\n    return\nendfun\n");
        EXPECT_TRUE(resolved.diagnostics.empty());
        ASSERT_EQ(resolved.units.size(), 1u);

        const auto& preserved = resolved.units.front().preserved;
        ASSERT_EQ(preserved.size(), 4u);
        EXPECT_EQ(preserved[0], *common::Register::value(2));
        EXPECT_EQ(preserved[2], *common::Register::value(4));
        EXPECT_EQ(preserved[3], *common::Register::value(8));
    }

    TEST(ResolverTest, RejectsBadPreservedRanges)
    {
        const auto reversed = resolveSource("function F(), [$v4-$v2]\n    return\nendfun\n");
        EXPECT_EQ(countCode(reversed.diagnostics, "SASM-E2211"), 1u);

        const auto overlapping = resolveSource("function F(), [$v1-$v3, $v3]\n    return\nendfun\n");
        EXPECT_EQ(countCode(overlapping.diagnostics, "SASM-E2212"), 1u);

        const auto aliased = resolveSource("function F($x), [$x]\n    return\nendfun\n");
        EXPECT_EQ(countCode(aliased.diagnostics, "SASM-E2209"), 1u);

        const auto argument = resolveSource("function F(), [$a0]\n    return\nendfun\n");
        EXPECT_EQ(countCode(argument.diagnostics, "SASM-E2210"), 1u);
    }

    TEST(ResolverTest, SingleRegisterRangeIsCheckedOnce)
    {
        const auto undefined = resolveSource("function F(), [$saved]\n    return\nendfun\n");
        EXPECT_EQ(countCode(undefined.diagnostics, "SASM-E2202"), 1u);
        EXPECT_EQ(undefined.diagnostics.size(), 1u);

        const auto aliased = resolveSource("function F($x), [$x]\n    return\nendfun\n");
        EXPECT_EQ(aliased.diagnostics.size(), 1u);

        const auto single = resolveSource("function F(), [$v5]\n    return\nendfun\n");
        EXPECT_TRUE(single.diagnostics.empty());
        ASSERT_EQ(single.units.size(), 1u);
        ASSERT_EQ(single.units.front().preserved.size(), 1u);
        EXPECT_EQ(single.units.front().preserved.front(), *common::Register::value(5));
    }

    TEST(ResolverTest, ReportsUnknownIntrinsic)
    {
        const auto resolved = resolveSource("START:\n    exp $v0, sqrt(4)\n");
        EXPECT_EQ(countCode(resolved.diagnostics, "SASM-E2204"), 1u);
    }

    TEST(ResolverTest, RecognisesTrailingFlags)
    {
        const auto resolved = resolveSource("START:\n    MSGSET 7503, \"Hello\", nowait\n");
        EXPECT_TRUE(resolved.diagnostics.empty());
        ASSERT_EQ(resolved.units.size(), 1u);

        const Statement& message = resolved.units.front().statements.front();
        ASSERT_EQ(message.operands.size(), 3u);
        EXPECT_EQ(message.operands[1].expression.kind, ExpressionKind::String);
        EXPECT_EQ(message.operands[1].expression.text, "Hello");
        EXPECT_EQ(message.operands[2].kind, OperandKind::Flag);
        EXPECT_EQ(message.operands[2].flag, "nowait");
    }

    TEST(ResolverTest, ConvertsJumpTableCases)
    {
        const std::string source =
            "START:\n"
            "    jt $v0, { 0 => SNR_0, 1 => SNR_1 }\n"
            "SNR_0:\n"
            "    nop\n"
            "SNR_1:\n"
            "    nop\n";

        const auto resolved = resolveSource(source);
        EXPECT_TRUE(resolved.diagnostics.empty());
        ASSERT_EQ(resolved.units.size(), 3u);

        const Statement& table = resolved.units.front().statements.front();
        ASSERT_EQ(table.operands.size(), 2u);
        ASSERT_EQ(table.operands[1].kind, OperandKind::JumpTable);
        ASSERT_EQ(table.operands[1].cases.size(), 2u);
        EXPECT_EQ(table.operands[1].cases[0].key.literal.value, 0);
        EXPECT_EQ(table.operands[1].cases[0].target.text, "SNR_0");
        EXPECT_EQ(table.operands[1].cases[1].target.text, "SNR_1");
    }
} // namespace
} // namespace sceneasm::hir
