#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "parser.hpp"

namespace sceneasm::frontend
{
namespace
{
    std::vector<SyntaxKind> childKinds(const SyntaxNode& node)
    {
        std::vector<SyntaxKind> kinds;
        for (const auto* child : node.childNodes())
        {
            kinds.push_back(child->kind());
        }
        return kinds;
    }

    TEST(ParserTest, ParsesScriptWithInstructions)
    {
        const std::string source = "ENTRY:\n    mov $v0, 1\n    j ENTRY\n";

        const ParseResult result = parseSource(source);
        ASSERT_NE(result.root, nullptr);
        EXPECT_TRUE(result.diagnostics.empty());

        const std::vector<SyntaxKind> expected = {SyntaxKind::Label, SyntaxKind::Instruction, SyntaxKind::Instruction};
        EXPECT_EQ(childKinds(*result.root), expected);
    }

    TEST(ParserTest, ReproducesSourceTextExactly)
    {
        const std::string source =
            "// header comment\n"
            "def LIMIT = 4 * (2 + 1)\n"
            "function F($x, $y) [$v3-$v5]   /* saved */\n"
            "\tjc $x >= LIMIT, \\\n"
            "       DONE\n"
            "DONE:\n"
            "endfun\n"
            "ENTRY:\n"
            "    MSGSET 7503, \"Hi \\\"you\\\"\", nowait\n";

        const ParseResult result = parseSource(source);
        ASSERT_NE(result.root, nullptr);
        EXPECT_TRUE(result.diagnostics.empty());
        EXPECT_EQ(result.root->text(), source);
    }

    TEST(ParserTest, ParsesFunctionHeader)
    {
        const std::string source = "function GCD($a, $b), $v1-$v2\n    return\nendfun\n";

        const ParseResult result = parseSource(source);
        ASSERT_NE(result.root, nullptr);
        EXPECT_TRUE(result.diagnostics.empty());

        const SyntaxNode* function = result.root->firstChild(SyntaxKind::FunctionDef);
        ASSERT_NE(function, nullptr);
        const Token* name = function->firstToken(TokenKind::Identifier);
        ASSERT_NE(name, nullptr);
        EXPECT_EQ(name->text, "GCD");

        const SyntaxNode* parameters = function->firstChild(SyntaxKind::ParameterList);
        ASSERT_NE(parameters, nullptr);
        EXPECT_EQ(parameters->tokens().size(), 5u);

        const SyntaxNode* preserved = function->firstChild(SyntaxKind::PreservedRangeList);
        ASSERT_NE(preserved, nullptr);
        ASSERT_EQ(preserved->childNodes().size(), 1u);
        EXPECT_EQ(preserved->childNodes().front()->tokens().size(), 3u);

        EXPECT_NE(function->firstChild(SyntaxKind::Instruction), nullptr);
    }

    TEST(ParserTest, TrailingFlagIsNotAPositionalOperand)
    {
        const ParseResult result = parseSource("MSGSET 7503, \"Fuck you!\", nowait\n");
        ASSERT_NE(result.root, nullptr);
        EXPECT_TRUE(result.diagnostics.empty());

        const SyntaxNode* instruction = result.root->firstChild(SyntaxKind::Instruction);
        ASSERT_NE(instruction, nullptr);
        const SyntaxNode* arguments = instruction->firstChild(SyntaxKind::ArgumentList);
        ASSERT_NE(arguments, nullptr);

        const std::vector<SyntaxKind> expected = {SyntaxKind::LiteralExpr, SyntaxKind::LiteralExpr, SyntaxKind::Flag};
        EXPECT_EQ(childKinds(*arguments), expected);
    }

    TEST(ParserTest, FlagNameInsideAnExpressionIsAName)
    {
        const ParseResult result = parseSource("WAIT nowait + 1\n");
        ASSERT_NE(result.root, nullptr);

        const SyntaxNode* arguments = result.root->firstChild(SyntaxKind::Instruction)->firstChild(SyntaxKind::ArgumentList);
        ASSERT_NE(arguments, nullptr);
        EXPECT_EQ(arguments->firstChild(SyntaxKind::Flag), nullptr);
        EXPECT_NE(arguments->firstChild(SyntaxKind::BinaryExpr), nullptr);
    }

    TEST(ParserTest, PositionalAfterFlagIsReported)
    {
        const ParseResult result = parseSource("MSGSET 1, nowait, \"late\"\n");

        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().code, "SASM-E2108");
    }

    TEST(ParserTest, MultiplicativeOperatorsShareOnePrecedence)
    {
        const ParseResult result = parseSource("exp $v0, 1 + 2 .* 3 mod 4\n");
        ASSERT_NE(result.root, nullptr);
        EXPECT_TRUE(result.diagnostics.empty());

        std::ostringstream dump;
        dumpTree(*result.root, dump);
        const std::string expected =
            "SourceFile\n"
            "  Instruction\n"
            "    identifier 'exp'\n"
            "    ArgumentList\n"
            "      RegisterExpr\n"
            "        register '$v0'\n"
            "      comma ','\n"
            "      BinaryExpr\n"
            "        LiteralExpr\n"
            "          integerLiteral '1'\n"
            "        plus '+'\n"
            "        BinaryExpr\n"
            "          BinaryExpr\n"
            "            LiteralExpr\n"
            "              integerLiteral '2'\n"
            "            dotAsterisk '.*'\n"
            "            LiteralExpr\n"
            "              integerLiteral '3'\n"
            "          mod 'mod'\n"
            "          LiteralExpr\n"
            "            integerLiteral '4'\n"
            "  newline\n";
        EXPECT_EQ(dump.str(), expected);
    }

    TEST(ParserTest, ParsesJumpTableAcrossLines)
    {
        const std::string source = "ENTRY:\n    jt $v0, {\n        0 => SNR_0,\n        1 => SNR_1\n    }\n    EXIT 0, 0\n";

        const ParseResult result = parseSource(source);
        ASSERT_NE(result.root, nullptr);
        EXPECT_TRUE(result.diagnostics.empty());

        const SyntaxNode* instruction = result.root->firstChild(SyntaxKind::Instruction);
        ASSERT_NE(instruction, nullptr);
        const SyntaxNode* table = instruction->firstChild(SyntaxKind::ArgumentList)->firstChild(SyntaxKind::JumpTableBlock);
        ASSERT_NE(table, nullptr);
        EXPECT_EQ(table->childNodes().size(), 2u);
        EXPECT_EQ(result.root->text(), source);
    }

    TEST(ParserTest, ParsesArrayAndCallOperands)
    {
        const ParseResult result = parseSource("gt $v1, $v0, [1, 2, max(3, $v2)]\n");
        ASSERT_NE(result.root, nullptr);
        EXPECT_TRUE(result.diagnostics.empty());

        const SyntaxNode* arguments = result.root->firstChild(SyntaxKind::Instruction)->firstChild(SyntaxKind::ArgumentList);
        const SyntaxNode* array = arguments->firstChild(SyntaxKind::ArrayLiteral);
        ASSERT_NE(array, nullptr);
        EXPECT_NE(array->firstChild(SyntaxKind::CallExpr), nullptr);
    }

    TEST(ParserTest, ReportsMissingEndfun)
    {
        const ParseResult result = parseSource("function F()\n    return\n");

        ASSERT_FALSE(result.diagnostics.empty());
        EXPECT_EQ(result.diagnostics.back().code, "SASM-E2104");
    }

    TEST(ParserTest, SubroutineRejectsParameters)
    {
        const ParseResult result = parseSource("subroutine S($a)\n    retsub\nendsub\n");

        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().code, "SASM-E2107");
    }

    TEST(ParserTest, RecoversAtTheNextLine)
    {
        const std::string source = "ENTRY:\n    mov $v0, 1 +\n    j ENTRY\n";

        const ParseResult result = parseSource(source);
        ASSERT_NE(result.root, nullptr);
        EXPECT_FALSE(result.diagnostics.empty());
        EXPECT_EQ(result.root->text(), source);

        std::size_t instructions = 0;
        for (const auto* child : result.root->childNodes())
        {
            instructions += child->kind() == SyntaxKind::Instruction ? 1 : 0;
        }
        EXPECT_EQ(instructions, 2u);
    }

    TEST(ParserTest, ReportsOneErrorForAMissingOperand)
    {
        const std::string source = "ENTRY:\n    mov $v0, )\n    j ENTRY\n";

        const ParseResult result = parseSource(source);
        ASSERT_NE(result.root, nullptr);
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().code, "SASM-E2100");
        EXPECT_EQ(result.root->text(), source);

        const ParseResult trailing = parseSource("ENTRY:\n    mov $v0, 1 2\n");
        ASSERT_EQ(trailing.diagnostics.size(), 1u);
        EXPECT_EQ(trailing.diagnostics.front().code, "SASM-E2101");
    }

    TEST(ParserTest, RecognizesFlagNames)
    {
        EXPECT_TRUE(isFlagName("nowait"));
        EXPECT_TRUE(isFlagName("interruptable"));
        EXPECT_FALSE(isFlagName("NOWAIT"));
    }
} // namespace
} // namespace sceneasm::frontend
