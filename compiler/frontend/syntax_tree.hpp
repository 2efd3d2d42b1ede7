#pragma once

#include "token.hpp"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace sceneasm::frontend
{
    enum class SyntaxKind : std::uint16_t
    {
        SourceFile,
        Label,
        FunctionDef,
        ParameterList,
        PreservedRangeList,
        RegisterRange,
        SubroutineDef,
        Definition,
        Instruction,
        ArgumentList,
        Flag,
        JumpTableBlock,
        JumpTableEntry,
        ArrayLiteral,
        LiteralExpr,
        RegisterExpr,
        NameExpr,
        ParenExpr,
        UnaryExpr,
        BinaryExpr,
        CallExpr,
        ErrorNode
    };

    class SyntaxNode;
    using SyntaxElement = std::variant<Token, std::unique_ptr<SyntaxNode>>;

    // Lossless concrete syntax node: owns every token of its range, trivia included.
    class SyntaxNode
    {
    public:
        explicit SyntaxNode(SyntaxKind kind) noexcept
            : m_kind(kind)
        {
        }

        [[nodiscard]] SyntaxKind kind() const noexcept
        {
            return m_kind;
        }

        void setKind(SyntaxKind kind) noexcept
        {
            m_kind = kind;
        }

        [[nodiscard]] const std::vector<SyntaxElement>& children() const noexcept
        {
            return m_children;
        }

        [[nodiscard]] std::vector<SyntaxElement>& children() noexcept
        {
            return m_children;
        }

        void appendToken(Token token);
        void appendNode(std::unique_ptr<SyntaxNode> node);

        // Span from the first to the last significant token; trivia does not count.
        [[nodiscard]] SourceSpan span() const;
        [[nodiscard]] std::string text() const;
        void writeText(std::string& out) const;

        [[nodiscard]] std::vector<const SyntaxNode*> childNodes() const;
        [[nodiscard]] const SyntaxNode* firstChild(SyntaxKind kind) const;
        // Direct significant tokens, trivia skipped.
        [[nodiscard]] std::vector<const Token*> tokens() const;
        [[nodiscard]] const Token* firstToken(TokenKind kind) const;
        [[nodiscard]] const Token* firstSignificantToken() const;
        [[nodiscard]] const Token* lastSignificantToken() const;

    private:
        SyntaxKind m_kind;
        std::vector<SyntaxElement> m_children;
    };

    [[nodiscard]] std::string_view toString(SyntaxKind kind);
    // Indented kind/token dump used by the driver and by tests.
    void dumpTree(const SyntaxNode& node, std::ostream& out, std::size_t depth = 0);
} // namespace sceneasm::frontend
