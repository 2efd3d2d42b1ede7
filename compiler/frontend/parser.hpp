#pragma once

#include "lexer.hpp"
#include "syntax_tree.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace sceneasm::frontend
{
    class Parser
    {
    public:
        explicit Parser(const std::vector<Token>& tokens);

        [[nodiscard]] std::unique_ptr<SyntaxNode> parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        const Token& peek() const;
        const Token& peekSecond() const;
        TokenKind peekKind() const;
        bool check(TokenKind kind) const;
        bool match(TokenKind kind);
        void bump();
        bool expect(TokenKind kind, std::string_view code, std::string_view message);
        bool isSkippable(const Token& token) const;
        std::size_t nextSignificant(std::size_t from) const;
        bool atLineEnd() const;
        bool atItemKeyword() const;

        void startNode(SyntaxKind kind);
        void startNodeAt(std::size_t checkpoint, SyntaxKind kind);
        void finishNode();
        std::size_t checkpoint() const;

        void emitError(std::string_view code, std::string_view message, SourceSpan span);
        void recoverToLineEnd(std::string_view code, std::string_view message);
        void consumeLineEnd();

        void parseItem();
        void parseBody(TokenKind terminator);
        void parseLabel();
        void parseFunction();
        void parseParameterList();
        void parsePreservedRanges();
        void parseSubroutine();
        void parseDefinition();
        void parseInstruction();
        void parseArgumentList();
        void parseOperand(bool& sawFlag);
        void parseJumpTable();
        void parseArrayLiteral();
        void parseExpression(int minimumBindingPower);
        void parsePrefix();
        void parseCall();

    private:
        const std::vector<Token>& m_tokens;
        std::size_t m_current{0};
        std::size_t m_nesting{0};
        // Set once an operand on the current line failed to parse.
        bool m_operandFailed{false};
        std::vector<std::unique_ptr<SyntaxNode>> m_stack;
        std::vector<Diagnostic> m_diagnostics;
    };

    struct ParseResult
    {
        std::unique_ptr<SyntaxNode> root;
        std::vector<Diagnostic> diagnostics;
    };

    // Lexes and parses one source text. Lexer diagnostics come first.
    [[nodiscard]] ParseResult parseSource(std::string_view source, SourceLocation origin = {});

    [[nodiscard]] bool isFlagName(std::string_view text) noexcept;
} // namespace sceneasm::frontend
