#pragma once

#include "token.hpp"

#include <string_view>
#include <vector>

namespace sceneasm::frontend
{
    using common::Diagnostic;

    class Lexer
    {
    public:
        explicit Lexer(std::string_view source, SourceLocation origin = {});

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

        void lex();

    private:
        void pushToken(TokenKind kind, std::size_t startIndex, SourceLocation start);
        void emitError(const char* code, const char* message, SourceLocation start);
        void lexWhitespace();
        void lexIdentifierOrKeyword();
        void lexRegister();
        void lexNumber();
        void lexString();
        void lexSlashOrComment();
        void lexBlockComment(std::size_t startIndex, SourceLocation start);
        void lexBackslash();
        void lexInvalidCharacter();
        void emitSingle(TokenKind kind);
        void emitPair(TokenKind kind);
        bool match(char expected);
        char peek() const;
        char peekNext() const;
        char advance();
        bool isAtEnd() const;

    private:
        std::string_view m_source;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_current{0};
        SourceLocation m_origin{};
        SourceLocation m_location{};
    };
} // namespace sceneasm::frontend
