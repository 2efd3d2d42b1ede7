#pragma once

#include "../common/diagnostic.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sceneasm::frontend
{
    using common::SourceLocation;
    using common::SourceSpan;

    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        Register,
        IntegerLiteral,
        RealLiteral,
        StringLiteral,
        Newline,
        Error,

        // Trivia
        Whitespace,
        LineComment,
        BlockComment,
        LineContinuation,

        // Keywords
        KeywordFunction,
        KeywordEndFunction,
        KeywordSubroutine,
        KeywordEndSubroutine,
        KeywordDef,
        KeywordMod,
        KeywordDiv,

        // Punctuation
        LeftParen,
        RightParen,
        LeftBracket,
        RightBracket,
        LeftBrace,
        RightBrace,
        Comma,
        Colon,
        Equals,
        FatArrow,
        Plus,
        Minus,
        Asterisk,
        Slash,
        DotAsterisk,
        DotSlash,
        Ampersand,
        AmpersandAmpersand,
        Pipe,
        PipePipe,
        Caret,
        Tilde,
        Bang,
        LessThan,
        LessEquals,
        GreaterThan,
        GreaterEquals,
        EqualsEquals,
        BangEquals,
        ShiftLeft,
        ShiftRight
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        // Exact source text, so concatenating every token restores the input.
        std::string text{};

        [[nodiscard]] bool isTrivia() const noexcept;
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
    [[nodiscard]] bool isTriviaKind(TokenKind kind) noexcept;

    // Literal decoding shared by the parser and the resolver. Integers are range-checked
    // against u32; reals return the fixed-point value scaled by 1000.
    [[nodiscard]] std::optional<std::int64_t> decodeIntegerLiteral(std::string_view text);
    [[nodiscard]] std::optional<std::int64_t> decodeRealLiteral(std::string_view text);
    // Strips the quotes and resolves the \\ and \" escapes.
    [[nodiscard]] std::optional<std::string> decodeStringLiteral(std::string_view text);
    [[nodiscard]] std::string encodeStringLiteral(std::string_view value);
} // namespace sceneasm::frontend
