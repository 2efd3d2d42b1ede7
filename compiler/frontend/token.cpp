#include "token.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace sceneasm::frontend
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "endOfFile";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::Register: return "register";
        case TokenKind::IntegerLiteral: return "integerLiteral";
        case TokenKind::RealLiteral: return "realLiteral";
        case TokenKind::StringLiteral: return "stringLiteral";
        case TokenKind::Newline: return "newline";
        case TokenKind::Error: return "error";

        case TokenKind::Whitespace: return "whitespace";
        case TokenKind::LineComment: return "lineComment";
        case TokenKind::BlockComment: return "blockComment";
        case TokenKind::LineContinuation: return "lineContinuation";

        case TokenKind::KeywordFunction: return "function";
        case TokenKind::KeywordEndFunction: return "endfun";
        case TokenKind::KeywordSubroutine: return "subroutine";
        case TokenKind::KeywordEndSubroutine: return "endsub";
        case TokenKind::KeywordDef: return "def";
        case TokenKind::KeywordMod: return "mod";
        case TokenKind::KeywordDiv: return "div";

        case TokenKind::LeftParen: return "leftParen";
        case TokenKind::RightParen: return "rightParen";
        case TokenKind::LeftBracket: return "leftBracket";
        case TokenKind::RightBracket: return "rightBracket";
        case TokenKind::LeftBrace: return "leftBrace";
        case TokenKind::RightBrace: return "rightBrace";
        case TokenKind::Comma: return "comma";
        case TokenKind::Colon: return "colon";
        case TokenKind::Equals: return "equals";
        case TokenKind::FatArrow: return "fatArrow";
        case TokenKind::Plus: return "plus";
        case TokenKind::Minus: return "minus";
        case TokenKind::Asterisk: return "asterisk";
        case TokenKind::Slash: return "slash";
        case TokenKind::DotAsterisk: return "dotAsterisk";
        case TokenKind::DotSlash: return "dotSlash";
        case TokenKind::Ampersand: return "ampersand";
        case TokenKind::AmpersandAmpersand: return "ampersandAmpersand";
        case TokenKind::Pipe: return "pipe";
        case TokenKind::PipePipe: return "pipePipe";
        case TokenKind::Caret: return "caret";
        case TokenKind::Tilde: return "tilde";
        case TokenKind::Bang: return "bang";
        case TokenKind::LessThan: return "lessThan";
        case TokenKind::LessEquals: return "lessEquals";
        case TokenKind::GreaterThan: return "greaterThan";
        case TokenKind::GreaterEquals: return "greaterEquals";
        case TokenKind::EqualsEquals: return "equalsEquals";
        case TokenKind::BangEquals: return "bangEquals";
        case TokenKind::ShiftLeft: return "shiftLeft";
        case TokenKind::ShiftRight: return "shiftRight";
        }

        return "unknown";
    }

    bool isTriviaKind(TokenKind kind) noexcept
    {
        return kind == TokenKind::Whitespace
            || kind == TokenKind::LineComment
            || kind == TokenKind::BlockComment
            || kind == TokenKind::LineContinuation;
    }

    bool Token::isTrivia() const noexcept
    {
        return isTriviaKind(kind);
    }

    std::optional<std::int64_t> decodeIntegerLiteral(std::string_view text)
    {
        int base = 10;
        if (text.size() > 2 && text[0] == '0')
        {
            const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
            if (prefix == 'x') base = 16;
            if (prefix == 'b') base = 2;
            if (prefix == 'o') base = 8;
            if (base != 10)
            {
                text.remove_prefix(2);
            }
        }

        std::int64_t value = 0;
        bool sawDigit = false;
        for (char ch : text)
        {
            if (ch == '_')
            {
                continue;
            }

            int digit = -1;
            if (std::isdigit(static_cast<unsigned char>(ch)))
            {
                digit = ch - '0';
            }
            else if (std::isxdigit(static_cast<unsigned char>(ch)))
            {
                digit = std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10;
            }

            if (digit < 0 || digit >= base)
            {
                return std::nullopt;
            }

            value = value * base + digit;
            if (value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
            {
                return std::nullopt;
            }
            sawDigit = true;
        }

        if (!sawDigit)
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<std::int64_t> decodeRealLiteral(std::string_view text)
    {
        std::string cleaned;
        cleaned.reserve(text.size());
        for (char ch : text)
        {
            if (ch != '_')
            {
                cleaned.push_back(ch);
            }
        }

        char* end = nullptr;
        const double value = std::strtod(cleaned.c_str(), &end);
        if (end == nullptr || *end != '\0' || !std::isfinite(value))
        {
            return std::nullopt;
        }

        const double scaled = std::round(value * 1000.0);
        if (scaled > static_cast<double>(std::numeric_limits<std::int32_t>::max()))
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(scaled);
    }

    std::optional<std::string> decodeStringLiteral(std::string_view text)
    {
        if (text.size() < 2 || text.front() != '"' || text.back() != '"')
        {
            return std::nullopt;
        }

        text = text.substr(1, text.size() - 2);
        std::string result;
        result.reserve(text.size());
        for (std::size_t index = 0; index < text.size(); ++index)
        {
            const char ch = text[index];
            if (ch != '\\')
            {
                result.push_back(ch);
                continue;
            }

            if (index + 1 >= text.size())
            {
                return std::nullopt;
            }

            const char escaped = text[++index];
            if (escaped != '\\' && escaped != '"')
            {
                return std::nullopt;
            }
            result.push_back(escaped);
        }
        return result;
    }

    std::string encodeStringLiteral(std::string_view value)
    {
        std::string result;
        result.reserve(value.size() + 2);
        result.push_back('"');
        for (char ch : value)
        {
            if (ch == '\\' || ch == '"')
            {
                result.push_back('\\');
            }
            result.push_back(ch);
        }
        result.push_back('"');
        return result;
    }
} // namespace sceneasm::frontend
