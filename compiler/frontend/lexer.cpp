#include "lexer.hpp"

#include <cctype>

namespace
{
    using namespace sceneasm::frontend;

    bool isIdentifierStart(char ch)
    {
        return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
    }

    bool isIdentifierPart(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
    }

    TokenKind keywordLookup(std::string_view text)
    {
        if (text == "function") return TokenKind::KeywordFunction;
        if (text == "endfun") return TokenKind::KeywordEndFunction;
        if (text == "subroutine") return TokenKind::KeywordSubroutine;
        if (text == "endsub") return TokenKind::KeywordEndSubroutine;
        if (text == "def") return TokenKind::KeywordDef;
        if (text == "mod") return TokenKind::KeywordMod;
        if (text == "div") return TokenKind::KeywordDiv;
        return TokenKind::Identifier;
    }
} // namespace

namespace sceneasm::frontend
{
    Lexer::Lexer(std::string_view source, SourceLocation origin)
        : m_source(source)
        , m_origin(origin)
        , m_location(origin)
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_current = 0;
        m_location = m_origin;

        while (!isAtEnd())
        {
            const char ch = peek();
            const std::size_t startIndex = m_current;
            const SourceLocation startLocation = m_location;

            if (ch == ' ' || ch == '\t' || (ch == '\r' && peekNext() != '\n'))
            {
                lexWhitespace();
                continue;
            }

            if (ch == '\n' || ch == '\r')
            {
                advance();
                if (ch == '\r')
                {
                    advance();
                }
                pushToken(TokenKind::Newline, startIndex, startLocation);
                continue;
            }

            if (isIdentifierStart(ch))
            {
                lexIdentifierOrKeyword();
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(ch)))
            {
                lexNumber();
                continue;
            }

            switch (ch)
            {
            case '"':
                lexString();
                break;
            case '$':
                lexRegister();
                break;
            case '\\':
                lexBackslash();
                break;
            case '/':
                lexSlashOrComment();
                break;
            case '(':
                emitSingle(TokenKind::LeftParen);
                break;
            case ')':
                emitSingle(TokenKind::RightParen);
                break;
            case '[':
                emitSingle(TokenKind::LeftBracket);
                break;
            case ']':
                emitSingle(TokenKind::RightBracket);
                break;
            case '{':
                emitSingle(TokenKind::LeftBrace);
                break;
            case '}':
                emitSingle(TokenKind::RightBrace);
                break;
            case ',':
                emitSingle(TokenKind::Comma);
                break;
            case ':':
                emitSingle(TokenKind::Colon);
                break;
            case '+':
                emitSingle(TokenKind::Plus);
                break;
            case '-':
                emitSingle(TokenKind::Minus);
                break;
            case '*':
                emitSingle(TokenKind::Asterisk);
                break;
            case '^':
                emitSingle(TokenKind::Caret);
                break;
            case '~':
                emitSingle(TokenKind::Tilde);
                break;
            case '.':
                if (peekNext() == '*')
                {
                    emitPair(TokenKind::DotAsterisk);
                }
                else if (peekNext() == '/')
                {
                    emitPair(TokenKind::DotSlash);
                }
                else
                {
                    lexInvalidCharacter();
                }
                break;
            case '=':
                if (peekNext() == '=')
                {
                    emitPair(TokenKind::EqualsEquals);
                }
                else if (peekNext() == '>')
                {
                    emitPair(TokenKind::FatArrow);
                }
                else
                {
                    emitSingle(TokenKind::Equals);
                }
                break;
            case '!':
                if (peekNext() == '=')
                {
                    emitPair(TokenKind::BangEquals);
                }
                else
                {
                    emitSingle(TokenKind::Bang);
                }
                break;
            case '<':
                if (peekNext() == '=')
                {
                    emitPair(TokenKind::LessEquals);
                }
                else if (peekNext() == '<')
                {
                    emitPair(TokenKind::ShiftLeft);
                }
                else
                {
                    emitSingle(TokenKind::LessThan);
                }
                break;
            case '>':
                if (peekNext() == '=')
                {
                    emitPair(TokenKind::GreaterEquals);
                }
                else if (peekNext() == '>')
                {
                    emitPair(TokenKind::ShiftRight);
                }
                else
                {
                    emitSingle(TokenKind::GreaterThan);
                }
                break;
            case '&':
                if (peekNext() == '&')
                {
                    emitPair(TokenKind::AmpersandAmpersand);
                }
                else
                {
                    emitSingle(TokenKind::Ampersand);
                }
                break;
            case '|':
                if (peekNext() == '|')
                {
                    emitPair(TokenKind::PipePipe);
                }
                else
                {
                    emitSingle(TokenKind::Pipe);
                }
                break;
            default:
                lexInvalidCharacter();
                break;
            }
        }

        const SourceLocation eofLocation = m_location;
        pushToken(TokenKind::EndOfFile, m_current, eofLocation);
    }

    void Lexer::pushToken(TokenKind kind, std::size_t startIndex, SourceLocation start)
    {
        Token token;
        token.kind = kind;
        token.span = {start, m_location};
        token.text = std::string{m_source.substr(startIndex, m_current - startIndex)};
        m_tokens.emplace_back(std::move(token));
    }

    void Lexer::emitError(const char* code, const char* message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = code;
        diag.message = message;
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    void Lexer::lexWhitespace()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == ' ' || ch == '\t' || (ch == '\r' && peekNext() != '\n'))
            {
                advance();
                continue;
            }
            break;
        }

        pushToken(TokenKind::Whitespace, startIndex, startLocation);
    }

    void Lexer::lexIdentifierOrKeyword()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume first character
        while (isIdentifierPart(peek()))
        {
            advance();
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(keywordLookup(text), startIndex, startLocation);
    }

    void Lexer::lexRegister()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume '$'
        if (!isIdentifierPart(peek()))
        {
            emitError("SASM-E2004", "Expected a register name after '$'.", startLocation);
            pushToken(TokenKind::Error, startIndex, startLocation);
            return;
        }

        while (isIdentifierPart(peek()))
        {
            advance();
        }
        pushToken(TokenKind::Register, startIndex, startLocation);
    }

    void Lexer::lexNumber()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        bool isReal = false;

        const char first = advance();
        const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(peek())));
        if (first == '0' && (prefix == 'x' || prefix == 'b' || prefix == 'o'))
        {
            advance();
            while (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_')
            {
                advance();
            }
        }
        else
        {
            while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')
            {
                advance();
            }

            // "1.*" is an integer followed by the elementwise operator.
            if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext())))
            {
                isReal = true;
                advance();
                while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')
                {
                    advance();
                }
            }

            if (peek() == 'e' || peek() == 'E')
            {
                const std::size_t save = m_current;
                const SourceLocation saveLocation = m_location;
                advance();
                if (peek() == '+' || peek() == '-')
                {
                    advance();
                }

                if (std::isdigit(static_cast<unsigned char>(peek())))
                {
                    isReal = true;
                    while (std::isdigit(static_cast<unsigned char>(peek())))
                    {
                        advance();
                    }
                }
                else
                {
                    m_current = save;
                    m_location = saveLocation;
                }
            }
        }

        // A trailing identifier part makes the literal invalid; keep it in one token.
        bool malformed = false;
        while (isIdentifierPart(peek()))
        {
            malformed = true;
            advance();
        }

        if (malformed)
        {
            emitError("SASM-E2005", "Malformed number literal.", startLocation);
            pushToken(TokenKind::Error, startIndex, startLocation);
            return;
        }

        pushToken(isReal ? TokenKind::RealLiteral : TokenKind::IntegerLiteral, startIndex, startLocation);
    }

    void Lexer::lexString()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume opening quote
        bool closed = false;
        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == '\n' || ch == '\r')
            {
                break;
            }

            advance();
            if (ch == '"')
            {
                closed = true;
                break;
            }

            if (ch == '\\')
            {
                if (peek() == '\\' || peek() == '"')
                {
                    advance();
                }
                else
                {
                    emitError("SASM-E2006", "Unknown escape sequence in string literal.", m_location);
                }
            }
        }

        if (!closed)
        {
            emitError("SASM-E2002", "Unterminated string literal.", startLocation);
        }

        pushToken(TokenKind::StringLiteral, startIndex, startLocation);
    }

    void Lexer::lexSlashOrComment()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        advance(); // consume '/'

        if (match('/'))
        {
            while (!isAtEnd() && peek() != '\n' && peek() != '\r')
            {
                advance();
            }
            pushToken(TokenKind::LineComment, startIndex, startLocation);
            return;
        }

        if (match('*'))
        {
            lexBlockComment(startIndex, startLocation);
            return;
        }

        pushToken(TokenKind::Slash, startIndex, startLocation);
    }

    void Lexer::lexBlockComment(std::size_t startIndex, SourceLocation start)
    {
        std::size_t depth = 1;
        while (!isAtEnd())
        {
            if (peek() == '/' && peekNext() == '*')
            {
                advance();
                advance();
                ++depth;
                continue;
            }

            if (peek() == '*' && peekNext() == '/')
            {
                advance();
                advance();
                if (--depth == 0)
                {
                    pushToken(TokenKind::BlockComment, startIndex, start);
                    return;
                }
                continue;
            }

            advance();
        }

        emitError("SASM-E2003", "Unterminated block comment; missing trailing '*/'.", start);
        pushToken(TokenKind::BlockComment, startIndex, start);
    }

    void Lexer::lexBackslash()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        advance(); // consume '\'

        if (peek() == '\r' && peekNext() == '\n')
        {
            advance();
        }

        if (peek() == '\n' || peek() == '\r')
        {
            advance();
            pushToken(TokenKind::LineContinuation, startIndex, startLocation);
            return;
        }

        emitError("SASM-E2007", "Line continuation must be followed by a newline.", startLocation);
        pushToken(TokenKind::Error, startIndex, startLocation);
    }

    void Lexer::lexInvalidCharacter()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance();
        // Keep a multi-byte UTF-8 sequence inside a single error token.
        while (!isAtEnd() && (static_cast<unsigned char>(peek()) & 0xc0) == 0x80)
        {
            advance();
        }

        emitError("SASM-E2000", "Unexpected character in source.", startLocation);
        pushToken(TokenKind::Error, startIndex, startLocation);
    }

    void Lexer::emitSingle(TokenKind kind)
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        advance();
        pushToken(kind, startIndex, startLocation);
    }

    void Lexer::emitPair(TokenKind kind)
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        advance();
        advance();
        pushToken(kind, startIndex, startLocation);
    }

    bool Lexer::match(char expected)
    {
        if (isAtEnd()) return false;
        if (m_source[m_current] != expected) return false;
        advance();
        return true;
    }

    char Lexer::peek() const
    {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    char Lexer::peekNext() const
    {
        if (m_current + 1 >= m_source.size()) return '\0';
        return m_source[m_current + 1];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        ++m_location.offset;
        if (ch == '\n')
        {
            ++m_location.line;
            m_location.column = 1;
        }
        else
        {
            ++m_location.column;
        }
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }
} // namespace sceneasm::frontend
