#include "parser.hpp"

#include <iterator>
#include <string>

namespace sceneasm::frontend
{
    namespace
    {
        constexpr int kPrefixBindingPower = 100;

        int infixBindingPower(TokenKind kind)
        {
            switch (kind)
            {
            case TokenKind::PipePipe: return 3;
            case TokenKind::AmpersandAmpersand: return 4;
            case TokenKind::EqualsEquals:
            case TokenKind::BangEquals:
            case TokenKind::LessThan:
            case TokenKind::LessEquals:
            case TokenKind::GreaterThan:
            case TokenKind::GreaterEquals:
                return 5;
            case TokenKind::Pipe: return 6;
            case TokenKind::Caret: return 7;
            case TokenKind::Ampersand: return 8;
            case TokenKind::ShiftLeft:
            case TokenKind::ShiftRight:
                return 9;
            case TokenKind::Plus:
            case TokenKind::Minus:
                return 10;
            case TokenKind::Asterisk:
            case TokenKind::Slash:
            case TokenKind::KeywordDiv:
            case TokenKind::KeywordMod:
            case TokenKind::DotAsterisk:
            case TokenKind::DotSlash:
                return 11;
            default:
                return 0;
            }
        }

        bool startsExpression(TokenKind kind)
        {
            switch (kind)
            {
            case TokenKind::IntegerLiteral:
            case TokenKind::RealLiteral:
            case TokenKind::StringLiteral:
            case TokenKind::Register:
            case TokenKind::Identifier:
            case TokenKind::LeftParen:
            case TokenKind::Minus:
            case TokenKind::Bang:
            case TokenKind::Tilde:
                return true;
            default:
                return false;
            }
        }
    } // namespace

    bool isFlagName(std::string_view text) noexcept
    {
        return text == "nowait" || text == "interruptable";
    }

    Parser::Parser(const std::vector<Token>& tokens)
        : m_tokens(tokens)
    {
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::unique_ptr<SyntaxNode> Parser::parse()
    {
        m_current = 0;
        m_nesting = 0;
        m_stack.clear();
        m_diagnostics.clear();
        m_stack.push_back(std::make_unique<SyntaxNode>(SyntaxKind::SourceFile));

        while (peekKind() != TokenKind::EndOfFile)
        {
            if (check(TokenKind::Newline))
            {
                bump();
                continue;
            }
            parseItem();
        }

        for (; m_current < m_tokens.size(); ++m_current)
        {
            m_stack.back()->appendToken(m_tokens[m_current]);
        }

        std::unique_ptr<SyntaxNode> root = std::move(m_stack.front());
        m_stack.clear();
        return root;
    }

    bool Parser::isSkippable(const Token& token) const
    {
        return token.isTrivia() || (m_nesting > 0 && token.kind == TokenKind::Newline);
    }

    std::size_t Parser::nextSignificant(std::size_t from) const
    {
        if (m_tokens.empty())
        {
            return 0;
        }

        std::size_t index = from;
        while (index + 1 < m_tokens.size() && isSkippable(m_tokens[index]))
        {
            ++index;
        }
        return index < m_tokens.size() ? index : m_tokens.size() - 1;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[nextSignificant(m_current)];
    }

    const Token& Parser::peekSecond() const
    {
        const std::size_t first = nextSignificant(m_current);
        return m_tokens[nextSignificant(first + 1)];
    }

    TokenKind Parser::peekKind() const
    {
        if (m_tokens.empty())
        {
            return TokenKind::EndOfFile;
        }
        return peek().kind;
    }

    bool Parser::check(TokenKind kind) const
    {
        return peekKind() == kind;
    }

    bool Parser::match(TokenKind kind)
    {
        if (!check(kind))
        {
            return false;
        }
        bump();
        return true;
    }

    void Parser::bump()
    {
        if (peekKind() == TokenKind::EndOfFile)
        {
            return;
        }

        const std::size_t target = nextSignificant(m_current);
        for (std::size_t index = m_current; index <= target; ++index)
        {
            m_stack.back()->appendToken(m_tokens[index]);
        }
        m_current = target + 1;
    }

    bool Parser::expect(TokenKind kind, std::string_view code, std::string_view message)
    {
        if (match(kind))
        {
            return true;
        }
        emitError(code, message, peek().span);
        return false;
    }

    bool Parser::atLineEnd() const
    {
        const TokenKind kind = peekKind();
        return kind == TokenKind::Newline || kind == TokenKind::EndOfFile;
    }

    bool Parser::atItemKeyword() const
    {
        const TokenKind kind = peekKind();
        return kind == TokenKind::KeywordFunction
            || kind == TokenKind::KeywordSubroutine
            || kind == TokenKind::KeywordDef
            || kind == TokenKind::KeywordEndFunction
            || kind == TokenKind::KeywordEndSubroutine;
    }

    void Parser::startNode(SyntaxKind kind)
    {
        m_stack.push_back(std::make_unique<SyntaxNode>(kind));
    }

    void Parser::startNodeAt(std::size_t checkpoint, SyntaxKind kind)
    {
        auto node = std::make_unique<SyntaxNode>(kind);
        auto& parentChildren = m_stack.back()->children();
        auto first = parentChildren.begin() + static_cast<std::ptrdiff_t>(checkpoint);
        std::move(first, parentChildren.end(), std::back_inserter(node->children()));
        parentChildren.erase(first, parentChildren.end());
        m_stack.push_back(std::move(node));
    }

    void Parser::finishNode()
    {
        std::unique_ptr<SyntaxNode> node = std::move(m_stack.back());
        m_stack.pop_back();
        m_stack.back()->appendNode(std::move(node));
    }

    std::size_t Parser::checkpoint() const
    {
        return m_stack.back()->children().size();
    }

    void Parser::emitError(std::string_view code, std::string_view message, SourceSpan span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }

    void Parser::recoverToLineEnd(std::string_view code, std::string_view message)
    {
        // Lexer errors were already reported for error tokens.
        if (peekKind() != TokenKind::Error)
        {
            emitError(code, message, peek().span);
        }

        startNode(SyntaxKind::ErrorNode);
        bump();
        while (!atLineEnd() && !atItemKeyword())
        {
            bump();
        }
        finishNode();
    }

    void Parser::consumeLineEnd()
    {
        const bool operandFailed = m_operandFailed;
        m_operandFailed = false;
        if (atLineEnd())
        {
            return;
        }
        if (!operandFailed)
        {
            recoverToLineEnd("SASM-E2101", "Expected end of line.");
            return;
        }

        // The failed operand was reported already; the rest of the line joins its error.
        startNode(SyntaxKind::ErrorNode);
        bump();
        while (!atLineEnd() && !atItemKeyword())
        {
            bump();
        }
        finishNode();
    }

    void Parser::parseItem()
    {
        switch (peekKind())
        {
        case TokenKind::KeywordFunction:
            parseFunction();
            return;
        case TokenKind::KeywordSubroutine:
            parseSubroutine();
            return;
        case TokenKind::KeywordDef:
            parseDefinition();
            return;
        case TokenKind::KeywordEndFunction:
            recoverToLineEnd("SASM-E2106", "'endfun' without a matching 'function'.");
            return;
        case TokenKind::KeywordEndSubroutine:
            recoverToLineEnd("SASM-E2106", "'endsub' without a matching 'subroutine'.");
            return;
        case TokenKind::Identifier:
            if (peekSecond().kind == TokenKind::Colon)
            {
                parseLabel();
            }
            else
            {
                parseInstruction();
            }
            return;
        case TokenKind::KeywordMod:
        case TokenKind::KeywordDiv:
            // 'mod' and 'div' double as bo mnemonics.
            parseInstruction();
            return;
        default:
            recoverToLineEnd("SASM-E2103", "Expected a label, instruction or item declaration.");
            return;
        }
    }

    void Parser::parseBody(TokenKind terminator)
    {
        while (true)
        {
            const TokenKind kind = peekKind();
            if (kind == terminator || kind == TokenKind::EndOfFile
                || kind == TokenKind::KeywordFunction || kind == TokenKind::KeywordSubroutine
                || kind == TokenKind::KeywordDef)
            {
                return;
            }

            if (kind == TokenKind::Newline)
            {
                bump();
                continue;
            }

            if (kind == TokenKind::Identifier)
            {
                if (peekSecond().kind == TokenKind::Colon)
                {
                    parseLabel();
                }
                else
                {
                    parseInstruction();
                }
                continue;
            }

            if (kind == TokenKind::KeywordMod || kind == TokenKind::KeywordDiv)
            {
                parseInstruction();
                continue;
            }

            recoverToLineEnd("SASM-E2103", "Expected a label or instruction.");
        }
    }

    void Parser::parseLabel()
    {
        startNode(SyntaxKind::Label);
        bump(); // name
        bump(); // ':'
        finishNode();
    }

    void Parser::parseFunction()
    {
        startNode(SyntaxKind::FunctionDef);
        bump(); // 'function'
        expect(TokenKind::Identifier, "SASM-E2102", "Expected a function name.");

        if (check(TokenKind::LeftParen))
        {
            parseParameterList();
        }

        if (match(TokenKind::Comma) || check(TokenKind::LeftBracket))
        {
            parsePreservedRanges();
        }

        consumeLineEnd();
        parseBody(TokenKind::KeywordEndFunction);

        if (!match(TokenKind::KeywordEndFunction))
        {
            emitError("SASM-E2104", "Missing 'endfun' to close the function.", peek().span);
        }
        else
        {
            consumeLineEnd();
        }
        finishNode();
    }

    void Parser::parseParameterList()
    {
        startNode(SyntaxKind::ParameterList);
        bump(); // '('
        ++m_nesting;

        if (!check(TokenKind::RightParen))
        {
            do
            {
                if (!check(TokenKind::Register))
                {
                    emitError("SASM-E2102", "Expected a parameter register alias.", peek().span);
                    break;
                }
                bump();
            } while (match(TokenKind::Comma));
        }

        expect(TokenKind::RightParen, "SASM-E2102", "Expected ')' after the parameter list.");
        --m_nesting;
        finishNode();
    }

    void Parser::parsePreservedRanges()
    {
        startNode(SyntaxKind::PreservedRangeList);
        const bool bracketed = match(TokenKind::LeftBracket);
        if (bracketed)
        {
            ++m_nesting;
        }

        do
        {
            startNode(SyntaxKind::RegisterRange);
            const bool hasStart = expect(TokenKind::Register, "SASM-E2102", "Expected a register in the preserved range.");
            if (hasStart && match(TokenKind::Minus))
            {
                expect(TokenKind::Register, "SASM-E2102", "Expected the last register of the preserved range.");
            }
            finishNode();
            if (!hasStart)
            {
                break;
            }
        } while (match(TokenKind::Comma));

        if (bracketed)
        {
            expect(TokenKind::RightBracket, "SASM-E2102", "Expected ']' after the preserved ranges.");
            --m_nesting;
        }
        finishNode();
    }

    void Parser::parseSubroutine()
    {
        startNode(SyntaxKind::SubroutineDef);
        bump(); // 'subroutine'
        expect(TokenKind::Identifier, "SASM-E2102", "Expected a subroutine name.");

        if (check(TokenKind::LeftParen) || check(TokenKind::Comma) || check(TokenKind::LeftBracket))
        {
            recoverToLineEnd("SASM-E2107", "Subroutines take neither parameters nor preserved ranges.");
        }

        consumeLineEnd();
        parseBody(TokenKind::KeywordEndSubroutine);

        if (!match(TokenKind::KeywordEndSubroutine))
        {
            emitError("SASM-E2105", "Missing 'endsub' to close the subroutine.", peek().span);
        }
        else
        {
            consumeLineEnd();
        }
        finishNode();
    }

    void Parser::parseDefinition()
    {
        startNode(SyntaxKind::Definition);
        bump(); // 'def'

        if (check(TokenKind::Identifier) || check(TokenKind::Register))
        {
            bump();
        }
        else
        {
            emitError("SASM-E2102", "Expected a name or register alias after 'def'.", peek().span);
        }

        if (expect(TokenKind::Equals, "SASM-E2102", "Expected '=' in definition."))
        {
            parseExpression(0);
        }
        consumeLineEnd();
        finishNode();
    }

    void Parser::parseInstruction()
    {
        m_operandFailed = false;
        startNode(SyntaxKind::Instruction);
        bump(); // mnemonic

        if (!atLineEnd() && !atItemKeyword())
        {
            parseArgumentList();
        }

        consumeLineEnd();
        finishNode();
    }

    void Parser::parseArgumentList()
    {
        startNode(SyntaxKind::ArgumentList);
        bool sawFlag = false;
        do
        {
            parseOperand(sawFlag);
        } while (match(TokenKind::Comma));
        finishNode();
    }

    void Parser::parseOperand(bool& sawFlag)
    {
        const Token& token = peek();
        if (token.kind == TokenKind::Identifier && isFlagName(token.text))
        {
            const TokenKind following = peekSecond().kind;
            if (following == TokenKind::Comma || following == TokenKind::Newline || following == TokenKind::EndOfFile)
            {
                startNode(SyntaxKind::Flag);
                bump();
                finishNode();
                sawFlag = true;
                return;
            }
        }

        if (sawFlag)
        {
            emitError("SASM-E2108", "Positional operands must precede trailing flags.", token.span);
        }

        if (token.kind == TokenKind::LeftBrace)
        {
            parseJumpTable();
            return;
        }

        if (token.kind == TokenKind::LeftBracket)
        {
            parseArrayLiteral();
            return;
        }

        parseExpression(0);
    }

    void Parser::parseJumpTable()
    {
        startNode(SyntaxKind::JumpTableBlock);
        bump(); // '{'
        ++m_nesting;

        while (!check(TokenKind::RightBrace) && startsExpression(peekKind()))
        {
            startNode(SyntaxKind::JumpTableEntry);
            parseExpression(0);
            if (expect(TokenKind::FatArrow, "SASM-E2102", "Expected '=>' in jump table entry."))
            {
                parseExpression(0);
            }
            finishNode();

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        expect(TokenKind::RightBrace, "SASM-E2102", "Expected '}' to close the jump table.");
        --m_nesting;
        finishNode();
    }

    void Parser::parseArrayLiteral()
    {
        startNode(SyntaxKind::ArrayLiteral);
        bump(); // '['
        ++m_nesting;

        while (!check(TokenKind::RightBracket) && startsExpression(peekKind()))
        {
            parseExpression(0);
            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        expect(TokenKind::RightBracket, "SASM-E2102", "Expected ']' to close the list.");
        --m_nesting;
        finishNode();
    }

    void Parser::parseExpression(int minimumBindingPower)
    {
        const std::size_t start = checkpoint();
        parsePrefix();

        while (true)
        {
            const int power = infixBindingPower(peekKind());
            if (power == 0 || power <= minimumBindingPower)
            {
                break;
            }

            startNodeAt(start, SyntaxKind::BinaryExpr);
            bump(); // operator
            parseExpression(power);
            finishNode();
        }
    }

    void Parser::parsePrefix()
    {
        switch (peekKind())
        {
        case TokenKind::Minus:
        case TokenKind::Bang:
        case TokenKind::Tilde:
            startNode(SyntaxKind::UnaryExpr);
            bump();
            parseExpression(kPrefixBindingPower);
            finishNode();
            return;
        case TokenKind::IntegerLiteral:
        case TokenKind::RealLiteral:
        case TokenKind::StringLiteral:
            startNode(SyntaxKind::LiteralExpr);
            bump();
            finishNode();
            return;
        case TokenKind::Register:
            startNode(SyntaxKind::RegisterExpr);
            bump();
            finishNode();
            return;
        case TokenKind::Identifier:
            if (peekSecond().kind == TokenKind::LeftParen)
            {
                parseCall();
                return;
            }
            startNode(SyntaxKind::NameExpr);
            bump();
            finishNode();
            return;
        case TokenKind::LeftParen:
            startNode(SyntaxKind::ParenExpr);
            bump();
            ++m_nesting;
            parseExpression(0);
            expect(TokenKind::RightParen, "SASM-E2102", "Expected ')' to close the expression.");
            --m_nesting;
            finishNode();
            return;
        case TokenKind::Error:
            startNode(SyntaxKind::ErrorNode);
            bump();
            finishNode();
            return;
        default:
            emitError("SASM-E2100", "Expected an expression.", peek().span);
            m_operandFailed = true;
            startNode(SyntaxKind::ErrorNode);
            finishNode();
            return;
        }
    }

    void Parser::parseCall()
    {
        startNode(SyntaxKind::CallExpr);
        bump(); // callee
        bump(); // '('
        ++m_nesting;

        if (!check(TokenKind::RightParen))
        {
            do
            {
                parseExpression(0);
            } while (match(TokenKind::Comma));
        }

        expect(TokenKind::RightParen, "SASM-E2102", "Expected ')' after the call arguments.");
        --m_nesting;
        finishNode();
    }

    ParseResult parseSource(std::string_view source, SourceLocation origin)
    {
        Lexer lexer{source, origin};
        lexer.lex();

        Parser parser{lexer.tokens()};
        ParseResult result;
        result.root = parser.parse();
        result.diagnostics = lexer.diagnostics();
        result.diagnostics.insert(result.diagnostics.end(), parser.diagnostics().begin(), parser.diagnostics().end());
        return result;
    }
} // namespace sceneasm::frontend
