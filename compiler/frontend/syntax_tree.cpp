#include "syntax_tree.hpp"

#include <string>

namespace sceneasm::frontend
{
    void SyntaxNode::appendToken(Token token)
    {
        m_children.emplace_back(std::move(token));
    }

    void SyntaxNode::appendNode(std::unique_ptr<SyntaxNode> node)
    {
        m_children.emplace_back(std::move(node));
    }

    SourceSpan SyntaxNode::span() const
    {
        const Token* first = firstSignificantToken();
        const Token* last = lastSignificantToken();
        if (first == nullptr || last == nullptr)
        {
            return {};
        }
        return common::mergeSpans(first->span, last->span);
    }

    std::string SyntaxNode::text() const
    {
        std::string result;
        writeText(result);
        return result;
    }

    void SyntaxNode::writeText(std::string& out) const
    {
        for (const auto& child : m_children)
        {
            if (const auto* token = std::get_if<Token>(&child))
            {
                out += token->text;
            }
            else
            {
                std::get<std::unique_ptr<SyntaxNode>>(child)->writeText(out);
            }
        }
    }

    std::vector<const SyntaxNode*> SyntaxNode::childNodes() const
    {
        std::vector<const SyntaxNode*> result;
        for (const auto& child : m_children)
        {
            if (const auto* node = std::get_if<std::unique_ptr<SyntaxNode>>(&child))
            {
                result.push_back(node->get());
            }
        }
        return result;
    }

    const SyntaxNode* SyntaxNode::firstChild(SyntaxKind kind) const
    {
        for (const auto* node : childNodes())
        {
            if (node->kind() == kind)
            {
                return node;
            }
        }
        return nullptr;
    }

    std::vector<const Token*> SyntaxNode::tokens() const
    {
        std::vector<const Token*> result;
        for (const auto& child : m_children)
        {
            const auto* token = std::get_if<Token>(&child);
            if (token != nullptr && !token->isTrivia() && token->kind != TokenKind::EndOfFile)
            {
                result.push_back(token);
            }
        }
        return result;
    }

    const Token* SyntaxNode::firstToken(TokenKind kind) const
    {
        for (const auto* token : tokens())
        {
            if (token->kind == kind)
            {
                return token;
            }
        }
        return nullptr;
    }

    const Token* SyntaxNode::firstSignificantToken() const
    {
        for (const auto& child : m_children)
        {
            if (const auto* token = std::get_if<Token>(&child))
            {
                if (!token->isTrivia() && token->kind != TokenKind::EndOfFile)
                {
                    return token;
                }
                continue;
            }

            if (const Token* nested = std::get<std::unique_ptr<SyntaxNode>>(child)->firstSignificantToken())
            {
                return nested;
            }
        }
        return nullptr;
    }

    const Token* SyntaxNode::lastSignificantToken() const
    {
        for (auto it = m_children.rbegin(); it != m_children.rend(); ++it)
        {
            if (const auto* token = std::get_if<Token>(&*it))
            {
                if (!token->isTrivia() && token->kind != TokenKind::EndOfFile && token->kind != TokenKind::Newline)
                {
                    return token;
                }
                continue;
            }

            if (const Token* nested = std::get<std::unique_ptr<SyntaxNode>>(*it)->lastSignificantToken())
            {
                return nested;
            }
        }
        return nullptr;
    }

    std::string_view toString(SyntaxKind kind)
    {
        switch (kind)
        {
        case SyntaxKind::SourceFile: return "SourceFile";
        case SyntaxKind::Label: return "Label";
        case SyntaxKind::FunctionDef: return "FunctionDef";
        case SyntaxKind::ParameterList: return "ParameterList";
        case SyntaxKind::PreservedRangeList: return "PreservedRangeList";
        case SyntaxKind::RegisterRange: return "RegisterRange";
        case SyntaxKind::SubroutineDef: return "SubroutineDef";
        case SyntaxKind::Definition: return "Definition";
        case SyntaxKind::Instruction: return "Instruction";
        case SyntaxKind::ArgumentList: return "ArgumentList";
        case SyntaxKind::Flag: return "Flag";
        case SyntaxKind::JumpTableBlock: return "JumpTableBlock";
        case SyntaxKind::JumpTableEntry: return "JumpTableEntry";
        case SyntaxKind::ArrayLiteral: return "ArrayLiteral";
        case SyntaxKind::LiteralExpr: return "LiteralExpr";
        case SyntaxKind::RegisterExpr: return "RegisterExpr";
        case SyntaxKind::NameExpr: return "NameExpr";
        case SyntaxKind::ParenExpr: return "ParenExpr";
        case SyntaxKind::UnaryExpr: return "UnaryExpr";
        case SyntaxKind::BinaryExpr: return "BinaryExpr";
        case SyntaxKind::CallExpr: return "CallExpr";
        case SyntaxKind::ErrorNode: return "ErrorNode";
        }
        return "Unknown";
    }

    void dumpTree(const SyntaxNode& node, std::ostream& out, std::size_t depth)
    {
        out << std::string(depth * 2, ' ') << toString(node.kind()) << '\n';
        for (const auto& child : node.children())
        {
            if (const auto* token = std::get_if<Token>(&child))
            {
                if (token->isTrivia() || token->kind == TokenKind::EndOfFile)
                {
                    continue;
                }

                out << std::string((depth + 1) * 2, ' ') << toString(token->kind);
                if (token->kind != TokenKind::Newline)
                {
                    out << " '" << token->text << "'";
                }
                out << '\n';
                continue;
            }

            dumpTree(*std::get<std::unique_ptr<SyntaxNode>>(child), out, depth + 1);
        }
    }
} // namespace sceneasm::frontend
