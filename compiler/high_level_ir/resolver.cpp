#include "resolver.hpp"

#include "expression_lowering.hpp"

#include <functional>
#include <set>

namespace sceneasm::hir
{
    namespace
    {
        using frontend::SyntaxKind;
        using frontend::SyntaxNode;
        using frontend::Token;
        using frontend::TokenKind;

        using ValueLookup = std::function<bool(const std::string&, SourceSpan, std::optional<ConstantValue>&)>;
        using RegisterLookup = std::function<bool(const std::string&, SourceSpan, std::optional<Register>&)>;

        struct NameLookup
        {
            const GlobalScope* scope{nullptr};
            const std::unordered_map<std::string, Register>* aliases{nullptr};
            bool constantContext{false};
            SourceLocation origin{};
            ValueLookup value;
            RegisterLookup reg;
        };

        const Token* firstOperatorToken(const SyntaxNode& node)
        {
            for (const Token* token : node.tokens())
            {
                if (token->kind != TokenKind::Newline)
                {
                    return token;
                }
            }
            return nullptr;
        }

        std::optional<Intrinsic> findIntrinsic(std::string_view name)
        {
            static const std::pair<std::string_view, Intrinsic> kIntrinsics[] = {
                {"abs", Intrinsic::Abs},
                {"sin", Intrinsic::Sin},
                {"cos", Intrinsic::Cos},
                {"tan", Intrinsic::Tan},
                {"min", Intrinsic::Min},
                {"max", Intrinsic::Max},
                {"select", Intrinsic::Select},
                {"nonzero", Intrinsic::NonZero},
            };
            for (const auto& [spelling, intrinsic] : kIntrinsics)
            {
                if (spelling == name)
                {
                    return intrinsic;
                }
            }
            return std::nullopt;
        }

        std::optional<BinaryOperator> binaryOperatorFor(TokenKind kind)
        {
            switch (kind)
            {
            case TokenKind::Plus: return BinaryOperator::Add;
            case TokenKind::Minus: return BinaryOperator::Subtract;
            case TokenKind::Asterisk: return BinaryOperator::Multiply;
            case TokenKind::Slash: return BinaryOperator::Divide;
            case TokenKind::KeywordDiv: return BinaryOperator::IntegerDivide;
            case TokenKind::KeywordMod: return BinaryOperator::Modulo;
            case TokenKind::DotAsterisk: return BinaryOperator::MultiplyReal;
            case TokenKind::DotSlash: return BinaryOperator::DivideReal;
            case TokenKind::ShiftLeft: return BinaryOperator::ShiftLeft;
            case TokenKind::ShiftRight: return BinaryOperator::ShiftRight;
            case TokenKind::Ampersand: return BinaryOperator::BitwiseAnd;
            case TokenKind::Pipe: return BinaryOperator::BitwiseOr;
            case TokenKind::Caret: return BinaryOperator::BitwiseXor;
            case TokenKind::EqualsEquals: return BinaryOperator::Equal;
            case TokenKind::BangEquals: return BinaryOperator::NotEqual;
            case TokenKind::LessThan: return BinaryOperator::Less;
            case TokenKind::LessEquals: return BinaryOperator::LessEqual;
            case TokenKind::GreaterThan: return BinaryOperator::Greater;
            case TokenKind::GreaterEquals: return BinaryOperator::GreaterEqual;
            case TokenKind::AmpersandAmpersand: return BinaryOperator::LogicalAnd;
            case TokenKind::PipePipe: return BinaryOperator::LogicalOr;
            default: return std::nullopt;
            }
        }

        // Turns expression syntax into HIR, classifying every name on the way.
        class ExpressionConverter
        {
        public:
            ExpressionConverter(NameLookup lookup, DiagnosticBag& diagnostics)
                : m_lookup(std::move(lookup))
                , m_diagnostics(diagnostics)
            {
            }

            Expression convert(const SyntaxNode& node)
            {
                const SourceSpan span = spanOf(node);
                switch (node.kind())
                {
                case SyntaxKind::LiteralExpr:
                    return convertLiteral(node, span);
                case SyntaxKind::RegisterExpr:
                    return convertRegister(node, span);
                case SyntaxKind::NameExpr:
                    return convertName(node, span);
                case SyntaxKind::ParenExpr:
                {
                    const auto children = node.childNodes();
                    return children.empty() ? makeError(span) : convert(*children.front());
                }
                case SyntaxKind::UnaryExpr:
                    return convertUnary(node, span);
                case SyntaxKind::BinaryExpr:
                    return convertBinary(node, span);
                case SyntaxKind::CallExpr:
                    return convertCall(node, span);
                case SyntaxKind::JumpTableBlock:
                case SyntaxKind::ArrayLiteral:
                    m_diagnostics.error("SASM-E2220", "A list is not allowed here.", span);
                    return makeError(span);
                default:
                    return makeError(span);
                }
            }

            Operand convertOperand(const SyntaxNode& node)
            {
                Operand operand;
                operand.span = spanOf(node);
                switch (node.kind())
                {
                case SyntaxKind::Flag:
                    operand.kind = OperandKind::Flag;
                    if (const Token* token = node.firstSignificantToken())
                    {
                        operand.flag = token->text;
                    }
                    break;
                case SyntaxKind::ArrayLiteral:
                    operand.kind = OperandKind::Array;
                    for (const SyntaxNode* element : node.childNodes())
                    {
                        operand.elements.push_back(convert(*element));
                    }
                    break;
                case SyntaxKind::JumpTableBlock:
                    operand.kind = OperandKind::JumpTable;
                    for (const SyntaxNode* entry : node.childNodes())
                    {
                        const auto parts = entry->childNodes();
                        JumpTableCase tableCase;
                        tableCase.span = spanOf(*entry);
                        tableCase.key = parts.empty() ? makeError(tableCase.span) : convert(*parts[0]);
                        tableCase.target = parts.size() < 2 ? makeError(tableCase.span) : convert(*parts[1]);
                        operand.cases.push_back(std::move(tableCase));
                    }
                    break;
                default:
                    operand.kind = OperandKind::Expression;
                    operand.expression = convert(node);
                    break;
                }
                return operand;
            }

        private:
            SourceSpan spanOf(const SyntaxNode& node) const
            {
                return common::rebase(node.span(), m_lookup.origin);
            }

            static Expression makeError(SourceSpan span)
            {
                Expression expression;
                expression.kind = ExpressionKind::Error;
                expression.span = span;
                return expression;
            }

            static Expression makeLiteral(ConstantValue value, SourceSpan span)
            {
                Expression expression;
                expression.kind = ExpressionKind::Literal;
                expression.literal = value;
                expression.span = span;
                return expression;
            }

            Expression convertLiteral(const SyntaxNode& node, SourceSpan span)
            {
                const Token* token = node.firstSignificantToken();
                if (token == nullptr)
                {
                    return makeError(span);
                }

                if (token->kind == TokenKind::StringLiteral)
                {
                    const auto text = frontend::decodeStringLiteral(token->text);
                    if (!text.has_value())
                    {
                        // Escape and termination problems were reported while lexing.
                        return makeError(span);
                    }
                    Expression expression;
                    expression.kind = ExpressionKind::String;
                    expression.text = *text;
                    expression.span = span;
                    return expression;
                }

                if (token->kind == TokenKind::RealLiteral)
                {
                    const auto value = frontend::decodeRealLiteral(token->text);
                    if (!value.has_value())
                    {
                        m_diagnostics.error("SASM-E2217", "Real literal '" + token->text + "' is out of range.", span);
                        return makeError(span);
                    }
                    return makeLiteral({static_cast<std::int32_t>(*value), ValueKind::Real}, span);
                }

                const auto value = frontend::decodeIntegerLiteral(token->text);
                if (!value.has_value())
                {
                    m_diagnostics.error("SASM-E2217", "Integer literal '" + token->text + "' does not fit in 32 bits.", span);
                    return makeError(span);
                }
                // Values above i32 keep their bit pattern, so 0xffffffff reads as -1.
                return makeLiteral({static_cast<std::int32_t>(static_cast<std::uint32_t>(*value)), ValueKind::Integer}, span);
            }

            Expression convertRegister(const SyntaxNode& node, SourceSpan span)
            {
                const Token* token = node.firstSignificantToken();
                if (token == nullptr)
                {
                    return makeError(span);
                }

                if (m_lookup.constantContext)
                {
                    m_diagnostics.error("SASM-E2215",
                        "Register '" + token->text + "' cannot be used in a constant definition.", span);
                    return makeError(span);
                }

                std::optional<Register> reg;
                if (m_lookup.aliases != nullptr)
                {
                    const auto found = m_lookup.aliases->find(token->text);
                    if (found != m_lookup.aliases->end())
                    {
                        reg = found->second;
                    }
                }
                if (!reg.has_value() && m_lookup.reg && m_lookup.reg(token->text, span, reg))
                {
                    if (!reg.has_value())
                    {
                        return makeError(span);
                    }
                }
                if (!reg.has_value())
                {
                    reg = Register::parse(token->text);
                }
                if (!reg.has_value())
                {
                    m_diagnostics.error("SASM-E2202", "Undefined register alias '" + token->text + "'.", span);
                    return makeError(span);
                }

                Expression expression;
                expression.kind = ExpressionKind::Register;
                expression.reg = *reg;
                expression.text = token->text;
                expression.span = span;
                return expression;
            }

            Expression convertName(const SyntaxNode& node, SourceSpan span)
            {
                const Token* token = node.firstSignificantToken();
                if (token == nullptr)
                {
                    return makeError(span);
                }

                std::optional<ConstantValue> value;
                if (m_lookup.value && m_lookup.value(token->text, span, value))
                {
                    return value.has_value() ? makeLiteral(*value, span) : makeError(span);
                }

                if (m_lookup.scope != nullptr)
                {
                    if (const Symbol* symbol = m_lookup.scope->findSymbol(token->text))
                    {
                        Expression expression;
                        expression.kind = ExpressionKind::CodeAddress;
                        expression.text = symbol->name;
                        expression.symbolKind = symbol->kind;
                        expression.parameterCount = symbol->parameterCount;
                        expression.span = span;
                        return expression;
                    }
                }

                m_diagnostics.error("SASM-E2201", "Undefined symbol '" + token->text + "'.", span);
                return makeError(span);
            }

            Expression convertUnary(const SyntaxNode& node, SourceSpan span)
            {
                const Token* op = firstOperatorToken(node);
                const auto children = node.childNodes();
                if (op == nullptr || children.empty())
                {
                    return makeError(span);
                }

                Expression expression;
                expression.kind = ExpressionKind::Unary;
                expression.span = span;
                expression.unaryOperator = op->kind == TokenKind::Minus ? UnaryOperator::Negate
                    : op->kind == TokenKind::Tilde ? UnaryOperator::BitwiseNot
                    : UnaryOperator::LogicalNot;
                expression.operands.push_back(convert(*children.front()));
                return expression;
            }

            Expression convertBinary(const SyntaxNode& node, SourceSpan span)
            {
                const Token* op = firstOperatorToken(node);
                const auto children = node.childNodes();
                const auto binary = op != nullptr ? binaryOperatorFor(op->kind) : std::nullopt;
                if (!binary.has_value() || children.size() != 2)
                {
                    return makeError(span);
                }

                Expression expression;
                expression.kind = ExpressionKind::Binary;
                expression.span = span;
                expression.binaryOperator = *binary;
                expression.operands.push_back(convert(*children[0]));
                expression.operands.push_back(convert(*children[1]));
                return expression;
            }

            Expression convertCall(const SyntaxNode& node, SourceSpan span)
            {
                const Token* callee = node.firstToken(TokenKind::Identifier);
                if (callee == nullptr)
                {
                    return makeError(span);
                }

                const auto intrinsic = findIntrinsic(callee->text);
                if (!intrinsic.has_value())
                {
                    m_diagnostics.error("SASM-E2204", "Unknown intrinsic function '" + callee->text + "'.", span);
                    return makeError(span);
                }

                Expression expression;
                expression.kind = ExpressionKind::Call;
                expression.intrinsic = *intrinsic;
                expression.text = callee->text;
                expression.span = span;
                for (const SyntaxNode* argument : node.childNodes())
                {
                    expression.operands.push_back(convert(*argument));
                }
                return expression;
            }

        private:
            NameLookup m_lookup;
            DiagnosticBag& m_diagnostics;
        };

        const Token* nameToken(const SyntaxNode& node, TokenKind kind)
        {
            return node.firstToken(kind);
        }

        std::size_t parameterCountOf(const SyntaxNode& function)
        {
            const SyntaxNode* list = function.firstChild(SyntaxKind::ParameterList);
            if (list == nullptr)
            {
                return 0;
            }

            std::size_t count = 0;
            for (const Token* token : list->tokens())
            {
                if (token->kind == TokenKind::Register)
                {
                    ++count;
                }
            }
            return count;
        }

        Diagnostic& reportDuplicate(DiagnosticBag& diagnostics, const std::string& code, const std::string& name,
                                    SourceSpan span, SourceSpan previous)
        {
            Diagnostic& diagnostic = diagnostics.error(code, "Duplicate declaration of '" + name + "'.", span);
            diagnostic.secondary.push_back({previous, "first declared here"});
            return diagnostic;
        }
    } // namespace

    Collector::Collector(const std::vector<SegmentTree>& segments)
        : m_segments(segments)
    {
    }

    const std::vector<Diagnostic>& Collector::diagnostics() const noexcept
    {
        return m_diagnostics.all();
    }

    void Collector::declare(Symbol symbol)
    {
        const std::string name = symbol.name;
        const SourceSpan span = symbol.span;
        if (const Symbol* previous = m_scope.declareSymbol(std::move(symbol)))
        {
            reportDuplicate(m_diagnostics, "SASM-E2200", name, span, previous->span);
        }
    }

    void Collector::declareBodyLabels(const SyntaxNode& body, SourceLocation origin)
    {
        for (const SyntaxNode* child : body.childNodes())
        {
            if (child->kind() != SyntaxKind::Label)
            {
                continue;
            }
            if (const Token* name = nameToken(*child, TokenKind::Identifier))
            {
                declare(Symbol{name->text, SymbolKind::Label, 0, common::rebase(name->span, origin)});
            }
        }
    }

    void Collector::recordDefinition(const SyntaxNode& node, SourceLocation origin)
    {
        const auto tokens = node.tokens();
        if (tokens.size() < 2 || (tokens[1]->kind != TokenKind::Identifier && tokens[1]->kind != TokenKind::Register))
        {
            return;
        }

        const Token& name = *tokens[1];
        PendingDefinition definition;
        definition.name = name.text;
        definition.isRegister = name.kind == TokenKind::Register;
        definition.span = common::rebase(name.span, origin);
        definition.origin = origin;
        const auto children = node.childNodes();
        definition.value = children.empty() ? nullptr : children.front();

        if (definition.isRegister && Register::parse(definition.name).has_value())
        {
            m_diagnostics.error("SASM-E2216", "Builtin register '" + definition.name + "' cannot be redefined.", definition.span);
            return;
        }

        const auto existing = m_definitionIndex.find(definition.name);
        if (existing != m_definitionIndex.end())
        {
            reportDuplicate(m_diagnostics, "SASM-E2205", definition.name, definition.span, m_definitions[existing->second].span);
            return;
        }

        m_definitionIndex.emplace(definition.name, m_definitions.size());
        m_definitions.push_back(std::move(definition));
    }

    bool Collector::enter(PendingDefinition& definition, SourceSpan useSpan)
    {
        if (definition.state == PendingDefinition::State::Visiting)
        {
            Diagnostic& diagnostic = m_diagnostics.error("SASM-E2213", "Definition of '" + definition.name + "' refers to itself.", useSpan);
            diagnostic.secondary.push_back({definition.span, "defined here"});
            return false;
        }
        definition.state = PendingDefinition::State::Visiting;
        return true;
    }

    std::optional<ConstantValue> Collector::evaluateValue(PendingDefinition& definition, SourceSpan useSpan)
    {
        if (definition.state == PendingDefinition::State::Done)
        {
            return definition.constant;
        }
        if (!enter(definition, useSpan))
        {
            return std::nullopt;
        }

        if (definition.value != nullptr)
        {
            NameLookup lookup;
            lookup.scope = &m_scope;
            lookup.constantContext = true;
            lookup.origin = definition.origin;
            lookup.value = [this](const std::string& name, SourceSpan span, std::optional<ConstantValue>& out) {
                const auto found = m_definitionIndex.find(name);
                if (found == m_definitionIndex.end() || m_definitions[found->second].isRegister)
                {
                    return false;
                }
                out = evaluateValue(m_definitions[found->second], span);
                return true;
            };

            ExpressionConverter converter{std::move(lookup), m_diagnostics};
            const Expression expression = converter.convert(*definition.value);
            if (expression.kind != ExpressionKind::Error)
            {
                definition.constant = evaluateConstant(expression, m_diagnostics);
            }
        }

        definition.state = PendingDefinition::State::Done;
        return definition.constant;
    }

    std::optional<Register> Collector::evaluateRegister(PendingDefinition& definition, SourceSpan useSpan)
    {
        if (definition.state == PendingDefinition::State::Done)
        {
            return definition.reg;
        }
        if (!enter(definition, useSpan))
        {
            return std::nullopt;
        }

        const SyntaxNode* value = definition.value;
        const Token* token = value != nullptr && value->kind() == SyntaxKind::RegisterExpr ? value->firstSignificantToken() : nullptr;
        if (token == nullptr)
        {
            if (value != nullptr)
            {
                m_diagnostics.error("SASM-E2216", "Register alias '" + definition.name + "' must name a register.",
                    common::rebase(value->span(), definition.origin));
            }
        }
        else
        {
            const SourceSpan span = common::rebase(token->span, definition.origin);
            const auto found = m_definitionIndex.find(token->text);
            if (found != m_definitionIndex.end() && m_definitions[found->second].isRegister)
            {
                definition.reg = evaluateRegister(m_definitions[found->second], span);
            }
            else if (const auto builtin = Register::parse(token->text))
            {
                definition.reg = builtin;
            }
            else
            {
                m_diagnostics.error("SASM-E2202", "Undefined register alias '" + token->text + "'.", span);
            }
        }

        definition.state = PendingDefinition::State::Done;
        return definition.reg;
    }

    GlobalScope Collector::collect()
    {
        for (const auto& segment : m_segments)
        {
            if (segment.root == nullptr)
            {
                continue;
            }

            for (const SyntaxNode* item : segment.root->childNodes())
            {
                switch (item->kind())
                {
                case SyntaxKind::Label:
                    if (const Token* name = nameToken(*item, TokenKind::Identifier))
                    {
                        declare(Symbol{name->text, SymbolKind::Label, 0, common::rebase(name->span, segment.origin)});
                    }
                    break;
                case SyntaxKind::FunctionDef:
                    if (const Token* name = nameToken(*item, TokenKind::Identifier))
                    {
                        declare(Symbol{name->text, SymbolKind::Function, parameterCountOf(*item), common::rebase(name->span, segment.origin)});
                    }
                    declareBodyLabels(*item, segment.origin);
                    break;
                case SyntaxKind::SubroutineDef:
                    if (const Token* name = nameToken(*item, TokenKind::Identifier))
                    {
                        declare(Symbol{name->text, SymbolKind::Subroutine, 0, common::rebase(name->span, segment.origin)});
                    }
                    declareBodyLabels(*item, segment.origin);
                    break;
                case SyntaxKind::Definition:
                    recordDefinition(*item, segment.origin);
                    break;
                default:
                    break;
                }
            }
        }

        for (const auto& definition : m_definitions)
        {
            if (!definition.isRegister)
            {
                if (const Symbol* symbol = m_scope.findSymbol(definition.name))
                {
                    reportDuplicate(m_diagnostics, "SASM-E2205", definition.name, definition.span, symbol->span);
                }
            }
        }

        for (auto& definition : m_definitions)
        {
            if (definition.isRegister)
            {
                if (const auto reg = evaluateRegister(definition, definition.span))
                {
                    m_scope.defineRegister(definition.name, *reg);
                }
            }
            else if (const auto value = evaluateValue(definition, definition.span))
            {
                m_scope.defineValue(definition.name, *value);
            }
        }

        return std::move(m_scope);
    }

    Resolver::Resolver(const GlobalScope& scope, const SyntaxNode& root)
        : m_scope(scope)
        , m_root(root)
    {
    }

    const std::vector<Diagnostic>& Resolver::diagnostics() const noexcept
    {
        return m_diagnostics.all();
    }

    std::vector<Unit> Resolver::resolve()
    {
        std::vector<Unit> units;
        bool inScript = false;

        for (const SyntaxNode* item : m_root.childNodes())
        {
            switch (item->kind())
            {
            case SyntaxKind::Label:
            {
                Unit unit;
                unit.kind = UnitKind::Script;
                unit.span = item->span();
                if (const Token* name = nameToken(*item, TokenKind::Identifier))
                {
                    unit.name = name->text;
                }
                units.push_back(std::move(unit));
                inScript = true;
                break;
            }
            case SyntaxKind::Instruction:
                if (!inScript)
                {
                    m_diagnostics.error("SASM-E2203", "Instruction does not follow any label.", item->span());
                    break;
                }
                units.back().statements.push_back(resolveInstruction(*item, nullptr));
                units.back().span = common::mergeSpans(units.back().span, item->span());
                break;
            case SyntaxKind::FunctionDef:
                units.push_back(resolveProcedure(*item, UnitKind::Function));
                inScript = false;
                break;
            case SyntaxKind::SubroutineDef:
                units.push_back(resolveProcedure(*item, UnitKind::Subroutine));
                inScript = false;
                break;
            case SyntaxKind::Definition:
                inScript = false;
                break;
            default:
                break;
            }
        }

        return units;
    }

    Unit Resolver::resolveProcedure(const SyntaxNode& node, UnitKind kind)
    {
        Unit unit;
        unit.kind = kind;
        unit.span = node.span();
        if (const Token* name = nameToken(node, TokenKind::Identifier))
        {
            unit.name = name->text;
        }

        // Aliases live only as long as this function's resolution.
        AliasMap aliases;
        if (const SyntaxNode* parameters = node.firstChild(SyntaxKind::ParameterList))
        {
            bindParameters(*parameters, unit, aliases);
        }
        if (const SyntaxNode* preserved = node.firstChild(SyntaxKind::PreservedRangeList))
        {
            bindPreserved(*preserved, unit, aliases);
        }

        resolveBody(node, unit, &aliases);
        return unit;
    }

    void Resolver::bindParameters(const SyntaxNode& list, Unit& unit, AliasMap& aliases)
    {
        std::unordered_map<std::string, SourceSpan> seen;
        for (const Token* token : list.tokens())
        {
            if (token->kind != TokenKind::Register)
            {
                continue;
            }

            const std::size_t position = unit.parameterCount++;
            if (Register::parse(token->text).has_value())
            {
                m_diagnostics.error("SASM-E2208", "Parameter alias '" + token->text + "' shadows a builtin register.", token->span);
                continue;
            }

            const auto previous = seen.find(token->text);
            if (previous != seen.end())
            {
                reportDuplicate(m_diagnostics, "SASM-E2206", token->text, token->span, previous->second);
                continue;
            }
            seen.emplace(token->text, token->span);

            if (position >= common::kArgumentRegisterCount)
            {
                m_diagnostics.error("SASM-E2207",
                    "Function '" + unit.name + "' declares more than " + std::to_string(common::kArgumentRegisterCount)
                        + " parameters.",
                    token->span);
                continue;
            }

            const auto reg = Register::argument(static_cast<std::uint32_t>(position));
            if (reg.has_value())
            {
                aliases.emplace(token->text, *reg);
            }
        }
    }

    std::optional<Register> Resolver::resolvePreservedEndpoint(const Token& token, const AliasMap& aliases)
    {
        if (aliases.count(token.text) != 0)
        {
            m_diagnostics.error("SASM-E2209", "Preserved register '" + token.text + "' collides with a parameter alias.", token.span);
            return std::nullopt;
        }

        auto reg = m_scope.findRegister(token.text);
        if (!reg.has_value())
        {
            reg = Register::parse(token.text);
        }
        if (!reg.has_value())
        {
            m_diagnostics.error("SASM-E2202", "Undefined register alias '" + token.text + "'.", token.span);
            return std::nullopt;
        }
        if (reg->isArgument())
        {
            m_diagnostics.error("SASM-E2210", "Preserved ranges may not contain argument register '" + token.text + "'.", token.span);
            return std::nullopt;
        }
        return reg;
    }

    void Resolver::bindPreserved(const SyntaxNode& list, Unit& unit, const AliasMap& aliases)
    {
        std::set<Register> seen;
        for (const SyntaxNode* range : list.childNodes())
        {
            std::vector<const Token*> endpoints;
            for (const Token* token : range->tokens())
            {
                if (token->kind == TokenKind::Register)
                {
                    endpoints.push_back(token);
                }
            }
            if (endpoints.empty())
            {
                continue;
            }

            const auto first = resolvePreservedEndpoint(*endpoints.front(), aliases);
            // A single register is both ends of its range.
            const auto last = endpoints.size() > 1 ? resolvePreservedEndpoint(*endpoints.back(), aliases) : first;
            if (!first.has_value() || !last.has_value())
            {
                continue;
            }
            if (last->index() < first->index())
            {
                m_diagnostics.error("SASM-E2211", "Preserved range ends before it starts.", range->span());
                continue;
            }

            for (std::uint32_t index = first->index(); index <= last->index(); ++index)
            {
                const auto reg = Register::value(index);
                if (!reg.has_value())
                {
                    continue;
                }
                if (!seen.insert(*reg).second)
                {
                    m_diagnostics.error("SASM-E2212", "Register '" + reg->toString() + "' is preserved twice.", range->span());
                    continue;
                }
                unit.preserved.push_back(*reg);
            }
        }
    }

    void Resolver::resolveBody(const SyntaxNode& body, Unit& unit, const AliasMap* aliases)
    {
        for (const SyntaxNode* child : body.childNodes())
        {
            if (child->kind() == SyntaxKind::Label)
            {
                Statement statement;
                statement.kind = StatementKind::Label;
                statement.span = child->span();
                if (const Token* name = nameToken(*child, TokenKind::Identifier))
                {
                    statement.name = name->text;
                }
                unit.statements.push_back(std::move(statement));
            }
            else if (child->kind() == SyntaxKind::Instruction)
            {
                unit.statements.push_back(resolveInstruction(*child, aliases));
            }
        }
    }

    Statement Resolver::resolveInstruction(const SyntaxNode& node, const AliasMap* aliases)
    {
        Statement statement;
        statement.kind = StatementKind::Instruction;
        statement.span = node.span();
        if (const Token* mnemonic = node.firstSignificantToken())
        {
            statement.name = mnemonic->text;
        }

        const SyntaxNode* arguments = node.firstChild(SyntaxKind::ArgumentList);
        if (arguments == nullptr)
        {
            return statement;
        }

        NameLookup lookup;
        lookup.scope = &m_scope;
        lookup.aliases = aliases;
        lookup.value = [this](const std::string& name, SourceSpan, std::optional<ConstantValue>& out) {
            out = m_scope.findValue(name);
            return out.has_value();
        };
        lookup.reg = [this](const std::string& name, SourceSpan, std::optional<Register>& out) {
            out = m_scope.findRegister(name);
            return out.has_value();
        };

        ExpressionConverter converter{std::move(lookup), m_diagnostics};
        for (const SyntaxNode* operand : arguments->childNodes())
        {
            statement.operands.push_back(converter.convertOperand(*operand));
        }
        return statement;
    }

    std::string_view toString(Intrinsic intrinsic)
    {
        switch (intrinsic)
        {
        case Intrinsic::Abs: return "abs";
        case Intrinsic::Sin: return "sin";
        case Intrinsic::Cos: return "cos";
        case Intrinsic::Tan: return "tan";
        case Intrinsic::Min: return "min";
        case Intrinsic::Max: return "max";
        case Intrinsic::Select: return "select";
        case Intrinsic::NonZero: return "nonzero";
        }
        return "intrinsic";
    }
} // namespace sceneasm::hir
