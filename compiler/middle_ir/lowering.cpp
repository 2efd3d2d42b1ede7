#include "lowering.hpp"

#include "builder.hpp"
#include "opcodes.hpp"
#include "../high_level_ir/expression_lowering.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace sceneasm::mir
{
    namespace
    {
        using common::DiagnosticBag;

        constexpr std::size_t kMaximumListLength = 0xff;
        constexpr std::size_t kBitmaskSlots = 8;
        constexpr std::int32_t kMaximumCaseKey = 0xfffe;
        constexpr std::int32_t kMaximumMessageId = 0xffffff;

        struct ConditionShape
        {
            Condition condition{Condition::Equal};
            bool negated{false};
            const hir::Expression* left{nullptr};
            const hir::Expression* right{nullptr};
        };

        std::optional<Condition> comparisonCondition(hir::BinaryOperator op)
        {
            switch (op)
            {
            case hir::BinaryOperator::Equal: return Condition::Equal;
            case hir::BinaryOperator::NotEqual: return Condition::NotEqual;
            case hir::BinaryOperator::GreaterEqual: return Condition::GreaterOrEqual;
            case hir::BinaryOperator::Greater: return Condition::Greater;
            case hir::BinaryOperator::LessEqual: return Condition::LowerOrEqual;
            case hir::BinaryOperator::Less: return Condition::Lower;
            default: return std::nullopt;
            }
        }

        bool isLiteralOne(const hir::Expression& expression)
        {
            return expression.kind == hir::ExpressionKind::Literal
                && expression.literal.kind == hir::ValueKind::Integer
                && expression.literal.value == 1;
        }

        bool isListKind(OperandKind kind)
        {
            return kind == OperandKind::NumberList || kind == OperandKind::RegisterList || kind == OperandKind::ByteList;
        }

        class UnitLowerer
        {
        public:
            UnitLowerer(const hir::Unit& source, DiagnosticBag& diagnostics)
                : m_source(source)
                , m_diagnostics(diagnostics)
                , m_lowerer(diagnostics)
                , m_builder(m_unit)
            {
            }

            Unit run()
            {
                m_unit.name = m_source.name;
                m_unit.span = m_source.span;
                switch (m_source.kind)
                {
                case hir::UnitKind::Script: m_unit.kind = UnitKind::Script; break;
                case hir::UnitKind::Function: m_unit.kind = UnitKind::Function; break;
                case hir::UnitKind::Subroutine: m_unit.kind = UnitKind::Subroutine; break;
                }

                m_builder.placeLabel(m_source.name, m_source.span);
                if (m_source.kind == hir::UnitKind::Function && !m_source.preserved.empty())
                {
                    Instruction& push = m_builder.appendInstruction(Opcode::Push, 0, m_source.span);
                    Operand saved;
                    saved.kind = OperandKind::NumberList;
                    saved.span = m_source.span;
                    for (const Register reg : m_source.preserved)
                    {
                        saved.numbers.push_back(NumberSpec::makeRegister(reg));
                    }
                    push.operands.push_back(std::move(saved));
                }

                bool endsFlow = false;
                for (const auto& statement : m_source.statements)
                {
                    if (statement.kind == hir::StatementKind::Label)
                    {
                        m_builder.placeLabel(statement.name, statement.span);
                        endsFlow = false;
                        continue;
                    }
                    endsFlow = lowerInstruction(statement);
                }

                if (!endsFlow)
                {
                    if (m_source.kind == hir::UnitKind::Function)
                    {
                        emitReturn(m_source.span);
                    }
                    else if (m_source.kind == hir::UnitKind::Subroutine)
                    {
                        m_builder.appendInstruction(Opcode::Retsub, 0, m_source.span);
                    }
                }

                return std::move(m_unit);
            }

        private:
            // Returns whether the statement leaves the unit's control flow.
            bool lowerInstruction(const hir::Statement& statement)
            {
                const OpcodeInfo* info = findByMnemonic(statement.name);
                if (info == nullptr)
                {
                    m_diagnostics.error("SASM-E2310", "Unknown instruction '" + statement.name + "'.", statement.span);
                    return false;
                }

                if (info->opcode == Opcode::Return && m_source.kind == hir::UnitKind::Function)
                {
                    emitReturn(statement.span);
                    return true;
                }

                std::vector<const hir::Operand*> positional;
                std::vector<const hir::Operand*> flags;
                for (const auto& operand : statement.operands)
                {
                    (operand.kind == hir::OperandKind::Flag ? flags : positional).push_back(&operand);
                }

                std::vector<std::pair<const OperandSpec*, SourceSpan>> setFlags;
                bool ok = true;
                for (const hir::Operand* flag : flags)
                {
                    const auto spec = std::find_if(info->operands.begin(), info->operands.end(), [&](const OperandSpec& candidate) {
                        return candidate.kind == OperandKind::Flag && candidate.flagName == flag->flag;
                    });
                    if (spec == info->operands.end())
                    {
                        m_diagnostics.error("SASM-E2311",
                            "Instruction '" + statement.name + "' does not accept flag '" + flag->flag + "'.", flag->span);
                        ok = false;
                        continue;
                    }
                    const bool duplicate = std::any_of(setFlags.begin(), setFlags.end(), [&](const auto& entry) {
                        return entry.first == &*spec;
                    });
                    if (duplicate)
                    {
                        m_diagnostics.error("SASM-E2312", "Flag '" + flag->flag + "' is given more than once.", flag->span);
                        ok = false;
                        continue;
                    }
                    setFlags.emplace_back(&*spec, flag->span);
                }
                if (!ok)
                {
                    return endsControlFlow(info->opcode);
                }

                Instruction instruction;
                instruction.opcode = info->opcode;
                instruction.subtype = info->subtype;
                instruction.span = statement.span;

                switch (info->layout)
                {
                case OperandLayout::TypedOptional:
                    ok = lowerTypedOptional(*info, statement, positional, instruction);
                    break;
                case OperandLayout::Conditional:
                    ok = lowerConditional(statement, positional, instruction);
                    break;
                case OperandLayout::Plain:
                    ok = lowerPlain(*info, statement, positional, setFlags, instruction);
                    break;
                }

                if (ok && info->opcode == Opcode::Call)
                {
                    ok = checkArity(positional, instruction);
                }
                if (ok)
                {
                    Instruction& emitted = m_builder.appendInstruction(instruction.opcode, instruction.subtype, instruction.span);
                    emitted.operands = std::move(instruction.operands);
                }
                return endsControlFlow(info->opcode);
            }

            bool reportOperandCount(const hir::Statement& statement, std::size_t expected, std::size_t found)
            {
                m_diagnostics.error("SASM-E2313",
                    "Instruction '" + statement.name + "' expects " + std::to_string(expected) + " operand(s), found "
                        + std::to_string(found) + ".",
                    statement.span);
                return false;
            }

            bool lowerTypedOptional(const OpcodeInfo& info, const hir::Statement& statement,
                                    const std::vector<const hir::Operand*>& positional, Instruction& instruction)
            {
                const std::size_t full = info.operands.size();
                if (positional.size() != full && positional.size() != full - 1)
                {
                    return reportOperandCount(statement, full, positional.size());
                }
                if (positional.size() == full)
                {
                    instruction.subtype = static_cast<std::uint8_t>(instruction.subtype | kExplicitOperandBit);
                }

                bool ok = true;
                for (std::size_t index = 0; index < positional.size(); ++index)
                {
                    const OperandKind kind = index == 0 ? OperandKind::Register : OperandKind::Number;
                    if (auto operand = lowerSingle(kind, *positional[index]))
                    {
                        instruction.operands.push_back(std::move(*operand));
                    }
                    else
                    {
                        ok = false;
                    }
                }
                return ok;
            }

            bool lowerConditional(const hir::Statement& statement, const std::vector<const hir::Operand*>& positional,
                                  Instruction& instruction)
            {
                if (positional.size() != 2)
                {
                    return reportOperandCount(statement, 2, positional.size());
                }
                if (positional[0]->kind != hir::OperandKind::Expression)
                {
                    m_diagnostics.error("SASM-E2324", "Expected a condition.", positional[0]->span);
                    return false;
                }

                ConditionShape shape;
                if (!analyzeCondition(positional[0]->expression, false, shape))
                {
                    return false;
                }

                const auto left = lowerNumber(*shape.left);
                const auto right = lowerNumber(*shape.right);
                auto target = lowerSingle(OperandKind::Target, *positional[1]);
                if (!left.has_value() || !right.has_value() || !target.has_value())
                {
                    return false;
                }

                instruction.subtype = static_cast<std::uint8_t>(shape.condition);
                if (shape.negated)
                {
                    instruction.subtype = static_cast<std::uint8_t>(instruction.subtype | kNegatedConditionBit);
                }
                instruction.operands.push_back(makeNumberOperand(*left, shape.left->span));
                instruction.operands.push_back(makeNumberOperand(*right, shape.right->span));
                instruction.operands.push_back(std::move(*target));
                return true;
            }

            bool analyzeCondition(const hir::Expression& expression, bool negated, ConditionShape& shape)
            {
                if (expression.kind == hir::ExpressionKind::Error)
                {
                    return false;
                }
                if (expression.kind == hir::ExpressionKind::Unary && expression.unaryOperator == hir::UnaryOperator::LogicalNot)
                {
                    return analyzeCondition(expression.operands.front(), !negated, shape);
                }
                if (expression.kind == hir::ExpressionKind::Binary)
                {
                    shape.negated = negated;
                    shape.left = &expression.operands[0];
                    shape.right = &expression.operands[1];
                    if (const auto condition = comparisonCondition(expression.binaryOperator))
                    {
                        shape.condition = *condition;
                        return true;
                    }
                    if (expression.binaryOperator == hir::BinaryOperator::BitwiseAnd)
                    {
                        const hir::Expression& mask = expression.operands[1];
                        if (mask.kind == hir::ExpressionKind::Binary && mask.binaryOperator == hir::BinaryOperator::ShiftLeft
                            && isLiteralOne(mask.operands[0]))
                        {
                            shape.condition = Condition::BitSet;
                            shape.right = &mask.operands[1];
                        }
                        else
                        {
                            shape.condition = Condition::AndNotZero;
                        }
                        return true;
                    }
                }

                m_diagnostics.error("SASM-E2322",
                    "Unsupported jump condition; expected a comparison, 'a & b' or 'a & (1 << b)'.", expression.span);
                return false;
            }

            bool lowerPlain(const OpcodeInfo& info, const hir::Statement& statement,
                            const std::vector<const hir::Operand*>& positional,
                            const std::vector<std::pair<const OperandSpec*, SourceSpan>>& setFlags, Instruction& instruction)
            {
                std::size_t required = 0;
                bool hasTailList = false;
                for (const auto& spec : info.operands)
                {
                    if (spec.kind == OperandKind::Flag)
                    {
                        continue;
                    }
                    if (isListKind(spec.kind))
                    {
                        hasTailList = true;
                        continue;
                    }
                    ++required;
                }
                if (positional.size() < required || (!hasTailList && positional.size() > required))
                {
                    return reportOperandCount(statement, required, positional.size());
                }

                bool ok = true;
                std::size_t next = 0;
                for (const auto& spec : info.operands)
                {
                    if (spec.kind == OperandKind::Flag)
                    {
                        const bool present = std::any_of(setFlags.begin(), setFlags.end(), [&](const auto& entry) {
                            return entry.first == &spec;
                        });
                        const std::uint8_t value = present ? static_cast<std::uint8_t>(spec.flagDefault == 0 ? 1 : 0) : spec.flagDefault;
                        instruction.operands.push_back(makeByteOperand(OperandKind::Flag, value, statement.span));
                        continue;
                    }

                    if (isListKind(spec.kind))
                    {
                        auto list = lowerList(spec.kind, positional, next, statement.span);
                        next = positional.size();
                        if (list.has_value())
                        {
                            instruction.operands.push_back(std::move(*list));
                        }
                        else
                        {
                            ok = false;
                        }
                        continue;
                    }

                    if (auto operand = lowerSingle(spec.kind, *positional[next++]))
                    {
                        instruction.operands.push_back(std::move(*operand));
                    }
                    else
                    {
                        ok = false;
                    }
                }
                return ok;
            }

            std::optional<Operand> lowerList(OperandKind kind, const std::vector<const hir::Operand*>& positional,
                                             std::size_t first, SourceSpan span)
            {
                Operand list;
                list.kind = kind;
                list.span = span;

                const std::size_t count = positional.size() - first;
                if (count > kMaximumListLength)
                {
                    m_diagnostics.error("SASM-E2318", "Operand list has " + std::to_string(count) + " entries; at most 255 fit.", span);
                    return std::nullopt;
                }

                bool ok = true;
                for (std::size_t index = first; index < positional.size(); ++index)
                {
                    const hir::Operand& operand = *positional[index];
                    if (!requireExpression(operand))
                    {
                        ok = false;
                        continue;
                    }

                    if (kind == OperandKind::NumberList)
                    {
                        const auto number = lowerNumber(operand.expression);
                        ok = ok && number.has_value();
                        if (number.has_value())
                        {
                            list.numbers.push_back(*number);
                        }
                    }
                    else if (kind == OperandKind::RegisterList)
                    {
                        const auto reg = lowerRegister(operand.expression);
                        ok = ok && reg.has_value();
                        if (reg.has_value())
                        {
                            list.registers.push_back(*reg);
                        }
                    }
                    else
                    {
                        const auto value = lowerBounded(operand.expression, 0, 0xff, "SASM-E2316", "a byte constant 0..255");
                        ok = ok && value.has_value();
                        if (value.has_value())
                        {
                            list.bytes.push_back(static_cast<std::uint8_t>(*value));
                        }
                    }
                }
                if (!ok)
                {
                    return std::nullopt;
                }
                return list;
            }

            std::optional<Operand> lowerSingle(OperandKind kind, const hir::Operand& operand)
            {
                switch (kind)
                {
                case OperandKind::BitmaskNumbers:
                    return lowerBitmask(operand);
                case OperandKind::TargetTable:
                    return lowerTargetTable(operand);
                case OperandKind::PaddedNumberTable:
                    return lowerPaddedTable(operand);
                default:
                    break;
                }

                if (!requireExpression(operand))
                {
                    return std::nullopt;
                }
                const hir::Expression& expression = operand.expression;

                switch (kind)
                {
                case OperandKind::Number:
                    if (const auto number = lowerNumber(expression))
                    {
                        return makeNumberOperand(*number, expression.span);
                    }
                    return std::nullopt;
                case OperandKind::Register:
                    if (const auto reg = lowerRegister(expression))
                    {
                        return makeRegisterOperand(*reg, expression.span);
                    }
                    return std::nullopt;
                case OperandKind::Byte:
                    if (const auto value = lowerBounded(expression, 0, 0xff, "SASM-E2316", "a byte constant 0..255"))
                    {
                        return makeByteOperand(OperandKind::Byte, static_cast<std::uint32_t>(*value), expression.span);
                    }
                    return std::nullopt;
                case OperandKind::MessageId:
                    if (const auto value = lowerBounded(expression, 0, kMaximumMessageId, "SASM-E2325", "a message id 0..0xffffff"))
                    {
                        return makeByteOperand(OperandKind::MessageId, static_cast<std::uint32_t>(*value), expression.span);
                    }
                    return std::nullopt;
                case OperandKind::String:
                    if (expression.kind == hir::ExpressionKind::String)
                    {
                        Operand result;
                        result.kind = OperandKind::String;
                        result.text = expression.text;
                        result.span = expression.span;
                        return result;
                    }
                    if (expression.kind != hir::ExpressionKind::Error)
                    {
                        m_diagnostics.error("SASM-E2317", "Expected a string.", expression.span);
                    }
                    return std::nullopt;
                case OperandKind::Target:
                    if (auto target = lowerTarget(expression))
                    {
                        return makeTargetOperand(std::move(*target));
                    }
                    return std::nullopt;
                case OperandKind::Expression:
                {
                    const hir::LoweredValue value = m_lowerer.lower(expression);
                    if (!value.valid)
                    {
                        return std::nullopt;
                    }
                    Operand result;
                    result.kind = OperandKind::Expression;
                    result.terms = value.toTerms();
                    result.span = expression.span;
                    return result;
                }
                default:
                    break;
                }
                return std::nullopt;
            }

            bool requireExpression(const hir::Operand& operand)
            {
                if (operand.kind == hir::OperandKind::Expression)
                {
                    return true;
                }
                m_diagnostics.error("SASM-E2324",
                    operand.kind == hir::OperandKind::Array ? "An array is not allowed here." : "A jump table is not allowed here.",
                    operand.span);
                return false;
            }

            std::optional<NumberSpec> lowerNumber(const hir::Expression& expression)
            {
                const hir::LoweredValue value = m_lowerer.lower(expression);
                if (!value.valid)
                {
                    return std::nullopt;
                }
                if (auto number = value.asNumber())
                {
                    return number;
                }
                m_diagnostics.error("SASM-E2314",
                    "Operand must fold to a constant or be a single register; use 'exp' for computed values.", expression.span);
                return std::nullopt;
            }

            std::optional<Register> lowerRegister(const hir::Expression& expression)
            {
                if (expression.kind == hir::ExpressionKind::Register)
                {
                    return expression.reg;
                }
                if (expression.kind != hir::ExpressionKind::Error)
                {
                    m_diagnostics.error("SASM-E2315", "Expected a register.", expression.span);
                }
                return std::nullopt;
            }

            std::optional<std::int32_t> lowerBounded(const hir::Expression& expression, std::int32_t minimum,
                                                     std::int32_t maximum, const char* code, std::string_view what)
            {
                const hir::LoweredValue value = m_lowerer.lower(expression);
                if (!value.valid)
                {
                    return std::nullopt;
                }
                if (!value.isConstant() || *value.constant < minimum || *value.constant > maximum)
                {
                    m_diagnostics.error(code, "Expected " + std::string{what} + ".", expression.span);
                    return std::nullopt;
                }
                return value.constant;
            }

            std::optional<CodeTarget> lowerTarget(const hir::Expression& expression)
            {
                CodeTarget target;
                target.span = expression.span;
                if (expression.kind == hir::ExpressionKind::CodeAddress)
                {
                    target.symbol = expression.text;
                    return target;
                }
                // Absolute addresses above 0x7fffffff arrive as negative literals.
                if (expression.kind == hir::ExpressionKind::Literal && expression.literal.kind == hir::ValueKind::Integer)
                {
                    target.address = static_cast<std::uint32_t>(expression.literal.value);
                    return target;
                }
                if (expression.kind != hir::ExpressionKind::Error)
                {
                    m_diagnostics.error("SASM-E2319", "Expected a label, function or subroutine name, or an address.", expression.span);
                }
                return std::nullopt;
            }

            std::optional<Operand> lowerBitmask(const hir::Operand& operand)
            {
                if (operand.kind != hir::OperandKind::Array || operand.elements.size() > kBitmaskSlots)
                {
                    m_diagnostics.error("SASM-E2323", "Expected an array of at most 8 numbers.", operand.span);
                    return std::nullopt;
                }

                Operand result;
                result.kind = OperandKind::BitmaskNumbers;
                result.span = operand.span;
                bool ok = true;
                for (const auto& element : operand.elements)
                {
                    const auto number = lowerNumber(element);
                    ok = ok && number.has_value();
                    result.numbers.push_back(number.value_or(NumberSpec::makeConstant(0)));
                }
                result.numbers.resize(kBitmaskSlots, NumberSpec::makeConstant(0));
                if (!ok)
                {
                    return std::nullopt;
                }
                return result;
            }

            std::optional<Operand> lowerPaddedTable(const hir::Operand& operand)
            {
                if (operand.kind != hir::OperandKind::Array)
                {
                    m_diagnostics.error("SASM-E2324", "Expected an array of numbers.", operand.span);
                    return std::nullopt;
                }

                Operand result;
                result.kind = OperandKind::PaddedNumberTable;
                result.span = operand.span;
                bool ok = true;
                for (const auto& element : operand.elements)
                {
                    const auto number = lowerNumber(element);
                    ok = ok && number.has_value();
                    if (number.has_value())
                    {
                        result.numbers.push_back(*number);
                    }
                }
                if (!ok)
                {
                    return std::nullopt;
                }
                return result;
            }

            std::optional<Operand> lowerTargetTable(const hir::Operand& operand)
            {
                if (operand.kind != hir::OperandKind::JumpTable)
                {
                    m_diagnostics.error("SASM-E2324", "Expected a jump table '{ key => target, ... }'.", operand.span);
                    return std::nullopt;
                }

                Operand result;
                result.kind = OperandKind::TargetTable;
                result.span = operand.span;
                bool ok = true;
                for (const auto& tableCase : operand.cases)
                {
                    const auto key = lowerBounded(tableCase.key, 0, kMaximumCaseKey, "SASM-E2321", "a case key 0..65534");
                    auto target = lowerTarget(tableCase.target);
                    if (!key.has_value() || !target.has_value())
                    {
                        ok = false;
                        continue;
                    }
                    result.keys.push_back(*key);
                    result.targets.push_back(std::move(*target));
                }
                if (!ok)
                {
                    return std::nullopt;
                }
                return result;
            }

            bool checkArity(const std::vector<const hir::Operand*>& positional, const Instruction& instruction)
            {
                const hir::Expression& callee = positional.front()->expression;
                if (callee.kind != hir::ExpressionKind::CodeAddress || callee.symbolKind != hir::SymbolKind::Function)
                {
                    return true;
                }

                const std::size_t given = instruction.operands.size() > 1 ? instruction.operands[1].numbers.size() : 0;
                if (given == callee.parameterCount)
                {
                    return true;
                }
                m_diagnostics.error("SASM-E2320",
                    "Function '" + callee.text + "' takes " + std::to_string(callee.parameterCount) + " argument(s), "
                        + std::to_string(given) + " given.",
                    callee.span);
                return false;
            }

            void emitReturn(SourceSpan span)
            {
                if (!m_source.preserved.empty())
                {
                    Instruction& pop = m_builder.appendInstruction(Opcode::Pop, 0, span);
                    Operand restored;
                    restored.kind = OperandKind::RegisterList;
                    restored.span = span;
                    restored.registers.assign(m_source.preserved.rbegin(), m_source.preserved.rend());
                    pop.operands.push_back(std::move(restored));
                }
                m_builder.appendInstruction(Opcode::Return, 0, span);
            }

        private:
            const hir::Unit& m_source;
            DiagnosticBag& m_diagnostics;
            hir::ExpressionLowerer m_lowerer;
            Unit m_unit;
            Builder m_builder;
        };
    } // namespace

    LoweringResult lowerFromHir(const hir::Unit& unit)
    {
        DiagnosticBag diagnostics;
        UnitLowerer lowerer{unit, diagnostics};

        LoweringResult result;
        result.unit = lowerer.run();
        result.diagnostics = diagnostics.take();
        return result;
    }
} // namespace sceneasm::mir
