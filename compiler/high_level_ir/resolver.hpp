#pragma once

#include "module.hpp"

#include "../frontend/syntax_tree.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sceneasm::hir
{
    using common::DiagnosticBag;
    using common::SourceLocation;

    struct SegmentTree
    {
        const frontend::SyntaxNode* root{nullptr};
        // Where the segment starts in the file; its tree spans are relative to it.
        SourceLocation origin{};
    };

    // Collection pass: declares every label, function, subroutine and definition of
    // the file, then folds the definitions. Diagnostics carry file coordinates.
    class Collector
    {
    public:
        explicit Collector(const std::vector<SegmentTree>& segments);

        [[nodiscard]] GlobalScope collect();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        struct PendingDefinition
        {
            enum class State : std::uint8_t
            {
                Pending,
                Visiting,
                Done
            };

            std::string name;
            bool isRegister{false};
            const frontend::SyntaxNode* value{nullptr};
            SourceSpan span{};
            SourceLocation origin{};
            State state{State::Pending};
            std::optional<ConstantValue> constant;
            std::optional<Register> reg;
        };

        void declare(Symbol symbol);
        void declareBodyLabels(const frontend::SyntaxNode& body, SourceLocation origin);
        void recordDefinition(const frontend::SyntaxNode& node, SourceLocation origin);
        std::optional<ConstantValue> evaluateValue(PendingDefinition& definition, SourceSpan useSpan);
        std::optional<Register> evaluateRegister(PendingDefinition& definition, SourceSpan useSpan);
        bool enter(PendingDefinition& definition, SourceSpan useSpan);

    private:
        const std::vector<SegmentTree>& m_segments;
        GlobalScope m_scope;
        std::vector<PendingDefinition> m_definitions;
        std::unordered_map<std::string, std::size_t> m_definitionIndex;
        DiagnosticBag m_diagnostics;
    };

    // Linking pass over one segment: binds register aliases, classifies names against
    // the frozen global scope and produces the units the segment defines. Diagnostics
    // stay relative to the segment.
    class Resolver
    {
    public:
        Resolver(const GlobalScope& scope, const frontend::SyntaxNode& root);

        [[nodiscard]] std::vector<Unit> resolve();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        using AliasMap = std::unordered_map<std::string, Register>;

        Unit resolveProcedure(const frontend::SyntaxNode& node, UnitKind kind);
        void bindParameters(const frontend::SyntaxNode& list, Unit& unit, AliasMap& aliases);
        void bindPreserved(const frontend::SyntaxNode& list, Unit& unit, const AliasMap& aliases);
        std::optional<Register> resolvePreservedEndpoint(const frontend::Token& token, const AliasMap& aliases);
        void resolveBody(const frontend::SyntaxNode& body, Unit& unit, const AliasMap* aliases);
        Statement resolveInstruction(const frontend::SyntaxNode& node, const AliasMap* aliases);

    private:
        const GlobalScope& m_scope;
        const frontend::SyntaxNode& m_root;
        DiagnosticBag m_diagnostics;
    };

    [[nodiscard]] std::string_view toString(Intrinsic intrinsic);
} // namespace sceneasm::hir
