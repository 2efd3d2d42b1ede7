#pragma once

#include "../codegen/code_generator.hpp"
#include "../frontend/syntax_tree.hpp"
#include "../high_level_ir/module.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sceneasm::pipeline
{
    using common::Diagnostic;

    struct AssemblyOptions
    {
        std::uint32_t baseAddress{0};
        // Worker threads for code generation; 0 picks the hardware concurrency.
        std::size_t jobs{0};
    };

    struct AssemblyResult
    {
        std::vector<std::uint8_t> code;
        std::uint32_t baseAddress{0};
        std::uint32_t entryAddress{0};
        std::map<std::string, std::uint32_t> symbols;
        // Ordered by source position.
        std::vector<Diagnostic> diagnostics;

        [[nodiscard]] bool succeeded() const noexcept
        {
            return !common::hasErrors(diagnostics);
        }
    };

    struct CacheStatistics
    {
        std::size_t parseHits{0};
        std::size_t parseMisses{0};
        std::size_t codeHits{0};
        std::size_t codeMisses{0};
    };

    // Assembles successive versions of one source file, reusing the parse and the
    // generated code of every segment whose text and visible symbols did not change.
    class CompilationSession
    {
    public:
        explicit CompilationSession(AssemblyOptions options = {});

        [[nodiscard]] AssemblyResult assemble(std::string_view source);

        [[nodiscard]] const CacheStatistics& statistics() const noexcept
        {
            return m_statistics;
        }

        void resetStatistics() noexcept;

    private:
        struct ParsedSegment
        {
            std::string text;
            std::unique_ptr<frontend::SyntaxNode> root;
            std::vector<Diagnostic> diagnostics;
        };

        struct GeneratedSegment
        {
            std::string text;
            std::uint64_t scopeSignature{0};
            std::vector<codegen::EncodedUnit> units;
            // Resolution and lowering diagnostics, relative to the segment.
            std::vector<Diagnostic> diagnostics;
        };

        std::shared_ptr<const ParsedSegment> parseSegment(std::string_view text, std::uint64_t hash);
        static std::shared_ptr<const GeneratedSegment> generateSegment(const hir::GlobalScope& scope,
                                                                       std::shared_ptr<const ParsedSegment> parsed,
                                                                       std::uint64_t scopeSignature);
        [[nodiscard]] std::size_t workerCount() const;

    private:
        AssemblyOptions m_options;
        CacheStatistics m_statistics;
        std::unordered_map<std::uint64_t, std::shared_ptr<const ParsedSegment>> m_parseCache;
        std::unordered_map<std::uint64_t, std::shared_ptr<const GeneratedSegment>> m_codeCache;
    };

    // One-shot assembly without a persistent cache.
    [[nodiscard]] AssemblyResult assemble(std::string_view source, const AssemblyOptions& options = {});
} // namespace sceneasm::pipeline
