#include "compilation_session.hpp"

#include "../common/hashing.hpp"
#include "../frontend/parser.hpp"
#include "../frontend/unit_splitter.hpp"
#include "../high_level_ir/resolver.hpp"
#include "../middle_ir/lowering.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <iterator>
#include <thread>
#include <unordered_set>

namespace sceneasm::pipeline
{
    CompilationSession::CompilationSession(AssemblyOptions options)
        : m_options(options)
    {
    }

    void CompilationSession::resetStatistics() noexcept
    {
        m_statistics = CacheStatistics{};
    }

    std::size_t CompilationSession::workerCount() const
    {
        if (m_options.jobs != 0)
        {
            return m_options.jobs;
        }
        return std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }

    std::shared_ptr<const CompilationSession::ParsedSegment> CompilationSession::parseSegment(std::string_view text, std::uint64_t hash)
    {
        const auto cached = m_parseCache.find(hash);
        if (cached != m_parseCache.end() && cached->second->text == text)
        {
            ++m_statistics.parseHits;
            return cached->second;
        }

        ++m_statistics.parseMisses;
        auto parsed = frontend::parseSource(text);
        auto segment = std::make_shared<ParsedSegment>();
        segment->text = std::string{text};
        segment->root = std::move(parsed.root);
        segment->diagnostics = std::move(parsed.diagnostics);

        std::shared_ptr<const ParsedSegment> result = std::move(segment);
        m_parseCache[hash] = result;
        return result;
    }

    std::shared_ptr<const CompilationSession::GeneratedSegment> CompilationSession::generateSegment(
        const hir::GlobalScope& scope, std::shared_ptr<const ParsedSegment> parsed, std::uint64_t scopeSignature)
    {
        auto generated = std::make_shared<GeneratedSegment>();
        generated->text = parsed->text;
        generated->scopeSignature = scopeSignature;
        if (parsed->root == nullptr)
        {
            return generated;
        }

        common::DiagnosticBag diagnostics;
        hir::Resolver resolver{scope, *parsed->root};
        const auto units = resolver.resolve();
        diagnostics.append(resolver.diagnostics());

        for (const auto& unit : units)
        {
            auto lowered = mir::lowerFromHir(unit);
            diagnostics.append(lowered.diagnostics);
            generated->units.push_back(codegen::encodeUnit(lowered.unit));
        }

        generated->diagnostics = diagnostics.take();
        return generated;
    }

    AssemblyResult CompilationSession::assemble(std::string_view source)
    {
        const auto segments = frontend::splitUnits(source);

        std::vector<std::uint64_t> textHashes;
        std::vector<std::shared_ptr<const ParsedSegment>> parsed;
        std::unordered_set<std::uint64_t> usedParses;
        textHashes.reserve(segments.size());
        parsed.reserve(segments.size());
        for (const auto& segment : segments)
        {
            const std::uint64_t hash = common::contentHash(segment.text);
            textHashes.push_back(hash);
            parsed.push_back(parseSegment(segment.text, hash));
            usedParses.insert(hash);
        }

        std::vector<hir::SegmentTree> trees;
        trees.reserve(segments.size());
        for (std::size_t index = 0; index < segments.size(); ++index)
        {
            trees.push_back(hir::SegmentTree{parsed[index]->root.get(), segments[index].origin});
        }

        hir::Collector collector{trees};
        const hir::GlobalScope scope = collector.collect();
        const std::uint64_t signature = scope.signature();

        // Generated code depends on the segment text and on every name it can see.
        std::vector<std::shared_ptr<const GeneratedSegment>> generated(segments.size());
        std::vector<std::uint64_t> codeKeys(segments.size());
        std::unordered_set<std::uint64_t> usedCode;
        std::vector<std::size_t> pending;
        for (std::size_t index = 0; index < segments.size(); ++index)
        {
            codeKeys[index] = common::combineHash(textHashes[index], signature);
            usedCode.insert(codeKeys[index]);

            const auto cached = m_codeCache.find(codeKeys[index]);
            if (cached != m_codeCache.end() && cached->second->text == parsed[index]->text
                && cached->second->scopeSignature == signature)
            {
                ++m_statistics.codeHits;
                generated[index] = cached->second;
                continue;
            }

            // Identical segments in one file share a single generation.
            const auto duplicate = std::find_if(pending.begin(), pending.end(), [&](std::size_t other) {
                return codeKeys[other] == codeKeys[index] && parsed[other]->text == parsed[index]->text;
            });
            if (duplicate != pending.end())
            {
                ++m_statistics.codeHits;
                continue;
            }

            ++m_statistics.codeMisses;
            pending.push_back(index);
        }

        const std::size_t workers = workerCount();
        for (std::size_t first = 0; first < pending.size(); first += workers)
        {
            const std::size_t last = std::min(pending.size(), first + workers);
            std::vector<std::future<std::shared_ptr<const GeneratedSegment>>> futures;
            futures.reserve(last - first);
            for (std::size_t slot = first; slot < last; ++slot)
            {
                futures.push_back(std::async(std::launch::async, &CompilationSession::generateSegment, std::cref(scope),
                    parsed[pending[slot]], signature));
            }
            for (std::size_t slot = first; slot < last; ++slot)
            {
                const std::size_t index = pending[slot];
                generated[index] = futures[slot - first].get();
                m_codeCache[codeKeys[index]] = generated[index];
            }
        }

        for (std::size_t index = 0; index < segments.size(); ++index)
        {
            if (generated[index] == nullptr)
            {
                generated[index] = m_codeCache.at(codeKeys[index]);
            }
        }

        common::DiagnosticBag diagnostics;
        codegen::CodeGenerator generator{m_options.baseAddress};
        for (std::size_t index = 0; index < segments.size(); ++index)
        {
            diagnostics.append(parsed[index]->diagnostics, segments[index].origin);
            diagnostics.append(generated[index]->diagnostics, segments[index].origin);
            for (const auto& unit : generated[index]->units)
            {
                generator.addUnit(unit, segments[index].origin);
            }
        }
        diagnostics.append(collector.diagnostics());

        codegen::LinkedProgram program = generator.link();
        diagnostics.append(program.diagnostics);

        for (auto entry = m_parseCache.begin(); entry != m_parseCache.end();)
        {
            entry = usedParses.count(entry->first) == 0 ? m_parseCache.erase(entry) : std::next(entry);
        }
        for (auto entry = m_codeCache.begin(); entry != m_codeCache.end();)
        {
            entry = usedCode.count(entry->first) == 0 ? m_codeCache.erase(entry) : std::next(entry);
        }

        AssemblyResult result;
        result.code = std::move(program.code);
        result.baseAddress = program.baseAddress;
        result.entryAddress = program.entryAddress;
        result.symbols = std::move(program.symbols);
        result.diagnostics = diagnostics.take();
        std::stable_sort(result.diagnostics.begin(), result.diagnostics.end(), [](const Diagnostic& left, const Diagnostic& right) {
            return left.span.begin.offset < right.span.begin.offset;
        });
        return result;
    }

    AssemblyResult assemble(std::string_view source, const AssemblyOptions& options)
    {
        CompilationSession session{options};
        return session.assemble(source);
    }
} // namespace sceneasm::pipeline
