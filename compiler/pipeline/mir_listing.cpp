#include "mir_listing.hpp"

#include "../frontend/parser.hpp"
#include "../high_level_ir/resolver.hpp"
#include "../middle_ir/canonical.hpp"
#include "../middle_ir/lowering.hpp"
#include "../middle_ir/printer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sceneasm::pipeline
{
    MirListing lowerToMir(std::string_view source)
    {
        MirListing listing;
        common::DiagnosticBag diagnostics;

        const frontend::ParseResult parsed = frontend::parseSource(source);
        diagnostics.append(parsed.diagnostics);
        if (parsed.root == nullptr)
        {
            listing.diagnostics = diagnostics.take();
            return listing;
        }

        const std::vector<hir::SegmentTree> segments{hir::SegmentTree{parsed.root.get(), {}}};
        hir::Collector collector{segments};
        const hir::GlobalScope scope = collector.collect();
        diagnostics.append(collector.diagnostics());

        hir::Resolver resolver{scope, *parsed.root};
        const auto units = resolver.resolve();
        diagnostics.append(resolver.diagnostics());

        for (const auto& unit : units)
        {
            auto lowered = mir::lowerFromHir(unit);
            diagnostics.append(lowered.diagnostics);
            listing.units.push_back(std::move(lowered.unit));
        }

        listing.diagnostics = diagnostics.take();
        std::stable_sort(listing.diagnostics.begin(), listing.diagnostics.end(), [](const Diagnostic& left, const Diagnostic& right) {
            return left.span.begin.offset < right.span.begin.offset;
        });
        return listing;
    }

    std::string formatMirListing(const MirListing& listing)
    {
        std::ostringstream stream;
        for (const auto& unit : listing.units)
        {
            mir::print(unit, stream);
            stream << "hash " << unit.name << " 0x" << std::hex << std::setw(16) << std::setfill('0')
                   << mir::canonicalHash(unit) << std::dec << std::setfill(' ') << '\n';
        }
        return stream.str();
    }
} // namespace sceneasm::pipeline
