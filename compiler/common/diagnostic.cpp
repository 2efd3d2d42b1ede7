#include "diagnostic.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace sceneasm::common
{
    namespace
    {
        SourceLocation rebaseLocation(SourceLocation location, SourceLocation origin) noexcept
        {
            SourceLocation result = location;
            if (location.line == 1)
            {
                result.column = location.column + origin.column - 1;
            }
            result.line = location.line + origin.line - 1;
            result.offset = location.offset + origin.offset;
            return result;
        }
    } // namespace

    SourceSpan rebase(SourceSpan span, SourceLocation origin) noexcept
    {
        return {rebaseLocation(span.begin, origin), rebaseLocation(span.end, origin)};
    }

    SourceSpan mergeSpans(const SourceSpan& first, const SourceSpan& last) noexcept
    {
        return {first.begin, last.end};
    }

    Diagnostic& DiagnosticBag::error(std::string code, std::string message, SourceSpan span)
    {
        Diagnostic diagnostic;
        diagnostic.code = std::move(code);
        diagnostic.message = std::move(message);
        diagnostic.span = span;
        diagnostic.severity = Severity::Error;
        return report(std::move(diagnostic));
    }

    Diagnostic& DiagnosticBag::warning(std::string code, std::string message, SourceSpan span)
    {
        Diagnostic diagnostic;
        diagnostic.code = std::move(code);
        diagnostic.message = std::move(message);
        diagnostic.span = span;
        diagnostic.severity = Severity::Warning;
        return report(std::move(diagnostic));
    }

    Diagnostic& DiagnosticBag::report(Diagnostic diagnostic)
    {
        m_diagnostics.emplace_back(std::move(diagnostic));
        return m_diagnostics.back();
    }

    void DiagnosticBag::append(const std::vector<Diagnostic>& diagnostics)
    {
        m_diagnostics.insert(m_diagnostics.end(), diagnostics.begin(), diagnostics.end());
    }

    void DiagnosticBag::append(const std::vector<Diagnostic>& diagnostics, SourceLocation origin)
    {
        for (Diagnostic diagnostic : diagnostics)
        {
            diagnostic.span = rebase(diagnostic.span, origin);
            for (auto& label : diagnostic.secondary)
            {
                label.span = rebase(label.span, origin);
            }
            m_diagnostics.emplace_back(std::move(diagnostic));
        }
    }

    const std::vector<Diagnostic>& DiagnosticBag::all() const noexcept
    {
        return m_diagnostics;
    }

    bool DiagnosticBag::empty() const noexcept
    {
        return m_diagnostics.empty();
    }

    bool DiagnosticBag::hasErrors() const noexcept
    {
        return common::hasErrors(m_diagnostics);
    }

    std::size_t DiagnosticBag::errorCount() const noexcept
    {
        return static_cast<std::size_t>(std::count_if(m_diagnostics.begin(), m_diagnostics.end(), [](const Diagnostic& d) {
            return !d.isWarning();
        }));
    }

    std::size_t DiagnosticBag::warningCount() const noexcept
    {
        return m_diagnostics.size() - errorCount();
    }

    std::map<Severity, std::vector<Diagnostic>> DiagnosticBag::bySeverity() const
    {
        std::map<Severity, std::vector<Diagnostic>> result;
        for (const auto& diagnostic : m_diagnostics)
        {
            result[diagnostic.severity].push_back(diagnostic);
        }
        return result;
    }

    std::vector<Diagnostic> DiagnosticBag::take()
    {
        std::vector<Diagnostic> result = std::move(m_diagnostics);
        m_diagnostics.clear();
        return result;
    }

    std::string_view toString(Severity severity)
    {
        switch (severity)
        {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        }
        return "error";
    }

    bool hasErrors(const std::vector<Diagnostic>& diagnostics) noexcept
    {
        return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& d) {
            return !d.isWarning();
        });
    }

    std::string format(const Diagnostic& diagnostic)
    {
        std::ostringstream stream;
        stream << diagnostic.code << ' '
               << "L" << diagnostic.span.begin.line << ":C" << diagnostic.span.begin.column
               << " -> "
               << diagnostic.message;
        for (const auto& label : diagnostic.secondary)
        {
            stream << "\n    note L" << label.span.begin.line << ":C" << label.span.begin.column
                   << " -> " << label.message;
        }
        return stream.str();
    }
} // namespace sceneasm::common
