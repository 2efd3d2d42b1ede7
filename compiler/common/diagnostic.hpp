#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sceneasm::common
{
    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
        std::uint32_t offset{0};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    // Moves a span produced relative to a segment start to absolute file coordinates.
    [[nodiscard]] SourceSpan rebase(SourceSpan span, SourceLocation origin) noexcept;
    [[nodiscard]] SourceSpan mergeSpans(const SourceSpan& first, const SourceSpan& last) noexcept;

    enum class Severity : std::uint8_t
    {
        Error,
        Warning
    };

    struct DiagnosticLabel
    {
        SourceSpan span{};
        std::string message;
    };

    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span{};
        Severity severity{Severity::Error};
        std::vector<DiagnosticLabel> secondary;

        [[nodiscard]] bool isWarning() const noexcept
        {
            return severity == Severity::Warning;
        }
    };

    class DiagnosticBag
    {
    public:
        Diagnostic& error(std::string code, std::string message, SourceSpan span);
        Diagnostic& warning(std::string code, std::string message, SourceSpan span);
        Diagnostic& report(Diagnostic diagnostic);

        void append(const std::vector<Diagnostic>& diagnostics);
        void append(const std::vector<Diagnostic>& diagnostics, SourceLocation origin);

        [[nodiscard]] const std::vector<Diagnostic>& all() const noexcept;
        [[nodiscard]] bool empty() const noexcept;
        [[nodiscard]] bool hasErrors() const noexcept;
        [[nodiscard]] std::size_t errorCount() const noexcept;
        [[nodiscard]] std::size_t warningCount() const noexcept;
        [[nodiscard]] std::map<Severity, std::vector<Diagnostic>> bySeverity() const;

        std::vector<Diagnostic> take();

    private:
        std::vector<Diagnostic> m_diagnostics;
    };

    [[nodiscard]] std::string_view toString(Severity severity);
    [[nodiscard]] bool hasErrors(const std::vector<Diagnostic>& diagnostics) noexcept;

    // Renders "SASM-E2100 L3:C5 -> message" in the style the driver prints.
    [[nodiscard]] std::string format(const Diagnostic& diagnostic);
} // namespace sceneasm::common
