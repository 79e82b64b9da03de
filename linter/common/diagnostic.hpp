#pragma once

#include "facts.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace escapelint
{
    enum class Severity
    {
        Warning,
        Error
    };

    struct Diagnostic
    {
        std::string code;
        std::string message;
        std::optional<Position> position;
        Severity severity{Severity::Error};
    };

    class DiagnosticSink
    {
    public:
        virtual ~DiagnosticSink() = default;

        virtual void report(Diagnostic diagnostic) = 0;
    };

    /**
     * Writes one line per diagnostic, `<prefix><message>`, to the given stream.
     * The stream must outlive the sink.
     */
    class StreamDiagnosticSink final : public DiagnosticSink
    {
    public:
        explicit StreamDiagnosticSink(std::ostream& stream, std::string_view prefix = kLogPrefix);

        void report(Diagnostic diagnostic) override;

    private:
        std::ostream& m_stream;
        std::string m_prefix;
    };

    class CollectingDiagnosticSink final : public DiagnosticSink
    {
    public:
        void report(Diagnostic diagnostic) override;

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] std::size_t count(Severity severity) const noexcept;

    private:
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace escapelint
