#include "diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace escapelint
{
    StreamDiagnosticSink::StreamDiagnosticSink(std::ostream& stream, std::string_view prefix)
        : m_stream(stream)
        , m_prefix(prefix)
    {
    }

    void StreamDiagnosticSink::report(Diagnostic diagnostic)
    {
        m_stream << m_prefix << diagnostic.message << '\n';
    }

    void CollectingDiagnosticSink::report(Diagnostic diagnostic)
    {
        m_diagnostics.emplace_back(std::move(diagnostic));
    }

    const std::vector<Diagnostic>& CollectingDiagnosticSink::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::size_t CollectingDiagnosticSink::count(Severity severity) const noexcept
    {
        return static_cast<std::size_t>(std::count_if(m_diagnostics.begin(), m_diagnostics.end(),
            [severity](const Diagnostic& diagnostic) { return diagnostic.severity == severity; }));
    }
} // namespace escapelint
