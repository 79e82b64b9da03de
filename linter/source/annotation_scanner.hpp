#pragma once

#include "../common/diagnostic.hpp"
#include "../common/facts.hpp"
#include "source_walker.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace escapelint::source
{
    struct SuspectedTypo
    {
        Position position;
        std::string comment;
    };

    struct AnnotationScanResult
    {
        AnnotationIndex annotations;
        std::vector<SuspectedTypo> typos;
        bool annotationsValid{true};
        bool hasError{false};
        std::string errorMessage;
    };

    struct SplitLine
    {
        std::string_view code;
        std::string_view comment;
    };

    // Splits at the first comment marker; both halves are trimmed and the
    // comment keeps its marker.
    [[nodiscard]] SplitLine splitLine(std::string_view line);

    [[nodiscard]] std::optional<Annotation> matchAnnotation(std::string_view comment);

    // True for short comments within a few edits of a known annotation.
    [[nodiscard]] bool looksLikeMisspelledAnnotation(std::string_view comment);

    class AnnotationScanner
    {
    public:
        AnnotationScanner(const FileVisitor& visitor, DiagnosticSink& sink);

        [[nodiscard]] AnnotationScanResult scan(const std::filesystem::path& root) const;

        // Scans one document; `filePath` is the position key for its lines.
        void scanStream(std::istream& stream, const std::filesystem::path& filePath, AnnotationScanResult& result) const;

    private:
        bool scanFile(const std::filesystem::path& filePath, AnnotationScanResult& result, std::string& errorMessage) const;
        void reportTypo(const Position& position, std::string_view comment, AnnotationScanResult& result) const;

        const FileVisitor& m_visitor;
        DiagnosticSink& m_sink;
    };
} // namespace escapelint::source
