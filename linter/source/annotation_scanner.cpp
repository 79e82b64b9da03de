#include "annotation_scanner.hpp"

#include "../common/edit_distance.hpp"

#include <cctype>
#include <fstream>
#include <utility>

namespace escapelint::source
{
    namespace
    {
        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        std::string annotationToken(Annotation annotation)
        {
            return std::string{kCommentMarker} + std::string{toString(annotation)};
        }
    } // namespace

    SplitLine splitLine(std::string_view line)
    {
        SplitLine split;
        const std::size_t marker = line.find(kCommentMarker);
        if (marker == std::string_view::npos)
        {
            split.code = trim(line);
            return split;
        }

        split.code = trim(line.substr(0, marker));
        split.comment = trim(line.substr(marker));
        return split;
    }

    std::optional<Annotation> matchAnnotation(std::string_view comment)
    {
        for (Annotation annotation : kKnownAnnotations)
        {
            if (comment.find(annotationToken(annotation)) != std::string_view::npos)
            {
                return annotation;
            }
        }
        return std::nullopt;
    }

    bool looksLikeMisspelledAnnotation(std::string_view comment)
    {
        if (comment.size() > kMaxTypoCommentLength)
        {
            return false;
        }

        for (Annotation annotation : kKnownAnnotations)
        {
            if (isNearMiss(comment, toString(annotation), kTypoEditThreshold))
            {
                return true;
            }
        }
        return false;
    }

    AnnotationScanner::AnnotationScanner(const FileVisitor& visitor, DiagnosticSink& sink)
        : m_visitor(visitor)
        , m_sink(sink)
    {
    }

    AnnotationScanResult AnnotationScanner::scan(const std::filesystem::path& root) const
    {
        AnnotationScanResult result;

        WalkResult walk = m_visitor.visit(root,
            [this, &result](const std::filesystem::path& filePath, std::string& errorMessage) {
                return scanFile(filePath, result, errorMessage);
            });

        if (walk.hasError)
        {
            result.annotations.clear();
            result.hasError = true;
            result.errorMessage = std::move(walk.errorMessage);
        }

        return result;
    }

    bool AnnotationScanner::scanFile(const std::filesystem::path& filePath,
        AnnotationScanResult& result,
        std::string& errorMessage) const
    {
        std::ifstream stream(filePath, std::ios::binary);
        if (!stream)
        {
            errorMessage = "failed to open file '" + filePath.string() + "'";
            return false;
        }

        scanStream(stream, filePath, result);
        if (stream.bad())
        {
            errorMessage = "failed to read file '" + filePath.string() + "'";
            return false;
        }

        return true;
    }

    void AnnotationScanner::scanStream(std::istream& stream,
        const std::filesystem::path& filePath,
        AnnotationScanResult& result) const
    {
        const std::string file = canonicalizePath({}, filePath);

        std::uint32_t lineNumber = 0;
        std::string line;
        while (std::getline(stream, line))
        {
            ++lineNumber;
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }

            const SplitLine split = splitLine(line);
            if (split.code.empty() || split.comment.empty())
            {
                continue;
            }

            Position position;
            position.file = file;
            position.line = lineNumber;

            if (const auto annotation = matchAnnotation(split.comment))
            {
                result.annotations[std::move(position)].push_back(*annotation);
                continue;
            }

            if (looksLikeMisspelledAnnotation(split.comment))
            {
                reportTypo(position, split.comment, result);
            }
        }
    }

    void AnnotationScanner::reportTypo(const Position& position,
        std::string_view comment,
        AnnotationScanResult& result) const
    {
        SuspectedTypo typo;
        typo.position = position;
        typo.comment = std::string{comment};
        result.typos.emplace_back(std::move(typo));
        result.annotationsValid = false;

        Diagnostic diagnostic;
        diagnostic.code = "ESCL-W2001";
        diagnostic.message = "probably a typo '" + std::string{comment} + "' at " + formatPosition(position);
        diagnostic.position = position;
        diagnostic.severity = Severity::Warning;
        m_sink.report(std::move(diagnostic));
    }
} // namespace escapelint::source
