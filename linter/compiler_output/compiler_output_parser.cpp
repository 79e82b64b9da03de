#include "compiler_output_parser.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <system_error>
#include <utility>

namespace escapelint::compiler_output
{
    namespace
    {
        struct HintPattern
        {
            std::string_view phrase;
            CompilerHint hint;
        };

        // Order matters: a line carrying several phrases keeps the first one listed.
        constexpr HintPattern kHintPatterns[] = {
            {"escapes to heap", CompilerHint::EscapesToHeap},
            {"moved to heap", CompilerHint::MovedToHeap},
            {"stays on stack", CompilerHint::StaysOnStack},
            {"inlining call", CompilerHint::Inlined},
            {"Found IsInBounds", CompilerHint::FoundIsInBounds},
        };

        bool isSpace(char ch)
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        std::string_view firstField(std::string_view line)
        {
            std::size_t begin = 0;
            while (begin < line.size() && isSpace(line[begin]))
            {
                ++begin;
            }

            std::size_t end = begin;
            while (end < line.size() && !isSpace(line[end]))
            {
                ++end;
            }

            return line.substr(begin, end - begin);
        }

        std::optional<std::uint32_t> parseLineNumber(std::string_view text)
        {
            std::uint32_t value = 0;
            const char* first = text.data();
            const char* last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (text.empty() || ec != std::errc{} || ptr != last || value == 0)
            {
                return std::nullopt;
            }
            return value;
        }
    } // namespace

    std::optional<CompilerHint> classifyLine(std::string_view line)
    {
        for (const auto& pattern : kHintPatterns)
        {
            if (line.find(pattern.phrase) != std::string_view::npos)
            {
                return pattern.hint;
            }
        }
        return std::nullopt;
    }

    CompilerOutputParseResult parseCompilerOutput(std::istream& stream, const std::filesystem::path& baseDirectory)
    {
        CompilerOutputParseResult result;

        std::string line;
        while (std::getline(stream, line))
        {
            ++result.linesRead;
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }

            const auto hint = classifyLine(line);
            if (!hint.has_value())
            {
                continue;
            }

            const std::string_view location = firstField(line);
            const std::size_t fileEnd = location.find(':');
            if (fileEnd == std::string_view::npos)
            {
                continue;
            }

            std::string_view lineField = location.substr(fileEnd + 1);
            lineField = lineField.substr(0, lineField.find(':'));

            const auto lineNumber = parseLineNumber(lineField);
            if (!lineNumber.has_value())
            {
                result.hints.clear();
                result.hasError = true;
                result.errorMessage = "failed to parse line number at " + std::to_string(result.linesRead)
                    + ": '" + std::string{lineField} + "' is not a positive integer";
                return result;
            }

            Position position;
            position.file = canonicalizePath(baseDirectory, std::filesystem::path{std::string{location.substr(0, fileEnd)}});
            position.line = *lineNumber;
            result.hints[std::move(position)].push_back(*hint);
        }

        if (stream.bad())
        {
            result.hints.clear();
            result.hasError = true;
            result.errorMessage = "failed to read compiler output after line " + std::to_string(result.linesRead);
        }

        return result;
    }

    CompilerOutputParseResult parseCompilerOutputFile(const std::filesystem::path& filePath)
    {
        std::ifstream stream(filePath, std::ios::binary);
        if (!stream)
        {
            CompilerOutputParseResult result;
            result.hasError = true;
            result.errorMessage = "failed to open file '" + filePath.string() + "'";
            return result;
        }

        return parseCompilerOutput(stream, filePath.parent_path());
    }
} // namespace escapelint::compiler_output
