#pragma once

#include "../common/facts.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace escapelint::compiler_output
{
    struct CompilerOutputParseResult
    {
        HintIndex hints;
        std::size_t linesRead{0};
        bool hasError{false};
        std::string errorMessage;
    };

    /**
     * Classifies one diagnostic line. The five recognised phrases are tested in
     * priority order and only the first match counts.
     */
    [[nodiscard]] std::optional<CompilerHint> classifyLine(std::string_view line);

    /**
     * Builds the hint index from compiler diagnostics read from `stream`.
     * File references inside the diagnostics are resolved against
     * `baseDirectory`. A recognised line with a malformed line number aborts
     * the parse.
     */
    [[nodiscard]] CompilerOutputParseResult parseCompilerOutput(std::istream& stream,
        const std::filesystem::path& baseDirectory);

    // Opens `filePath` and resolves file references against its directory.
    [[nodiscard]] CompilerOutputParseResult parseCompilerOutputFile(const std::filesystem::path& filePath);
} // namespace escapelint::compiler_output
