#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace escapelint
{
    inline constexpr std::string_view kCommentMarker = "//";
    inline constexpr std::string_view kSourceSuffix = ".go";
    inline constexpr std::string_view kTestSourceSuffix = "_test.go";
    inline constexpr std::string_view kVendorDirectory = "vendor";
    inline constexpr std::string_view kLogPrefix = "escape-lint: ";
    inline constexpr std::size_t kMaxTypoCommentLength = 20;
    inline constexpr std::size_t kTypoEditThreshold = 3;

    // Assertions a developer writes in a trailing comment.
    enum class Annotation : std::uint8_t
    {
        NoEscape,
        NoBoundsCheck,
        MustInline
    };

    // Facts reported by the compiler for a source line.
    enum class CompilerHint : std::uint8_t
    {
        EscapesToHeap,
        MovedToHeap,
        StaysOnStack,
        FoundIsInBounds,
        Inlined
    };

    // Annotations in the order the scanner probes for them.
    inline constexpr Annotation kKnownAnnotations[] = {
        Annotation::NoEscape,
        Annotation::NoBoundsCheck,
        Annotation::MustInline,
    };

    struct Position
    {
        std::string file;
        std::uint32_t line{1};
    };

    inline bool operator==(const Position& lhs, const Position& rhs)
    {
        return lhs.line == rhs.line && lhs.file == rhs.file;
    }

    inline bool operator!=(const Position& lhs, const Position& rhs)
    {
        return !(lhs == rhs);
    }

    inline bool operator<(const Position& lhs, const Position& rhs)
    {
        return std::tie(lhs.file, lhs.line) < std::tie(rhs.file, rhs.line);
    }

    using AnnotationIndex = std::map<Position, std::vector<Annotation>>;
    using HintIndex = std::map<Position, std::vector<CompilerHint>>;

    [[nodiscard]] std::string_view toString(Annotation annotation);


    // Lexically joins `path` onto `baseDirectory` (unless already absolute)
    // and removes redundant `.`/`..` segments and separators. Never touches
    // the filesystem.
    [[nodiscard]] std::string canonicalizePath(const std::filesystem::path& baseDirectory,
        const std::filesystem::path& path);

    [[nodiscard]] std::string formatPosition(const Position& position);
} // namespace escapelint
