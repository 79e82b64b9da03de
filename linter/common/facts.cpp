#include "facts.hpp"

namespace escapelint
{
    std::string_view toString(Annotation annotation)
    {
        switch (annotation)
        {
        case Annotation::NoEscape: return "no-escape";
        case Annotation::NoBoundsCheck: return "no-bounds-check";
        case Annotation::MustInline: return "must-inline";
        }

        return "unknown";
    }

    std::string canonicalizePath(const std::filesystem::path& baseDirectory, const std::filesystem::path& path)
    {
        std::filesystem::path joined = path.is_absolute() ? path : baseDirectory / path;
        std::filesystem::path normalized = joined.lexically_normal();

        // lexically_normal keeps a trailing separator as an empty final element.
        if (!normalized.empty() && normalized.filename().empty() && normalized.has_relative_path())
        {
            normalized = normalized.parent_path();
        }

        if (normalized.empty())
        {
            return ".";
        }

        return normalized.generic_string();
    }

    std::string formatPosition(const Position& position)
    {
        return position.file + ":" + std::to_string(position.line);
    }
} // namespace escapelint
