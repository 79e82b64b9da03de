#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace escapelint::source
{
    struct WalkResult
    {
        std::size_t visitedFiles{0};
        bool hasError{false};
        std::string errorMessage;
    };

    // Returning false from the callback aborts the walk; the callback is
    // expected to have recorded why in `errorMessage`.
    using FileCallback = std::function<bool(const std::filesystem::path& filePath, std::string& errorMessage)>;

    class FileVisitor
    {
    public:
        virtual ~FileVisitor() = default;

        [[nodiscard]] virtual WalkResult visit(const std::filesystem::path& root, const FileCallback& callback) const = 0;
    };

    /**
     * Recursively visits the source files under a root in sorted path order.
     * Hidden directories (other than the root) and `vendor` directories are
     * pruned; only `.go` files that are not `_test.go` files are reported.
     */
    class SourceWalker final : public FileVisitor
    {
    public:
        SourceWalker() = default;

        [[nodiscard]] WalkResult visit(const std::filesystem::path& root, const FileCallback& callback) const override;

        [[nodiscard]] static bool isSkippedDirectory(std::string_view directoryName);
        [[nodiscard]] static bool isEligibleFile(std::string_view fileName);

    private:
        bool visitDirectory(const std::filesystem::path& directory, const FileCallback& callback, WalkResult& result) const;
    };
} // namespace escapelint::source
