#include "source_walker.hpp"

#include "../common/facts.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace escapelint::source
{
    namespace
    {
        bool endsWith(std::string_view text, std::string_view suffix)
        {
            return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        void fail(WalkResult& result, const std::filesystem::path& path, std::string_view reason, const std::error_code& error)
        {
            result.hasError = true;
            result.errorMessage = std::string{reason} + " '" + path.string() + "'";
            if (error)
            {
                result.errorMessage += ": " + error.message();
            }
        }
    } // namespace

    bool SourceWalker::isSkippedDirectory(std::string_view directoryName)
    {
        return (!directoryName.empty() && directoryName.front() == '.') || directoryName == kVendorDirectory;
    }

    bool SourceWalker::isEligibleFile(std::string_view fileName)
    {
        return endsWith(fileName, kSourceSuffix) && !endsWith(fileName, kTestSourceSuffix);
    }

    WalkResult SourceWalker::visit(const std::filesystem::path& root, const FileCallback& callback) const
    {
        WalkResult result;

        std::error_code statusError;
        if (!std::filesystem::exists(root, statusError) || statusError)
        {
            fail(result, root, "source root does not exist", statusError);
            return result;
        }

        const bool isDirectory = std::filesystem::is_directory(root, statusError);
        if (statusError)
        {
            fail(result, root, "failed to stat", statusError);
            return result;
        }

        if (!isDirectory)
        {
            // A single file root is scanned on its own when it is eligible.
            if (!isEligibleFile(root.filename().string()))
            {
                return result;
            }

            ++result.visitedFiles;
            std::string callbackError;
            if (!callback(root, callbackError))
            {
                result.hasError = true;
                result.errorMessage = std::move(callbackError);
            }
            return result;
        }

        visitDirectory(root, callback, result);
        return result;
    }

    bool SourceWalker::visitDirectory(const std::filesystem::path& directory,
        const FileCallback& callback,
        WalkResult& result) const
    {
        std::error_code iteratorError;
        std::filesystem::directory_iterator it(directory, iteratorError);
        if (iteratorError)
        {
            fail(result, directory, "failed to enumerate directory", iteratorError);
            return false;
        }

        std::vector<std::filesystem::directory_entry> entries;
        std::filesystem::directory_iterator end;
        while (it != end)
        {
            entries.push_back(*it);

            std::error_code incrementError;
            it.increment(incrementError);
            if (incrementError)
            {
                fail(result, directory, "failed to enumerate directory", incrementError);
                return false;
            }
        }

        std::sort(entries.begin(), entries.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.path().filename() < rhs.path().filename(); });

        for (const auto& entry : entries)
        {
            const std::string name = entry.path().filename().string();

            std::error_code entryError;
            const bool isLink = entry.is_symlink(entryError);
            if (entryError)
            {
                fail(result, entry.path(), "failed to stat", entryError);
                return false;
            }

            // Symbolic links are not followed into directories.
            const bool isDirectory = !isLink && entry.is_directory(entryError);
            if (entryError)
            {
                fail(result, entry.path(), "failed to stat", entryError);
                return false;
            }

            if (isDirectory)
            {
                if (isSkippedDirectory(name))
                {
                    continue;
                }

                if (!visitDirectory(entry.path(), callback, result))
                {
                    return false;
                }
                continue;
            }

            if (!isEligibleFile(name))
            {
                continue;
            }

            ++result.visitedFiles;
            std::string callbackError;
            if (!callback(entry.path(), callbackError))
            {
                result.hasError = true;
                result.errorMessage = std::move(callbackError);
                return false;
            }
        }

        return true;
    }
} // namespace escapelint::source
