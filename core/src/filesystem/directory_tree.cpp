#include <clienv/filesystem/directory_tree.h>

#include <algorithm>
#include <functional>
#include <vector>
#include <fmt/core.h>

namespace clienv {

namespace fs = std::filesystem;

namespace {

std::optional<DeletionFailedError> collectEntries(const fs::path& directory, std::vector<fs::path>& entries) {
    std::error_code errorCode;
    fs::recursive_directory_iterator iterator(directory, errorCode);
    if (errorCode) {
        return DeletionFailedError{directory, errorCode.message()};
    }
    
    const fs::recursive_directory_iterator end;
    while (iterator != end) {
        entries.push_back(iterator->path());
        iterator.increment(errorCode);
        if (errorCode) {
            return DeletionFailedError{directory, errorCode.message()};
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<DeletionFailedError> removeDirectoryTree(const fs::path& directory, size_t& removedEntries) {
    std::error_code errorCode;
    const auto status = fs::symlink_status(directory, errorCode);
    if (errorCode && status.type() != fs::file_type::not_found) {
        return DeletionFailedError{directory, errorCode.message()};
    }
    if (!fs::exists(status)) {
        return std::nullopt;
    }
    
    std::vector<fs::path> entries;
    if (fs::is_directory(status)) {
        if (auto error = collectEntries(directory, entries)) {
            return error;
        }
    }
    
    // Reverse path order puts every child before its parent
    std::sort(entries.begin(), entries.end(), std::greater<>());
    entries.push_back(directory);
    
    for (const auto& entry : entries) {
        fmt::print("Deleting: {}\n", entry.string());
        fs::remove(entry, errorCode);
        if (errorCode) {
            fmt::print(stderr, "Failed to delete {}: {}\n", entry.string(), errorCode.message());
            return DeletionFailedError{entry, errorCode.message()};
        }
        ++removedEntries;
    }
    return std::nullopt;
}

} // namespace clienv
