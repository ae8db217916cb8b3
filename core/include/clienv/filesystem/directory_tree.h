#pragma once

#include <clienv/app_errors.h>

#include <cstddef>
#include <filesystem>
#include <optional>

namespace clienv {

/**
 * Remove a directory and everything below it, deepest entries first.
 * 
 * A missing directory is a no-op. Symbolic links are removed as links and
 * never followed. Removal stops at the first entry that cannot be removed.
 * 
 * @param directory root of the tree to remove
 * @param removedEntries incremented for every removed entry, including
 *        entries removed before a failure
 * @return error for the entry that could not be removed, nullopt on success
 */
std::optional<DeletionFailedError> removeDirectoryTree(const std::filesystem::path& directory, size_t& removedEntries);

} // namespace clienv
