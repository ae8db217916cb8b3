#include <clienv/app_errors.h>

#include <fmt/core.h>

namespace clienv {

std::string errorTextFor(const DirectoryMissingError& error) {
    return fmt::format("Directory does not exist: {}", error.directory.string());
}

std::string errorTextFor(const DirectoryCreationFailedError& error) {
    return fmt::format("Failed to create directory {}: {}", error.directory.string(), error.reason);
}

std::string errorTextFor(const PropertyReadFailedError& error) {
    return fmt::format("Failed to load properties from {}: {}", error.file.string(), error.reason);
}

std::string errorTextFor(const PropertyWriteFailedError& error) {
    return fmt::format("Failed to save properties to {}: {}", error.file.string(), error.reason);
}

std::string errorTextFor(const DeletionFailedError& error) {
    return fmt::format("Failed to delete {}: {}", error.path.string(), error.reason);
}

std::string errorTextFor(const EnvironmentLookupFailedError& error) {
    return fmt::format("Cannot determine {}", error.what);
}

} // namespace clienv
