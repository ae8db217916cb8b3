#pragma once

#include <clienv/properties.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>

namespace clienv {

/**
 * Operation required a tier directory that does not exist
 */
struct DirectoryMissingError {
    std::filesystem::path directory;
};

/**
 * Builder could not create a requested directory
 */
struct DirectoryCreationFailedError {
    std::filesystem::path directory;
    std::string reason;
};

/**
 * Properties file exists but could not be read or parsed
 */
struct PropertyReadFailedError {
    std::filesystem::path file;
    std::string reason;
};

struct PropertyWriteFailedError {
    std::filesystem::path file;
    std::string reason;
};

/**
 * A file or directory could not be removed during recursive delete
 */
struct DeletionFailedError {
    std::filesystem::path path;
    std::string reason;
};

/**
 * A default path needed the home or working directory, but the
 * environment could not supply it
 */
struct EnvironmentLookupFailedError {
    std::string what;
};

std::string errorTextFor(const DirectoryMissingError& error);
std::string errorTextFor(const DirectoryCreationFailedError& error);
std::string errorTextFor(const PropertyReadFailedError& error);
std::string errorTextFor(const PropertyWriteFailedError& error);
std::string errorTextFor(const DeletionFailedError& error);
std::string errorTextFor(const EnvironmentLookupFailedError& error);

struct SavePropertiesSuccess {
    size_t bytesWritten = 0;
};

struct DeleteAppSuccess {
    size_t removedEntries = 0;
};

// Success alternatives have no error text
inline std::string errorTextFor([[maybe_unused]] const PropertySet& properties) {
    return {};
}

inline std::string errorTextFor([[maybe_unused]] const SavePropertiesSuccess& success) {
    return {};
}

struct LoadPropertiesResult {
    std::variant<PropertySet, DirectoryMissingError, PropertyReadFailedError> data;

    bool isOk() const {
        return std::holds_alternative<PropertySet>(this->data);
    }

    /**
     * Loaded properties, nullptr on failure
     */
    const PropertySet* properties() const {
        return std::get_if<PropertySet>(&this->data);
    }

    std::string errorText() const {
        if (this->isOk()) {
            return {};
        }
        return std::visit([] (const auto& value) {
            return errorTextFor(value);
        }, this->data);
    }
};

struct SavePropertiesResult {
    std::variant<SavePropertiesSuccess, DirectoryMissingError, PropertyWriteFailedError> data;

    bool isOk() const {
        return std::holds_alternative<SavePropertiesSuccess>(this->data);
    }

    std::string errorText() const {
        if (this->isOk()) {
            return {};
        }
        return std::visit([] (const auto& value) {
            return errorTextFor(value);
        }, this->data);
    }
};

struct DeleteAppResult {
    std::variant<DeleteAppSuccess, DeletionFailedError> data;

    bool isOk() const {
        return std::holds_alternative<DeleteAppSuccess>(this->data);
    }

    std::string errorText() const {
        if (auto* error = std::get_if<DeletionFailedError>(&this->data)) {
            return errorTextFor(*error);
        }
        return {};
    }
};

} // namespace clienv
