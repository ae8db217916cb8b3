#include <clienv/app.h>
#include <clienv/filesystem/directory_tree.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>
#include <fmt/core.h>

namespace clienv {

namespace fs = std::filesystem;

namespace {

bool directoryExists(const fs::path& directory) {
    std::error_code errorCode;
    return fs::is_directory(directory, errorCode);
}

} // namespace

App::App(std::string appName,
         fs::path homeDir,
         fs::path localDir,
         fs::path homePropertiesFile,
         fs::path localPropertiesFile)
    : appName(std::move(appName))
    , homeDir(std::move(homeDir))
    , localDir(std::move(localDir))
    , homePropertiesFile(std::move(homePropertiesFile))
    , localPropertiesFile(std::move(localPropertiesFile))
{
}

const std::string& App::getAppName() const {
    return this->appName;
}

const fs::path& App::getHomeDir() const {
    return this->homeDir;
}

const fs::path& App::getLocalDir() const {
    return this->localDir;
}

const fs::path& App::getHomePropertiesFile() const {
    return this->homePropertiesFile;
}

const fs::path& App::getLocalPropertiesFile() const {
    return this->localPropertiesFile;
}

bool App::hasHomeDir() const {
    return directoryExists(this->homeDir);
}

bool App::hasLocalDir() const {
    return directoryExists(this->localDir);
}

LoadPropertiesResult App::loadHomeProperties() const {
    return loadProperties(this->homeDir, this->homePropertiesFile);
}

LoadPropertiesResult App::loadLocalProperties() const {
    return loadProperties(this->localDir, this->localPropertiesFile);
}

SavePropertiesResult App::saveHomeProperties(const PropertySet& properties) const {
    return saveProperties(this->homeDir, this->homePropertiesFile, properties);
}

SavePropertiesResult App::saveLocalProperties(const PropertySet& properties) const {
    return saveProperties(this->localDir, this->localPropertiesFile, properties);
}

LoadPropertiesResult App::getMergedProperties() const {
    auto homeResult = this->loadHomeProperties();
    if (!homeResult.isOk()) {
        return homeResult;
    }
    auto localResult = this->loadLocalProperties();
    if (!localResult.isOk()) {
        return localResult;
    }
    return {mergeProperties(*homeResult.properties(), *localResult.properties())};
}

DeleteAppResult App::deleteApp() const {
    fmt::print("Deleting app directories: {} and {}\n", this->homeDir.string(), this->localDir.string());

    size_t removedEntries = 0;
    for (const auto& directory : {this->homeDir, this->localDir}) {
        if (auto error = removeDirectoryTree(directory, removedEntries)) {
            return {std::move(*error)};
        }
    }
    return {DeleteAppSuccess{removedEntries}};
}

LoadPropertiesResult App::loadProperties(const fs::path& directory, const fs::path& file) {
    if (!directoryExists(directory)) {
        return {DirectoryMissingError{directory}};
    }

    std::error_code errorCode;
    const auto status = fs::status(file, errorCode);
    if (errorCode && status.type() != fs::file_type::not_found) {
        return {PropertyReadFailedError{file, errorCode.message()}};
    }
    if (!fs::exists(status)) {
        // First run: nothing saved yet
        return {PropertySet{}};
    }
    if (!fs::is_regular_file(status)) {
        return {PropertyReadFailedError{file, "not a regular file"}};
    }

    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return {PropertyReadFailedError{file, std::strerror(errno)}};
    }
    std::ostringstream content;
    content << input.rdbuf();
    if (input.bad()) {
        return {PropertyReadFailedError{file, "read error"}};
    }

    auto parseResult = parseProperties(content.str());
    if (!parseResult.isOk()) {
        return {PropertyReadFailedError{file, parseResult.errorText()}};
    }
    return {std::get<PropertySet>(std::move(parseResult.data))};
}

SavePropertiesResult App::saveProperties(const fs::path& directory, const fs::path& file, const PropertySet& properties) {
    if (!directoryExists(directory)) {
        return {DirectoryMissingError{directory}};
    }

    const std::string content = serializeProperties(properties);
    std::ofstream output(file, std::ios::binary | std::ios::trunc);
    if (!output) {
        const std::string reason = std::strerror(errno);
        fmt::print(stderr, "Failed to open {} for writing: {}\n", file.string(), reason);
        return {PropertyWriteFailedError{file, reason}};
    }
    output << content;
    output.flush();
    if (!output) {
        fmt::print(stderr, "Failed to write {}\n", file.string());
        return {PropertyWriteFailedError{file, "write error"}};
    }
    return {SavePropertiesSuccess{content.size()}};
}

} // namespace clienv
