#include <clienv/app_builder.h>
#include <clienv/file_name.h>

#include <system_error>
#include <utility>
#include <fmt/core.h>

namespace clienv {

namespace fs = std::filesystem;

namespace {

/**
 * Make path absolute against base, or against the process working
 * directory when base is unusable
 */
std::optional<fs::path> absolutePath(const fs::path& path, const fs::path& base) {
    if (path.is_absolute()) {
        return path.lexically_normal();
    }
    if (base.is_absolute()) {
        return (base / path).lexically_normal();
    }
    std::error_code errorCode;
    auto absolute = fs::absolute(path, errorCode);
    if (errorCode) {
        return std::nullopt;
    }
    return absolute.lexically_normal();
}

/**
 * Escaped name that also cannot be "." or ".."
 */
std::string pathSegmentFor(std::string_view name) {
    std::string segment = escapeName(name);
    if (segment == "." || segment == "..") {
        segment.assign(segment.size(), '_');
    }
    return segment;
}

std::string propertiesFileName(const std::optional<std::string>& fileName, const std::string& safeName) {
    if (fileName && !fileName->empty()) {
        return pathSegmentFor(*fileName);
    }
    return safeName + ".properties";
}

std::optional<DirectoryCreationFailedError> createDirectory(const fs::path& directory) {
    std::error_code errorCode;
    fs::create_directories(directory, errorCode);
    if (!errorCode && !fs::is_directory(directory, errorCode)) {
        errorCode = std::make_error_code(std::errc::not_a_directory);
    }
    if (errorCode) {
        fmt::print(stderr, "Failed to create directory {}: {}\n", directory.string(), errorCode.message());
        return DirectoryCreationFailedError{directory, errorCode.message()};
    }
    return std::nullopt;
}

} // namespace

std::string BuildAppResult::errorText() const {
    if (auto* error = std::get_if<DirectoryCreationFailedError>(&this->data)) {
        return errorTextFor(*error);
    }
    if (auto* error = std::get_if<EnvironmentLookupFailedError>(&this->data)) {
        return errorTextFor(*error);
    }
    return {};
}

BuildAppResult buildApp(const BuilderConfig& config, const Environment& environment) {
    const std::string appName = config.appName.empty() ? std::string(defaultAppName) : config.appName;
    const std::string safeName = pathSegmentFor(appName);
    const std::string directoryName = "." + safeName;

    fs::path workingDirectory = environment.workingDirectory;
    if (config.workingDirectoryOverride) {
        auto resolved = absolutePath(*config.workingDirectoryOverride, environment.workingDirectory);
        if (!resolved) {
            return {EnvironmentLookupFailedError{"working directory"}};
        }
        workingDirectory = std::move(*resolved);
    }

    std::optional<fs::path> homeDir;
    if (config.homeDirOverride) {
        homeDir = absolutePath(*config.homeDirOverride, workingDirectory);
    } else if (!environment.homeDirectory.empty()) {
        homeDir = absolutePath(environment.homeDirectory / directoryName, workingDirectory);
    }
    if (!homeDir) {
        return {EnvironmentLookupFailedError{"user home directory"}};
    }

    std::optional<fs::path> localDir;
    if (config.localDirOverride) {
        localDir = absolutePath(*config.localDirOverride, workingDirectory);
    } else if (!workingDirectory.empty()) {
        localDir = absolutePath(workingDirectory / directoryName, workingDirectory);
    }
    if (!localDir) {
        return {EnvironmentLookupFailedError{"working directory"}};
    }

    auto homePropertiesFile = *homeDir / propertiesFileName(config.homePropertiesFileName, safeName);
    auto localPropertiesFile = *localDir / propertiesFileName(config.localPropertiesFileName, safeName);

    App app(appName, *homeDir, *localDir, std::move(homePropertiesFile), std::move(localPropertiesFile));

    // Directories are created only on request
    if (config.createHomeDir) {
        if (auto error = createDirectory(app.getHomeDir())) {
            return {std::move(*error)};
        }
    }
    if (config.createLocalDir) {
        if (auto error = createDirectory(app.getLocalDir())) {
            return {std::move(*error)};
        }
    }
    return {std::move(app)};
}

AppBuilder::AppBuilder(Environment environment)
    : env(std::move(environment))
{
}

AppBuilder& AppBuilder::appName(std::string appName) {
    this->config.appName = std::move(appName);
    return *this;
}

AppBuilder& AppBuilder::homeDir(fs::path homeDir) {
    this->config.homeDirOverride = std::move(homeDir);
    return *this;
}

AppBuilder& AppBuilder::localDir(fs::path localDir) {
    this->config.localDirOverride = std::move(localDir);
    return *this;
}

AppBuilder& AppBuilder::homePropertiesFileName(std::string fileName) {
    this->config.homePropertiesFileName = std::move(fileName);
    return *this;
}

AppBuilder& AppBuilder::localPropertiesFileName(std::string fileName) {
    this->config.localPropertiesFileName = std::move(fileName);
    return *this;
}

AppBuilder& AppBuilder::withHomeDirectory() {
    this->config.createHomeDir = true;
    return *this;
}

AppBuilder& AppBuilder::withLocalDirectory() {
    this->config.createLocalDir = true;
    return *this;
}

AppBuilder& AppBuilder::withWorkingDirectory(fs::path workingDirectory) {
    this->config.workingDirectoryOverride = std::move(workingDirectory);
    return *this;
}

AppBuilder& AppBuilder::environment(Environment environment) {
    this->env = std::move(environment);
    return *this;
}

BuildAppResult AppBuilder::build() const {
    return buildApp(this->config, this->env);
}

} // namespace clienv
