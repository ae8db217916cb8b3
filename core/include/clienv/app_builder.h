#pragma once

#include <clienv/app.h>
#include <clienv/app_errors.h>
#include <clienv/environment.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace clienv {

inline constexpr std::string_view defaultAppName = "app";

/**
 * Configuration consumed by buildApp().
 * Unset optionals fall back to paths derived from the app name and the environment.
 */
struct BuilderConfig {
    std::string appName;                                       // empty means defaultAppName
    std::optional<std::filesystem::path> homeDirOverride;
    std::optional<std::filesystem::path> localDirOverride;
    std::optional<std::filesystem::path> workingDirectoryOverride;  // base of the default local dir
    std::optional<std::string> homePropertiesFileName;         // default "{safe app name}.properties"
    std::optional<std::string> localPropertiesFileName;
    bool createHomeDir = false;
    bool createLocalDir = false;
};

struct BuildAppResult {
    std::variant<App, DirectoryCreationFailedError, EnvironmentLookupFailedError> data;

    bool isOk() const {
        return std::holds_alternative<App>(this->data);
    }

    /**
     * Built app, nullptr on failure
     */
    const App* app() const {
        return std::get_if<App>(&this->data);
    }

    std::string errorText() const;
};

/**
 * Resolve all app paths and create the requested directories.
 *
 * Directory names are always derived from the escaped app name, so
 * arbitrary names cannot add path separators. Relative overrides are
 * resolved against the working directory.
 */
BuildAppResult buildApp(const BuilderConfig& config, const Environment& environment);

/**
 * Fluent front end for BuilderConfig.
 *
 * Usage:
 *   auto result = AppBuilder()
 *       .appName("my-tool")
 *       .withHomeDirectory()
 *       .build();
 */
class AppBuilder {
public:
    explicit AppBuilder(Environment environment = Environment::current());

    AppBuilder& appName(std::string appName);
    AppBuilder& homeDir(std::filesystem::path homeDir);
    AppBuilder& localDir(std::filesystem::path localDir);

    /**
     * Name of the properties file inside the home directory.
     * The name is a single path segment and is escaped like the app name,
     * so "conf/app.properties" becomes "conf_app.properties".
     * An empty name keeps the default "{app name}.properties".
     */
    AppBuilder& homePropertiesFileName(std::string fileName);

    /**
     * Name of the properties file inside the local directory,
     * escaped the same way as homePropertiesFileName()
     */
    AppBuilder& localPropertiesFileName(std::string fileName);

    /**
     * Create the app home directory when building
     */
    AppBuilder& withHomeDirectory();

    /**
     * Create the app local directory when building
     */
    AppBuilder& withLocalDirectory();

    /**
     * Use another base directory than the environment working directory
     * for the default local directory
     */
    AppBuilder& withWorkingDirectory(std::filesystem::path workingDirectory);

    AppBuilder& environment(Environment environment);

    BuildAppResult build() const;

private:
    BuilderConfig config;
    Environment env;
};

} // namespace clienv
