#pragma once

#include <clienv/app_errors.h>
#include <clienv/properties.h>

#include <filesystem>
#include <string>

namespace clienv {

struct BuilderConfig;
struct BuildAppResult;
struct Environment;

/**
 * On-disk environment of a command-line application.
 *
 * - A home directory named after the app in the user's home directory, e.g. ~/.{appName}
 * - A local directory named after the app in the working directory, e.g. ./.{appName}
 * - A properties file in each directory that can be read and written
 * - A merged view of both property sets where local values override home values
 * - Removal of both directories with deleteApp()
 *
 * Instances are created with AppBuilder or buildApp(). All paths are absolute and fixed
 * at construction. Property operations never create directories: a missing
 * tier directory means the app did not opt in to that tier.
 */
class App {
public:
    const std::string& getAppName() const;
    const std::filesystem::path& getHomeDir() const;
    const std::filesystem::path& getLocalDir() const;
    const std::filesystem::path& getHomePropertiesFile() const;
    const std::filesystem::path& getLocalPropertiesFile() const;

    /**
     * Check if the home directory currently exists on disk
     */
    bool hasHomeDir() const;

    /**
     * Check if the local directory currently exists on disk
     */
    bool hasLocalDir() const;

    /**
     * Load properties from the home properties file.
     * A missing file yields an empty set.
     */
    LoadPropertiesResult loadHomeProperties() const;

    /**
     * Load properties from the local properties file.
     * A missing file yields an empty set.
     */
    LoadPropertiesResult loadLocalProperties() const;

    /**
     * Overwrite the home properties file
     */
    SavePropertiesResult saveHomeProperties(const PropertySet& properties) const;

    /**
     * Overwrite the local properties file
     */
    SavePropertiesResult saveLocalProperties(const PropertySet& properties) const;

    /**
     * Load both tiers and merge them, local values win on key conflicts.
     * Fails if either tier directory is missing.
     */
    LoadPropertiesResult getMergedProperties() const;

    /**
     * Recursively delete the home and local directories.
     * Missing directories are skipped. Stops at the first entry that
     * cannot be removed; entries removed before that stay removed.
     */
    DeleteAppResult deleteApp() const;

private:
    friend BuildAppResult buildApp(const BuilderConfig& config, const Environment& environment);

    App(std::string appName,
        std::filesystem::path homeDir,
        std::filesystem::path localDir,
        std::filesystem::path homePropertiesFile,
        std::filesystem::path localPropertiesFile);

    static LoadPropertiesResult loadProperties(const std::filesystem::path& directory, const std::filesystem::path& file);
    static SavePropertiesResult saveProperties(const std::filesystem::path& directory, const std::filesystem::path& file, const PropertySet& properties);

private:
    std::string appName;
    std::filesystem::path homeDir;
    std::filesystem::path localDir;
    std::filesystem::path homePropertiesFile;
    std::filesystem::path localPropertiesFile;
};

} // namespace clienv
