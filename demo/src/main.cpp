#include <clienv/app_builder.h>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

using namespace clienv;

void printUsage(std::string_view programName) {
    fmt::print("Usage: {} [options]\n", programName);
    fmt::print("Options:\n");
    fmt::print("  -n, --name <app>           App name (default: cli-power-tools)\n");
    fmt::print("  -w, --working-dir <dir>    Base directory of the local app directory\n");
    fmt::print("  -s, --set <key=value>      Save a property to the local tier (repeatable)\n");
    fmt::print("  -g, --global <key=value>   Save a property to the home tier (repeatable)\n");
    fmt::print("  -k, --keep                 Keep the app directories instead of deleting them\n");
    fmt::print("  -h, --help                 Show this help message\n");
    fmt::print("\nExamples:\n");
    fmt::print("  {}                               # Create, print and delete ~/.cli-power-tools and ./.cli-power-tools\n", programName);
    fmt::print("  {} -g theme=dark -s theme=light  # Local value wins in the merged view\n", programName);
    fmt::print("  {} -n my-tool -k                 # Leave the directories in place\n", programName);
}

/**
 * Split "key=value" into its parts
 * @return false if there is no '=' or the key is empty
 */
bool parseAssignment(std::string_view assignment, PropertySet& properties) {
    const auto separator = assignment.find('=');
    if (separator == std::string_view::npos || separator == 0) {
        return false;
    }
    properties.insert_or_assign(std::string(assignment.substr(0, separator)), std::string(assignment.substr(separator + 1)));
    return true;
}

void printProperties(std::string_view title, const PropertySet& properties) {
    fmt::print("{} ({}):\n", title, properties.size());
    for (const auto& [key, value] : properties) {
        fmt::print("  {} = {}\n", key, value);
    }
}

int main(int argc, char* argv[])
{
    // Default values
    std::string appName = "cli-power-tools";
    std::string workingDirectory;
    PropertySet localProperties;
    PropertySet homeProperties;
    bool keep = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-n") == 0 || strcmp(argv[i], "--name") == 0) {
            if (i + 1 < argc) {
                appName = argv[++i];
            } else {
                fmt::print(stderr, "Error: --name requires an app name argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--working-dir") == 0) {
            if (i + 1 < argc) {
                workingDirectory = argv[++i];
            } else {
                fmt::print(stderr, "Error: --working-dir requires a directory argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--set") == 0
                || strcmp(argv[i], "-g") == 0 || strcmp(argv[i], "--global") == 0) {
            const bool global = argv[i][1] == 'g' || strcmp(argv[i], "--global") == 0;
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a key=value argument\n", argv[i]);
                return 1;
            }
            if (!parseAssignment(argv[++i], global ? homeProperties : localProperties)) {
                fmt::print(stderr, "Error: Invalid property '{}', expected key=value\n", argv[i]);
                return 1;
            }
        } else if (strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--keep") == 0) {
            keep = true;
        } else {
            fmt::print(stderr, "Error: Unknown option '{}'\n", argv[i]);
            printUsage(argv[0]);
            return 1;
        }
    }

    AppBuilder builder;
    builder.appName(appName)
        .withHomeDirectory()
        .withLocalDirectory();
    if (!workingDirectory.empty()) {
        builder.withWorkingDirectory(workingDirectory);
    }

    auto buildResult = builder.build();
    if (!buildResult.isOk()) {
        fmt::print(stderr, "Error: {}\n", buildResult.errorText());
        return 1;
    }
    const App& app = *buildResult.app();

    fmt::print("=== {} ===\n", app.getAppName());
    fmt::print("Home directory: {}\n", app.getHomeDir().string());
    fmt::print("Local directory: {}\n\n", app.getLocalDir().string());

    // Saved values are merged into what is already on disk
    const std::pair<bool, const PropertySet*> tiers[] = {{true, &homeProperties}, {false, &localProperties}};
    for (const auto& [isHome, properties] : tiers) {
        if (properties->empty()) {
            continue;
        }
        auto loadResult = isHome ? app.loadHomeProperties() : app.loadLocalProperties();
        if (!loadResult.isOk()) {
            fmt::print(stderr, "Error: {}\n", loadResult.errorText());
            return 1;
        }
        auto updated = mergeProperties(*loadResult.properties(), *properties);
        auto saveResult = isHome ? app.saveHomeProperties(updated) : app.saveLocalProperties(updated);
        if (!saveResult.isOk()) {
            fmt::print(stderr, "Error: {}\n", saveResult.errorText());
            return 1;
        }
        fmt::print("Saved {} {} properties\n", properties->size(), isHome ? "home" : "local");
    }

    auto mergedResult = app.getMergedProperties();
    if (!mergedResult.isOk()) {
        fmt::print(stderr, "Error: {}\n", mergedResult.errorText());
        return 1;
    }
    printProperties("Merged properties", *mergedResult.properties());

    if (keep) {
        fmt::print("\nKeeping app directories\n");
        return 0;
    }

    fmt::print("\n");
    auto deleteResult = app.deleteApp();
    if (!deleteResult.isOk()) {
        fmt::print(stderr, "Error: {}\n", deleteResult.errorText());
        return 1;
    }
    fmt::print("Removed {} entries\n", std::get<DeleteAppSuccess>(deleteResult.data).removedEntries);
    return 0;
}
