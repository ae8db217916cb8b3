/**
 * POSIX (Linux/macOS) implementation of Environment
 */

#include <clienv/environment.h>

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace clienv {

namespace {

std::filesystem::path lookupHomeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    
    // HOME is unset for some daemons and sudo setups
    if (const passwd* entry = getpwuid(getuid()); entry && entry->pw_dir) {
        return entry->pw_dir;
    }
    return {};
}

std::filesystem::path lookupWorkingDirectory() {
    std::error_code errorCode;
    auto workingDirectory = std::filesystem::current_path(errorCode);
    if (errorCode) {
        return {};
    }
    return workingDirectory;
}

} // namespace

Environment Environment::current() {
    return Environment{lookupHomeDirectory(), lookupWorkingDirectory()};
}

} // namespace clienv
