#pragma once

#include <filesystem>

namespace clienv {

/**
 * Process environment used to derive default app directories.
 * 
 * Platform-specific lookup:
 * - home directory: $HOME, falling back to the password database entry
 *   of the current user
 * - working directory: current path of the process
 * 
 * Either path is empty when the platform cannot supply it.
 */
struct Environment {
    std::filesystem::path homeDirectory;
    std::filesystem::path workingDirectory;
    
    /**
     * Capture the environment of the running process
     */
    static Environment current();
};

} // namespace clienv
