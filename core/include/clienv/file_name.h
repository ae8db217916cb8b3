#pragma once

#include <string>
#include <string_view>

namespace clienv {

/**
 * Escape a name for safe use as a single file or directory name.
 * 
 * Every byte that is not an ASCII letter, digit, '.' or '-' is replaced
 * with '_'. The result always has the same length as the input.
 * 
 * Examples:
 * - "my-app.1"  -> "my-app.1"
 * - "my/app:1?" -> "my_app_1_"
 * - "!@#"       -> "___"
 */
std::string escapeName(std::string_view name);

/**
 * Check whether escapeName() would return the name unchanged
 */
bool isSafeName(std::string_view name);

} // namespace clienv
