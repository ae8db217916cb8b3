#include <clienv/file_name.h>

#include <algorithm>

namespace clienv {

namespace {

bool isSafeCharacter(char character) {
    return (character >= 'a' && character <= 'z')
        || (character >= 'A' && character <= 'Z')
        || (character >= '0' && character <= '9')
        || character == '.'
        || character == '-';
}

} // namespace

std::string escapeName(std::string_view name) {
    std::string result(name);
    std::replace_if(result.begin(), result.end(), [](char character) {
        return !isSafeCharacter(character);
    }, '_');
    return result;
}

bool isSafeName(std::string_view name) {
    return std::all_of(name.begin(), name.end(), isSafeCharacter);
}

} // namespace clienv
