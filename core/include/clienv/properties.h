#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace clienv {

/**
 * Flat key/value property set.
 * Sorted so that written files are deterministic.
 */
using PropertySet = std::map<std::string, std::string>;

/**
 * Header comment written at the top of every properties file
 */
inline constexpr std::string_view defaultPropertiesComment = "App properties";

struct PropertiesSyntaxError {
    size_t lineNumber = 0;
    std::string errorText;
};

struct ParsePropertiesResult {
    std::variant<PropertySet, PropertiesSyntaxError> data;
    
    bool isOk() const {
        return std::holds_alternative<PropertySet>(this->data);
    }
    
    std::string errorText() const;
};

/**
 * Parse text in the conventional properties file format.
 * 
 * Supported syntax:
 * - '#' and '!' comment lines, blank lines
 * - "key=value", "key:value" and "key value" entries
 * - line continuation with a trailing backslash
 * - escapes \t \n \r \f \uXXXX and backslash-quoted characters
 * 
 * Later entries overwrite earlier ones with the same key.
 */
ParsePropertiesResult parseProperties(std::string_view text);

/**
 * Serialize properties as one "key=value" line per entry, preceded by
 * a '#' comment line. The output always parses back to an equal set.
 * @param properties entries to write
 * @param comment header comment (may span several lines)
 */
std::string serializeProperties(const PropertySet& properties, std::string_view comment = defaultPropertiesComment);

/**
 * Merge two property sets, values from overrides win on key conflicts
 */
PropertySet mergeProperties(const PropertySet& base, const PropertySet& overrides);

} // namespace clienv
