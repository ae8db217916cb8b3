#include <clienv/properties.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>
#include <fmt/core.h>

namespace clienv {

namespace {

struct LogicalLine {
    std::string text;
    size_t lineNumber = 0;
};

bool isBlank(char character) {
    return character == ' ' || character == '\t' || character == '\f';
}

size_t skipBlanks(std::string_view text, size_t position) {
    while (position < text.size() && isBlank(text[position])) {
        ++position;
    }
    return position;
}

/**
 * Split text into natural lines, accepting "\n", "\r" and "\r\n"
 */
std::vector<std::string_view> splitNaturalLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t lineStart = 0;
    size_t position = 0;
    while (position < text.size()) {
        const char character = text[position];
        if (character == '\n' || character == '\r') {
            lines.push_back(text.substr(lineStart, position - lineStart));
            if (character == '\r' && position + 1 < text.size() && text[position + 1] == '\n') {
                ++position;
            }
            lineStart = position + 1;
        }
        ++position;
    }
    if (lineStart < text.size()) {
        lines.push_back(text.substr(lineStart));
    }
    return lines;
}

size_t countTrailingBackslashes(std::string_view line) {
    size_t count = 0;
    for (auto it = line.rbegin(); it != line.rend() && *it == '\\'; ++it) {
        ++count;
    }
    return count;
}

/**
 * Join continuation lines and drop comments and blank lines.
 * Escapes are left in place for the entry parser.
 */
std::vector<LogicalLine> readLogicalLines(std::string_view text) {
    std::vector<LogicalLine> logicalLines;
    const auto naturalLines = splitNaturalLines(text);

    for (size_t index = 0; index < naturalLines.size(); ++index) {
        std::string_view line = naturalLines[index];
        line.remove_prefix(skipBlanks(line, 0));
        if (line.empty() || line.front() == '#' || line.front() == '!') {
            continue;
        }

        LogicalLine logicalLine;
        logicalLine.lineNumber = index + 1;

        // An odd number of trailing backslashes escapes the line terminator
        while (countTrailingBackslashes(line) % 2 == 1) {
            line.remove_suffix(1);
            logicalLine.text.append(line);
            if (index + 1 >= naturalLines.size()) {
                line = {};
                break;
            }
            line = naturalLines[++index];
            line.remove_prefix(skipBlanks(line, 0));
        }
        logicalLine.text.append(line);
        logicalLines.push_back(std::move(logicalLine));
    }
    return logicalLines;
}

std::optional<uint32_t> parseHexCodeUnit(std::string_view digits) {
    if (digits.size() != 4) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (const char digit : digits) {
        value <<= 4;
        if (digit >= '0' && digit <= '9') {
            value |= static_cast<uint32_t>(digit - '0');
        } else if (digit >= 'a' && digit <= 'f') {
            value |= static_cast<uint32_t>(digit - 'a' + 10);
        } else if (digit >= 'A' && digit <= 'F') {
            value |= static_cast<uint32_t>(digit - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return value;
}

void appendUtf8(std::string& output, uint32_t codePoint) {
    if (codePoint < 0x80) {
        output += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        output += static_cast<char>(0xC0 | (codePoint >> 6));
        output += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        output += static_cast<char>(0xE0 | (codePoint >> 12));
        output += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        output += static_cast<char>(0xF0 | (codePoint >> 18));
        output += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

bool isHighSurrogate(uint32_t codeUnit) {
    return codeUnit >= 0xD800 && codeUnit <= 0xDBFF;
}

bool isLowSurrogate(uint32_t codeUnit) {
    return codeUnit >= 0xDC00 && codeUnit <= 0xDFFF;
}

/**
 * Decode backslash escapes of a key or value
 * @return decoded text or nullopt on a malformed \uXXXX escape
 */
std::optional<std::string> unescape(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t position = 0;
    while (position < text.size()) {
        const char character = text[position++];
        if (character != '\\') {
            result += character;
            continue;
        }
        if (position >= text.size()) {
            break;
        }

        const char escaped = text[position++];
        switch (escaped) {
            case 't': result += '\t'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 'f': result += '\f'; break;
            case 'u': {
                auto codeUnit = parseHexCodeUnit(text.substr(position, 4));
                if (!codeUnit) {
                    return std::nullopt;
                }
                position += 4;
                uint32_t codePoint = *codeUnit;

                if (isHighSurrogate(codePoint) && text.substr(position, 2) == "\\u") {
                    auto lowUnit = parseHexCodeUnit(text.substr(position + 2, 4));
                    if (lowUnit && isLowSurrogate(*lowUnit)) {
                        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (*lowUnit - 0xDC00);
                        position += 6;
                    }
                }
                if (isHighSurrogate(codePoint) || isLowSurrogate(codePoint)) {
                    codePoint = 0xFFFD; // unpaired surrogate
                }
                appendUtf8(result, codePoint);
                break;
            }
            default:
                result += escaped;
                break;
        }
    }
    return result;
}

void escapeInto(std::string& output, std::string_view text, bool isKey) {
    for (size_t index = 0; index < text.size(); ++index) {
        const char character = text[index];
        switch (character) {
            case '\\': output += "\\\\"; break;
            case '\t': output += "\\t"; break;
            case '\n': output += "\\n"; break;
            case '\r': output += "\\r"; break;
            case '\f': output += "\\f"; break;
            case '=':
            case ':':
            case '#':
            case '!':
                output += '\\';
                output += character;
                break;
            case ' ':
                if (isKey || index == 0) {
                    output += '\\';
                }
                output += ' ';
                break;
            default:
                output += character;
                break;
        }
    }
}

} // namespace

std::string ParsePropertiesResult::errorText() const {
    if (auto* syntaxError = std::get_if<PropertiesSyntaxError>(&this->data)) {
        return fmt::format("line {}: {}", syntaxError->lineNumber, syntaxError->errorText);
    }
    return {};
}

ParsePropertiesResult parseProperties(std::string_view text) {
    PropertySet properties;

    for (const auto& logicalLine : readLogicalLines(text)) {
        const std::string_view line = logicalLine.text;

        // Key ends at the first unescaped separator or blank
        size_t keyLength = 0;
        size_t valueStart = line.size();
        bool hasSeparator = false;
        bool precedingBackslash = false;
        for (; keyLength < line.size(); ++keyLength) {
            const char character = line[keyLength];
            if ((character == '=' || character == ':') && !precedingBackslash) {
                valueStart = keyLength + 1;
                hasSeparator = true;
                break;
            }
            if (isBlank(character) && !precedingBackslash) {
                valueStart = keyLength + 1;
                break;
            }
            precedingBackslash = character == '\\' ? !precedingBackslash : false;
        }

        // "key = value" and "key value" both skip blanks around the separator
        while (valueStart < line.size()) {
            const char character = line[valueStart];
            if (!isBlank(character)) {
                if (!hasSeparator && (character == '=' || character == ':')) {
                    hasSeparator = true;
                } else {
                    break;
                }
            }
            ++valueStart;
        }

        auto key = unescape(line.substr(0, keyLength));
        auto value = unescape(line.substr(std::min(valueStart, line.size())));
        if (!key || !value) {
            return {PropertiesSyntaxError{logicalLine.lineNumber, "Malformed \\uxxxx encoding"}};
        }
        properties.insert_or_assign(std::move(*key), std::move(*value));
    }

    return {std::move(properties)};
}

std::string serializeProperties(const PropertySet& properties, std::string_view comment) {
    std::string output;

    for (const auto& commentLine : splitNaturalLines(comment)) {
        output += '#';
        output.append(commentLine);
        output += '\n';
    }

    for (const auto& [key, value] : properties) {
        escapeInto(output, key, true);
        output += '=';
        escapeInto(output, value, false);
        output += '\n';
    }
    return output;
}

PropertySet mergeProperties(const PropertySet& base, const PropertySet& overrides) {
    PropertySet merged = base;
    for (const auto& [key, value] : overrides) {
        merged.insert_or_assign(key, value);
    }
    return merged;
}

} // namespace clienv
