#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cerrno>
#include <cstdlib>

namespace guild_voice {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Parse a decimal unsigned 64-bit integer
 *
 * Accepts digits only (no sign, no surrounding whitespace, no trailing
 * garbage) and rejects values that overflow.
 */
inline std::optional<uint64_t> parse_u64(const std::string& str) {
    if (str.empty() || str.size() > 20) return std::nullopt;
    for (char c : str) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(str.c_str(), &end, 10);
    if (errno == ERANGE || end != str.c_str() + str.size()) return std::nullopt;
    return static_cast<uint64_t>(value);
}

/**
 * @brief Parse a device given by index; nullopt unless it names one of `device_count` devices
 */
inline std::optional<int> parse_device_index(const std::string& name, int device_count) {
    auto index = parse_u64(name);
    if (!index || device_count <= 0 || *index >= static_cast<uint64_t>(device_count)) {
        return std::nullopt;
    }
    return static_cast<int>(*index);
}

/**
 * @brief Split on a single-character delimiter, keeping empty fields
 */
inline std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        std::string::size_type pos = str.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

inline std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

/// Number of UTF-8 code points (continuation bytes are not counted)
inline size_t utf8_length(const std::string& str) {
    size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

/**
 * @brief First max_chars UTF-8 code points of str
 *
 * Never splits a multi-byte sequence.
 */
inline std::string utf8_prefix(const std::string& str, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if ((c & 0xC0) != 0x80) {
            if (count == max_chars) return str.substr(0, i);
            ++count;
        }
    }
    return str;
}

/**
 * @brief Trim and cap text sent to speech synthesis
 */
inline std::string clamp_tts_input(const std::string& text, size_t max_chars) {
    std::string trimmed = trim_copy(text);
    if (utf8_length(trimmed) <= max_chars) return trimmed;
    return utf8_prefix(trimmed, max_chars);
}

/**
 * @brief Single-line copy of text capped at max_chars, "..." appended when cut
 */
inline std::string truncate_for_tool_result(const std::string& text, size_t max_chars) {
    std::string compact = text;
    for (char& c : compact) {
        if (c == '\n') c = ' ';
    }
    if (utf8_length(compact) <= max_chars) return compact;
    return utf8_prefix(compact, max_chars) + "...";
}

} // namespace utils

} // namespace guild_voice
