#pragma once

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace uldas {

inline std::string trim(const std::string& text) {
    const char* ws = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

inline std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

inline std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

inline std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

/**
 * @brief Decode UTF-8 into code points
 *
 * Invalid or truncated sequences decode as U+FFFD, one per offending byte.
 */
inline std::u32string utf8_to_codepoints(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
        else { out.push_back(0xFFFD); ++i; continue; }

        if (i + len > text.size()) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

inline size_t utf8_length(const std::string& text) {
    return utf8_to_codepoints(text).size();
}

// Fixed-point text without touching the stream's format flags
inline std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace uldas
