#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace taskpilot::core::text {

inline std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

inline std::string uppercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return value;
}

inline std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Lowercases and collapses whitespace runs into single spaces.
inline std::string normalize(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (const char c : trim(value)) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

// True when `phrase` occurs in `text` as whole words: "train" does not match
// "training", so plural forms must be listed separately.
// Both arguments are expected to be normalized already.
inline bool contains_phrase(const std::string& text, const std::string& phrase) {
    if (phrase.empty()) {
        return false;
    }
    std::size_t pos = text.find(phrase);
    while (pos != std::string::npos) {
        const std::size_t end = pos + phrase.size();
        const bool starts_word =
            pos == 0 || std::isalnum(static_cast<unsigned char>(text[pos - 1])) == 0;
        const bool ends_word =
            end == text.size() || std::isalnum(static_cast<unsigned char>(text[end])) == 0;
        if (starts_word && ends_word) {
            return true;
        }
        pos = text.find(phrase, pos + 1);
    }
    return false;
}

inline std::string truncate(const std::string& value, std::size_t max_length) {
    if (value.size() <= max_length) {
        return value;
    }
    return value.substr(0, max_length) + "...";
}

}  // namespace taskpilot::core::text
