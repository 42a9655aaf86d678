#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace domo_nlu {

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

/**
 * @brief ASCII lowercase (returns copy). Multi-byte UTF-8 sequences pass through untouched.
 */
inline std::string lower_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Split on single spaces, dropping empty pieces
 */
inline std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::string current;
    for (char c : str) {
        if (c == ' ') {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

/**
 * @brief Join words with a single space
 */
inline std::string join_words(const std::vector<std::string>& words, size_t begin = 0,
                              size_t end = std::string::npos) {
    std::string out;
    end = std::min(end, words.size());
    for (size_t i = begin; i < end; ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

/**
 * @brief Collapse runs of spaces to one and trim both ends
 */
inline std::string collapse_spaces(const std::string& str) {
    return join_words(split_words(str));
}

} // namespace utils

} // namespace domo_nlu
