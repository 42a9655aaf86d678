#include "text_match.h"
#include <cstddef>

namespace domo_nlu {

std::regex compile_token_pattern(const std::string& body) {
    return std::regex("(?:^| )(" + body + ")(?= |$)", std::regex::ECMAScript | std::regex::optimize);
}

namespace {

bool search_segment(const std::regex& pattern, const std::string& text, size_t begin, size_t end,
                    TextSpan& span) {
    if (begin >= end) {
        return false;
    }
    std::smatch m;
    auto first = text.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = text.begin() + static_cast<std::ptrdiff_t>(end);
    if (!std::regex_search(first, last, m, pattern)) {
        return false;
    }
    span.start = begin + static_cast<size_t>(m.position(1));
    span.length = static_cast<size_t>(m.length(1));
    return true;
}

} // namespace

bool search_token_pattern(const std::regex& pattern, const std::string& text, TextSpan& span) {
    size_t segment_begin = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t token_end = text.find(' ', pos);
        if (token_end == std::string::npos) {
            token_end = text.size();
        }
        if (token_end - pos > kMaxSearchableToken) {
            // Segment ends before the space preceding the overlong token
            size_t segment_end = pos > segment_begin ? pos - 1 : segment_begin;
            if (search_segment(pattern, text, segment_begin, segment_end, span)) {
                return true;
            }
            segment_begin = token_end + 1;
        }
        pos = token_end + 1;
    }
    return search_segment(pattern, text, segment_begin, text.size(), span);
}

size_t find_phrase(const std::string& text, const std::string& phrase, size_t from) {
    if (phrase.empty()) return std::string::npos;
    size_t pos = text.find(phrase, from);
    while (pos != std::string::npos) {
        bool start_ok = (pos == 0 || text[pos - 1] == ' ');
        size_t end_pos = pos + phrase.size();
        bool end_ok = (end_pos == text.size() || text[end_pos] == ' ');
        if (start_ok && end_ok) {
            return pos;
        }
        pos = text.find(phrase, pos + 1);
    }
    return std::string::npos;
}

} // namespace domo_nlu
