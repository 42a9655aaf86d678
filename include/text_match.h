#pragma once

/**
 * @file text_match.h
 * @brief Token-bounded matching over normalized (single-spaced) text
 */

#include "common.h"
#include <string>
#include <regex>

namespace domo_nlu {

/**
 * Compile BODY so it only matches whole space-delimited tokens.
 * The body may only use non-capturing groups; the match itself is capture group 1.
 * Throws std::regex_error for an invalid body.
 */
std::regex compile_token_pattern(const std::string& body);

/// Tokens longer than this are never searched; no vocabulary word comes close
constexpr size_t kMaxSearchableToken = 64;

/**
 * Find the earliest token-bounded occurrence of a compiled pattern.
 * Text is searched in the segments between overlong tokens, which bounds
 * the recursion depth of std::regex no matter how long the input is.
 * @return true and fills span (capture group 1) on a hit
 */
bool search_token_pattern(const std::regex& pattern, const std::string& text, TextSpan& span);

/**
 * Find a literal phrase as a token-bounded substring of text, starting at from.
 * @return byte offset or std::string::npos
 */
size_t find_phrase(const std::string& text, const std::string& phrase, size_t from = 0);

} // namespace domo_nlu
