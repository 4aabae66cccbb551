// include/options_ngin/sentiment/text_utils.hpp
#pragma once

#include <string>
#include <vector>

namespace options_ngin {
namespace sentiment {

constexpr size_t DEFAULT_MAX_TEXT_LENGTH = 512;

/**
 * @brief Clean a headline before scoring
 *
 * Strips HTML tags, decodes the common entities, collapses whitespace and
 * truncates to max_length bytes without splitting a UTF-8 sequence.
 */
std::string normalize_headline(const std::string& text,
                               size_t max_length = DEFAULT_MAX_TEXT_LENGTH);

/**
 * @brief Lower-case word tokens (letters, digits, apostrophes)
 */
std::vector<std::string> tokenize(const std::string& text);

}  // namespace sentiment
}  // namespace options_ngin
