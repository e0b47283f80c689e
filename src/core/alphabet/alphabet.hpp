#pragma once

#include "fairtoken/common.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fairtoken::core {

/**
 * Symbolic character classes a token may be drawn from
 */
enum class AlphabetTag : uint8_t {
    Lowercase,      // "a-z"
    Uppercase,      // "A-Z"
    Digits,         // "0-9"
    DashUnderscore  // "-_"
};

/**
 * Ordered characters eligible for sampling. A character listed by more
 * than one tag appears more than once and is drawn proportionally more
 * often.
 */
using CharacterSet = std::string;

/**
 * Parse a tag from its textual name ("a-z", "A-Z", "0-9", "-_")
 * @throws ConfigurationError for any other name
 */
AlphabetTag alphabet_from_string(const std::string& name);

/**
 * Textual name of a tag
 * @throws ConfigurationError for a value outside the enumeration
 */
std::string alphabet_to_string(AlphabetTag tag);

/**
 * Fixed character sequence of a single tag
 * @throws ConfigurationError for a value outside the enumeration
 */
std::string_view expand(AlphabetTag tag);

/**
 * Concatenate the expansions of tags in the given order
 * @param tags Tags to combine, duplicates allowed
 * @return Non-empty character set
 * @throws ConfigurationError if the result is empty
 */
CharacterSet resolve(const std::vector<AlphabetTag>& tags);

} // namespace fairtoken::core
