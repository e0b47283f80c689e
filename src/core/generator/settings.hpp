#pragma once

#include "fairtoken/common.hpp"
#include "fairtoken/error.hpp"
#include "core/alphabet/alphabet.hpp"
#include "utils/config.hpp"
#include <vector>

namespace fairtoken::core {

/**
 * Generator parameters read from a configuration
 *
 * Keys:
 *   "alphabets" array of tag names, default ["a-z", "A-Z", "0-9"]
 *   "length"    characters per token, default 32
 *   "count"     tokens to produce, default 1
 */
struct GeneratorSettings {
    std::vector<AlphabetTag> alphabets = {
        AlphabetTag::Lowercase, AlphabetTag::Uppercase, AlphabetTag::Digits
    };
    int64_t length = constants::DEFAULT_TOKEN_LENGTH;
    size_t count = constants::DEFAULT_TOKEN_COUNT;

    static Result<GeneratorSettings> from_config(const utils::Config& config);

    /**
     * Write these settings back as configuration keys
     */
    void apply_to(utils::Config& config) const;
};

} // namespace fairtoken::core
