#pragma once

#include "fairtoken/common.hpp"
#include "core/alphabet/alphabet.hpp"
#include "core/sampler/sampler.hpp"
#include "crypto/random.hpp"
#include <string>
#include <vector>

namespace fairtoken::core {

/**
 * Random string generator bound to an immutable base alphabet
 *
 * The base character set is resolved once at construction. Each call may
 * supply its own tags, which replace the base set for that call only.
 * Instances are safe to share between threads as long as the byte source
 * is.
 */
class RandomStringGenerator {
public:
    /**
     * @param base_tags Tags making up the base character set
     * @param source Secure byte source consumed by every call
     * @throws ConfigurationError if base_tags resolve to no characters
     */
    RandomStringGenerator(const std::vector<AlphabetTag>& base_tags,
                          std::shared_ptr<crypto::ByteSource> source);

    /**
     * Generate a string from the base character set
     * @throws ValidationError if length <= 0
     */
    std::string generate(int64_t length) const;

    /**
     * Generate a string, replacing the base character set with
     * `override_tags` when that list is non-empty
     */
    std::string generate(int64_t length, const std::vector<AlphabetTag>& override_tags,
                         SamplerStats* stats = nullptr) const;

    std::string operator()(int64_t length) const { return generate(length); }

    std::string operator()(int64_t length, const std::vector<AlphabetTag>& override_tags) const {
        return generate(length, override_tags);
    }

    const CharacterSet& base_charset() const { return base_charset_; }

private:
    CharacterSet base_charset_;
    std::shared_ptr<crypto::ByteSource> source_;
};

/**
 * Create a generator drawing from the process-wide secure source
 */
RandomStringGenerator create_generator(const std::vector<AlphabetTag>& base_tags);

/**
 * Create a generator drawing from the given source
 */
RandomStringGenerator create_generator(const std::vector<AlphabetTag>& base_tags,
                                       std::shared_ptr<crypto::ByteSource> source);

} // namespace fairtoken::core
