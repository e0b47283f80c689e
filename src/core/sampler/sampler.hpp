#pragma once

#include "fairtoken/common.hpp"
#include "core/alphabet/alphabet.hpp"
#include "crypto/random.hpp"
#include <string>

namespace fairtoken::core {

/**
 * Counters collected while sampling one string
 */
struct SamplerStats {
    size_t bytes_drawn = 0;
    size_t bytes_rejected = 0;
    size_t batch_fills = 0;
};

/**
 * Maps uniformly random bytes onto an arbitrary character set without
 * modulo bias.
 *
 * Bytes are pulled from the source in batches of BATCH_FACTOR * length,
 * capped at MAX_BATCH_SIZE, and consumed in order. A byte below the
 * rejection threshold selects charset[b % L]; any other byte is
 * discarded. A batch is refilled in full once exhausted.
 */
class UnbiasedSampler {
public:
    explicit UnbiasedSampler(crypto::ByteSource& source) : source_(source) {}

    /**
     * Draw a string of exactly `length` characters from `charset`
     * @param charset Between 1 and 256 characters
     * @param length Number of characters, must be positive
     * @param stats Optional counters, overwritten on success
     * @throws ValidationError if length <= 0
     * @throws ConfigurationError if charset is empty or too large
     */
    std::string sample(const CharacterSet& charset, int64_t length,
                       SamplerStats* stats = nullptr);

    /**
     * Largest multiple of charset_size not above 256. Zero when
     * charset_size is 0 or larger than 256.
     */
    static size_t rejection_threshold(size_t charset_size);

    /**
     * Number of bytes requested from the source per batch:
     * min(BATCH_FACTOR * length, MAX_BATCH_SIZE)
     */
    static size_t batch_size(size_t length);

private:
    crypto::ByteSource& source_;
};

} // namespace fairtoken::core
