#include "sampler.hpp"
#include "fairtoken/error.hpp"
#include "utils/logger.hpp"

namespace fairtoken::core {

size_t UnbiasedSampler::rejection_threshold(size_t charset_size) {
    if (charset_size == 0 || charset_size > constants::BYTE_RANGE) {
        return 0;
    }
    return (constants::BYTE_RANGE / charset_size) * charset_size;
}

size_t UnbiasedSampler::batch_size(size_t length) {
    if (length > constants::MAX_BATCH_SIZE / constants::BATCH_FACTOR) {
        return constants::MAX_BATCH_SIZE;
    }
    return length * constants::BATCH_FACTOR;
}

std::string UnbiasedSampler::sample(const CharacterSet& charset, int64_t length,
                                    SamplerStats* stats) {
    if (length <= 0) {
        throw ValidationError(ErrorCode::LengthNotPositive,
                              "Length must be a positive integer.");
    }
    if (charset.empty()) {
        throw ConfigurationError(ErrorCode::AlphabetEmpty,
                                 "No valid characters provided for random string generation.");
    }
    if (charset.size() > constants::MAX_ALPHABET_SIZE) {
        throw ConfigurationError(ErrorCode::AlphabetTooLarge,
                                 "Alphabet has " + std::to_string(charset.size()) +
                                 " characters, at most " +
                                 std::to_string(constants::MAX_ALPHABET_SIZE) + " are supported");
    }

    const size_t target = static_cast<size_t>(length);
    const size_t charset_size = charset.size();
    const size_t threshold = rejection_threshold(charset_size);

    bytes batch(batch_size(target));
    size_t index = batch.size(); // forces a fill on first draw
    SamplerStats counters;

    std::string result;
    result.reserve(target);

    while (result.size() < target) {
        if (index >= batch.size()) {
            source_.fill(batch.data(), batch.size());
            index = 0;
            ++counters.batch_fills;
            FAIRTOKEN_LOG_TRACE("Refilled {}-byte batch ({} of {} characters accepted)",
                                batch.size(), result.size(), target);
        }

        const byte value = batch[index++];
        ++counters.bytes_drawn;

        if (value < threshold) {
            result.push_back(charset[value % charset_size]);
        } else {
            ++counters.bytes_rejected;
        }
    }

    FAIRTOKEN_LOG_TRACE("Sampled {} characters from {}-character alphabet: {} bytes drawn, {} rejected, {} batch fills",
                        target, charset_size, counters.bytes_drawn,
                        counters.bytes_rejected, counters.batch_fills);

    if (stats) {
        *stats = counters;
    }
    return result;
}

} // namespace fairtoken::core
