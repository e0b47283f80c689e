#include "generator.hpp"
#include "fairtoken/error.hpp"
#include "utils/logger.hpp"

namespace fairtoken::core {

RandomStringGenerator::RandomStringGenerator(const std::vector<AlphabetTag>& base_tags,
                                             std::shared_ptr<crypto::ByteSource> source)
    : base_charset_(resolve(base_tags))
    , source_(std::move(source)) {
    FAIRTOKEN_LOG_DEBUG("Created random string generator: {} tags, {} base characters",
                        base_tags.size(), base_charset_.size());
}

std::string RandomStringGenerator::generate(int64_t length) const {
    return generate(length, {});
}

std::string RandomStringGenerator::generate(int64_t length,
                                            const std::vector<AlphabetTag>& override_tags,
                                            SamplerStats* stats) const {
    if (length <= 0) {
        throw ValidationError(ErrorCode::LengthNotPositive,
                              "Length must be a positive integer.");
    }
    if (!source_) {
        throw ConfigurationError(ErrorCode::RandomSourceUnavailable,
                                 "No secure random source available for random string generation.");
    }

    UnbiasedSampler sampler(*source_);
    if (override_tags.empty()) {
        return sampler.sample(base_charset_, length, stats);
    }
    return sampler.sample(resolve(override_tags), length, stats);
}

RandomStringGenerator create_generator(const std::vector<AlphabetTag>& base_tags) {
    return RandomStringGenerator(base_tags, crypto::system_byte_source());
}

RandomStringGenerator create_generator(const std::vector<AlphabetTag>& base_tags,
                                       std::shared_ptr<crypto::ByteSource> source) {
    return RandomStringGenerator(base_tags, std::move(source));
}

} // namespace fairtoken::core
