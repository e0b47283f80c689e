#include "random.hpp"
#include "fairtoken/error.hpp"
#include <sodium.h>

namespace fairtoken::crypto {

void Random::initialize() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw ConfigurationError(ErrorCode::RandomSourceUnavailable,
                                 "Secure random source unavailable: libsodium failed to initialize");
    }
}

bytes Random::generate(size_t size) {
    bytes result(size);
    generate_into(result.data(), size);
    return result;
}

void Random::generate_into(byte* buffer, size_t size) {
    initialize();
    if (size == 0) {
        return;
    }
    randombytes_buf(buffer, size);
}

void SodiumByteSource::fill(byte* buffer, size_t size) {
    Random::generate_into(buffer, size);
}

std::shared_ptr<ByteSource> system_byte_source() {
    static const std::shared_ptr<ByteSource> source = std::make_shared<SodiumByteSource>();
    return source;
}

} // namespace fairtoken::crypto
