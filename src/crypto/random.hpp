#pragma once

#include "fairtoken/common.hpp"

namespace fairtoken::crypto {

/**
 * Random number generation (CSPRNG)
 * Cryptographically secure random bytes from libsodium
 */
class Random {
public:
    /**
     * Initialize the underlying library. Safe to call repeatedly and
     * from several threads.
     * @throws ConfigurationError if no secure source is available
     */
    static void initialize();

    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static bytes generate(size_t size);

    /**
     * Generate random bytes into existing buffer
     * @param buffer Buffer to fill
     * @param size Buffer size
     */
    static void generate_into(byte* buffer, size_t size);
};

/**
 * Capability that fills a buffer with independent, uniformly
 * distributed bytes. Implementations must be safe to call from
 * several threads at once.
 */
class ByteSource {
public:
    ByteSource() = default;
    virtual ~ByteSource() = default;
    FAIRTOKEN_DISALLOW_COPY(ByteSource);

    virtual void fill(byte* buffer, size_t size) = 0;
};

/**
 * ByteSource backed by libsodium's randombytes_buf
 */
class SodiumByteSource : public ByteSource {
public:
    void fill(byte* buffer, size_t size) override;
};

/**
 * Process-wide SodiumByteSource shared by generators that were not
 * handed an explicit source.
 */
std::shared_ptr<ByteSource> system_byte_source();

} // namespace fairtoken::crypto
