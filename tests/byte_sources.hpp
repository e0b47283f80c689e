#pragma once

#include "crypto/random.hpp"
#include "fairtoken/error.hpp"
#include <atomic>
#include <vector>

namespace fairtoken::test_support {

// Every fill writes 0, 1, 2, ... wrapping at 256, starting over on each call
class SequenceByteSource : public crypto::ByteSource {
public:
    void fill(byte* buffer, size_t size) override {
        ++calls;
        for (size_t i = 0; i < size; ++i) {
            buffer[i] = static_cast<byte>(i % 256);
        }
    }

    std::atomic<size_t> calls{0};
};

// Replays a fixed script cyclically, continuing where the last fill stopped
class ScriptedByteSource : public crypto::ByteSource {
public:
    explicit ScriptedByteSource(bytes script) : script_(std::move(script)) {}

    void fill(byte* buffer, size_t size) override {
        fill_sizes.push_back(size);
        for (size_t i = 0; i < size; ++i) {
            buffer[i] = script_[position_];
            position_ = (position_ + 1) % script_.size();
        }
    }

    size_t calls() const { return fill_sizes.size(); }

    std::vector<size_t> fill_sizes;

private:
    bytes script_;
    size_t position_ = 0;
};

// Simulates a host without a secure source
class UnavailableByteSource : public crypto::ByteSource {
public:
    void fill(byte*, size_t) override {
        throw ConfigurationError(ErrorCode::RandomSourceUnavailable,
                                 "Secure random source unavailable");
    }
};

} // namespace fairtoken::test_support
