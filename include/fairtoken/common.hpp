#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <memory>

// Fairtoken Library Version
#define FAIRTOKEN_VERSION_MAJOR 0
#define FAIRTOKEN_VERSION_MINOR 1
#define FAIRTOKEN_VERSION_PATCH 0
#define FAIRTOKEN_VERSION_STRING "0.1.0"

// Utility macros
#define FAIRTOKEN_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

// Constants
namespace fairtoken {
namespace constants {

// Sampling constants
constexpr size_t BYTE_RANGE = 256;
constexpr size_t MAX_ALPHABET_SIZE = BYTE_RANGE;
constexpr size_t BATCH_FACTOR = 2; // bytes requested per output character
constexpr size_t MAX_BATCH_SIZE = 4096;

// Generation defaults
constexpr int64_t DEFAULT_TOKEN_LENGTH = 32;
constexpr size_t DEFAULT_TOKEN_COUNT = 1;

} // namespace constants
} // namespace fairtoken

// Core types
namespace fairtoken {

using byte = uint8_t;
using bytes = std::vector<byte>;

} // namespace fairtoken
