#include <gtest/gtest.h>
#include "core/sampler/sampler.hpp"
#include "core/alphabet/alphabet.hpp"
#include "fairtoken/error.hpp"
#include "utils/logger.hpp"
#include "byte_sources.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <map>
#include <sstream>

using namespace fairtoken;
using namespace fairtoken::core;
using fairtoken::test_support::ScriptedByteSource;
using fairtoken::test_support::SequenceByteSource;
using fairtoken::test_support::UnavailableByteSource;

namespace {
    const CharacterSet DIGITS = "0123456789";
}

TEST(SamplerTest, RejectionThreshold) {
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(1), 256u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(2), 256u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(10), 250u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(26), 234u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(36), 252u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(62), 248u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(64), 256u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(100), 200u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(129), 129u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(256), 256u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(0), 0u);
    EXPECT_EQ(UnbiasedSampler::rejection_threshold(257), 0u);
}

TEST(SamplerTest, ThresholdIsAtLeastAlphabetSize) {
    for (size_t size = 1; size <= 256; ++size) {
        size_t threshold = UnbiasedSampler::rejection_threshold(size);
        EXPECT_GE(threshold, size);
        EXPECT_LE(threshold, 256u);
        EXPECT_EQ(threshold % size, 0u);
        EXPECT_LT(256 - threshold, size);
    }
}

TEST(SamplerTest, BatchIsTwiceTheLength) {
    EXPECT_EQ(UnbiasedSampler::batch_size(1), 2u);
    EXPECT_EQ(UnbiasedSampler::batch_size(16), 32u);
    EXPECT_EQ(UnbiasedSampler::batch_size(256), 512u);
    EXPECT_EQ(UnbiasedSampler::batch_size(2048), 4096u);
}

TEST(SamplerTest, BatchIsCappedForLongStrings) {
    EXPECT_EQ(UnbiasedSampler::batch_size(2049), 4096u);
    EXPECT_EQ(UnbiasedSampler::batch_size(10000000000ULL), 4096u);

    ScriptedByteSource source({0});
    UnbiasedSampler sampler(source);
    SamplerStats stats;

    auto result = sampler.sample("x", 5000, &stats);
    EXPECT_EQ(result, std::string(5000, 'x'));
    EXPECT_EQ(stats.batch_fills, 2u);
    EXPECT_EQ(source.fill_sizes, std::vector<size_t>({4096, 4096}));
}

TEST(SamplerTest, RejectsBytesAtOrAboveThreshold) {
    // 250 is the threshold for ten characters
    ScriptedByteSource source({255, 250, 7, 249, 10});
    UnbiasedSampler sampler(source);
    SamplerStats stats;

    EXPECT_EQ(sampler.sample(DIGITS, 3, &stats), "790");
    EXPECT_EQ(stats.bytes_drawn, 5u);
    EXPECT_EQ(stats.bytes_rejected, 2u);
    EXPECT_EQ(stats.batch_fills, 1u);
    EXPECT_EQ(source.fill_sizes, std::vector<size_t>({6}));
}

TEST(SamplerTest, RefillsFullBatchWhenExhausted) {
    ScriptedByteSource source({255, 255, 255, 255, 255, 3});
    UnbiasedSampler sampler(source);
    SamplerStats stats;

    EXPECT_EQ(sampler.sample(DIGITS, 2, &stats), "33");
    EXPECT_EQ(stats.bytes_drawn, 12u);
    EXPECT_EQ(stats.bytes_rejected, 10u);
    EXPECT_EQ(stats.batch_fills, 3u);
    EXPECT_EQ(source.fill_sizes, std::vector<size_t>({4, 4, 4}));
}

TEST(SamplerTest, EveryAcceptedByteCycleIsUniform) {
    // Bytes 0..249 map onto each digit exactly 25 times; plain modulo
    // over 0..255 would give digits 0-5 one extra hit
    SequenceByteSource source;
    UnbiasedSampler sampler(source);
    SamplerStats stats;

    auto result = sampler.sample(DIGITS, 250, &stats);
    ASSERT_EQ(result.size(), 250u);
    EXPECT_EQ(stats.bytes_rejected, 0u);

    std::map<char, int> counts;
    for (char c : result) {
        counts[c]++;
    }
    ASSERT_EQ(counts.size(), 10u);
    for (const auto& [c, count] : counts) {
        EXPECT_EQ(count, 25) << "character " << c;
    }
}

TEST(SamplerTest, SkipsTailOfByteRange) {
    SequenceByteSource source;
    UnbiasedSampler sampler(source);
    SamplerStats stats;

    auto result = sampler.sample(DIGITS, 251, &stats);
    ASSERT_EQ(result.size(), 251u);
    EXPECT_EQ(result.back(), '0');
    EXPECT_EQ(stats.bytes_drawn, 257u);
    EXPECT_EQ(stats.bytes_rejected, 6u);
    EXPECT_EQ(stats.batch_fills, 1u);
}

TEST(SamplerTest, SingleCharacterNeverRejects) {
    ScriptedByteSource source({255});
    UnbiasedSampler sampler(source);
    SamplerStats stats;

    EXPECT_EQ(sampler.sample("x", 5, &stats), "xxxxx");
    EXPECT_EQ(stats.bytes_rejected, 0u);
    EXPECT_EQ(stats.bytes_drawn, 5u);
}

TEST(SamplerTest, FullByteRangeAlphabetMapsIdentity) {
    CharacterSet charset;
    for (int i = 0; i < 256; ++i) {
        charset.push_back(static_cast<char>(i));
    }

    ScriptedByteSource source({255, 0, 128});
    UnbiasedSampler sampler(source);
    SamplerStats stats;

    auto result = sampler.sample(charset, 3, &stats);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(static_cast<byte>(result[0]), 255);
    EXPECT_EQ(static_cast<byte>(result[1]), 0);
    EXPECT_EQ(static_cast<byte>(result[2]), 128);
    EXPECT_EQ(stats.bytes_rejected, 0u);
}

TEST(SamplerTest, NonPositiveLengthDrawsNothing) {
    ScriptedByteSource source({1});
    UnbiasedSampler sampler(source);

    for (int64_t length : {int64_t{0}, int64_t{-1}, int64_t{-5}}) {
        try {
            sampler.sample(DIGITS, length);
            FAIL() << "Expected ValidationError for length " << length;
        } catch (const ValidationError& e) {
            EXPECT_EQ(e.code(), ErrorCode::LengthNotPositive);
            EXPECT_STREQ(e.what(), "Length must be a positive integer.");
        }
    }
    EXPECT_EQ(source.calls(), 0u);
}

TEST(SamplerTest, EmptyCharsetIsConfigurationError) {
    ScriptedByteSource source({1});
    UnbiasedSampler sampler(source);

    EXPECT_THROW(sampler.sample("", 4), ConfigurationError);
    EXPECT_EQ(source.calls(), 0u);
}

TEST(SamplerTest, OversizedCharsetIsConfigurationError) {
    ScriptedByteSource source({1});
    UnbiasedSampler sampler(source);
    CharacterSet charset(257, 'a');

    try {
        sampler.sample(charset, 4);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AlphabetTooLarge);
    }
    EXPECT_EQ(source.calls(), 0u);
}

TEST(SamplerTest, SourceFailurePropagates) {
    UnavailableByteSource source;
    UnbiasedSampler sampler(source);
    SamplerStats stats;
    stats.bytes_drawn = 99;

    EXPECT_THROW(sampler.sample(DIGITS, 8, &stats), ConfigurationError);
    EXPECT_EQ(stats.bytes_drawn, 99u);
}

TEST(SamplerTest, SecureSourceProducesMembersOfCharset) {
    crypto::SodiumByteSource source;
    UnbiasedSampler sampler(source);
    auto charset = resolve({AlphabetTag::Lowercase, AlphabetTag::DashUnderscore});

    for (int64_t length : {1, 2, 7, 64, 1000}) {
        auto result = sampler.sample(charset, length);
        ASSERT_EQ(result.size(), static_cast<size_t>(length));
        for (char c : result) {
            EXPECT_NE(charset.find(c), std::string::npos) << "unexpected character " << c;
        }
    }
}

TEST(SamplerLoggingTest, TracesEveryBatchRefill) {
    std::ostringstream log;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log);
    sink->set_pattern("%v");
    utils::Logger::init("trace");
    utils::Logger::get()->sinks().push_back(sink);

    ScriptedByteSource source({255, 255, 255, 255, 255, 3});
    UnbiasedSampler sampler(source);
    EXPECT_EQ(sampler.sample(DIGITS, 2), "33");
    utils::Logger::get()->flush();

    const std::string text = log.str();
    size_t refills = 0;
    for (size_t pos = text.find("Refilled 4-byte batch"); pos != std::string::npos;
         pos = text.find("Refilled 4-byte batch", pos + 1)) {
        ++refills;
    }
    EXPECT_EQ(refills, 3u);
    EXPECT_NE(text.find("Sampled 2 characters from 10-character alphabet"), std::string::npos);
    EXPECT_EQ(text.find("33"), std::string::npos);

    utils::Logger::init("info");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
