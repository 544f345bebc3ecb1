// @src/test/compression_utils.test.cpp
#include "gtest/gtest.h"
#include "flowstore/compression_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <random>
#include <string>
#include <vector>

using namespace flowstore;

namespace {

std::string jsonLikeText(size_t length) {
    static const std::string chunk =
        "{\"name\":\"the user\",\"active\":true,\"tags\":[\"this\",\"that\"],\"note\":null},";
    std::string out;
    while (out.size() < length) out += chunk;
    out.resize(length);
    return out;
}

std::string randomBytes(size_t length, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out(length, '\0');
    for (auto& c : out) c = static_cast<char>(dist(rng));
    return out;
}

const std::vector<CompressionAlgorithm> kAllAlgorithms = {
    CompressionAlgorithm::FAST, CompressionAlgorithm::SIMPLE, CompressionAlgorithm::LZ77,
    CompressionAlgorithm::ZSTD, CompressionAlgorithm::LZ4,
};

} // namespace

class CompressionRoundTripTest : public ::testing::TestWithParam<CompressionAlgorithm> {};

TEST_P(CompressionRoundTripTest, TextLengthsRoundTripExactly) {
    const CompressionAlgorithm algorithm = GetParam();
    for (size_t length : {0u, 50u, 500u, 5000u}) {
        const std::string input = jsonLikeText(length);
        std::string compressed = CompressionManager::compress(input, algorithm);
        std::string restored = CompressionManager::decompress(compressed, algorithm, input.size());
        EXPECT_EQ(restored, input) << magic_enum::enum_name(algorithm) << " length " << length;
    }
}

TEST_P(CompressionRoundTripTest, ArbitraryBytesRoundTrip) {
    const CompressionAlgorithm algorithm = GetParam();
    std::string input = randomBytes(4096, 7);
    // Include every escape and marker byte the formats care about.
    input += std::string(300, '\0');
    input += std::string(10, '\xFF');
    input += std::string("\x00\x01\x00\xFF\xFF\x80", 6);

    std::string compressed = CompressionManager::compress(input, algorithm);
    EXPECT_EQ(CompressionManager::decompress(compressed, algorithm, input.size()), input);
}

INSTANTIATE_TEST_SUITE_P(AllAlgorithms, CompressionRoundTripTest, ::testing::ValuesIn(kAllAlgorithms),
                         [](const ::testing::TestParamInfo<CompressionAlgorithm>& info) {
                             return std::string(magic_enum::enum_name(info.param));
                         });

TEST(CompressionManagerTest, NoneIsIdentity) {
    const std::string input = "plain";
    EXPECT_EQ(CompressionManager::compress(input, CompressionAlgorithm::NONE), input);
    EXPECT_EQ(CompressionManager::decompress(input, CompressionAlgorithm::NONE, 0), input);
}

TEST(CompressionManagerTest, FastReplacesDictionaryPhrases) {
    const std::string input = "\":\"\",\"\":\"\",\"";
    std::string compressed = CompressionManager::compress(input, CompressionAlgorithm::FAST);
    EXPECT_LT(compressed.size(), input.size());
    EXPECT_EQ(static_cast<unsigned char>(compressed[0]), CompressionManager::FAST_ESCAPE);
}

TEST(CompressionManagerTest, RunLengthEncodesLongRuns) {
    const std::string input(200, 'a');
    std::string compressed = CompressionManager::compress(input, CompressionAlgorithm::SIMPLE);
    ASSERT_EQ(compressed.size(), 3u);
    EXPECT_EQ(compressed[0], '\0');
    EXPECT_EQ(static_cast<unsigned char>(compressed[1]), 200);
    EXPECT_EQ(compressed[2], 'a');
}

TEST(CompressionManagerTest, RunLengthSplitsRunsAboveMaximum) {
    const std::string input(600, 'z');
    std::string compressed = CompressionManager::compress(input, CompressionAlgorithm::SIMPLE);
    EXPECT_EQ(compressed.size(), 9u); // 255 + 255 + 90
    EXPECT_EQ(CompressionManager::decompress(compressed, CompressionAlgorithm::SIMPLE, input.size()), input);
}

TEST(CompressionManagerTest, Lz77ShrinksRepetitiveInput) {
    const std::string input = jsonLikeText(20000);
    std::string compressed = CompressionManager::compress(input, CompressionAlgorithm::LZ77);
    EXPECT_LT(compressed.size(), input.size() / 4);
}

TEST(CompressionManagerTest, MalformedStreamsThrow) {
    // Escape byte with nothing after it.
    EXPECT_THROW(CompressionManager::decompress(std::string(1, '\xFF'), CompressionAlgorithm::FAST, 0),
                 std::runtime_error);
    // Unknown dictionary index.
    EXPECT_THROW(CompressionManager::decompress(std::string("\xFF\x7F", 2), CompressionAlgorithm::FAST, 0),
                 std::runtime_error);
    // Run marker cut short.
    EXPECT_THROW(CompressionManager::decompress(std::string("\x00\x05", 2), CompressionAlgorithm::SIMPLE, 0),
                 std::runtime_error);
    // Back reference before the start of output.
    EXPECT_THROW(CompressionManager::decompress(std::string("\x80\x10\x00", 3), CompressionAlgorithm::LZ77, 100),
                 std::runtime_error);
}

TEST(CompressionManagerTest, Lz77RejectsOutputLargerThanHint) {
    const std::string input = jsonLikeText(1000);
    std::string compressed = CompressionManager::compress(input, CompressionAlgorithm::LZ77);
    EXPECT_THROW(CompressionManager::decompress(compressed, CompressionAlgorithm::LZ77, 10), std::runtime_error);
}
