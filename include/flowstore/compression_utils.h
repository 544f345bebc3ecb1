// @filename: include/flowstore/compression_utils.h
#pragma once
#include "types.h"

#include <string>
#include <vector>

namespace flowstore {

/**
 * Byte-oriented compressors. Every algorithm accepts arbitrary bytes and
 * decompress(compress(x)) == x exactly; malformed input to decompress throws
 * std::runtime_error.
 *
 * FAST   - dictionary substitution of frequent JSON/English phrases.
 *          0xFF is the escape byte: 0xFF 0xFF is a literal 0xFF,
 *          0xFF i expands dictionary entry i.
 * SIMPLE - run-length encoding. 0x00 introduces a run: 0x00 count byte.
 *          Runs longer than 3 and every literal 0x00 are emitted as runs.
 * LZ77   - token stream. A token t < 0x80 is followed by t+1 literal bytes;
 *          t >= 0x80 is a back reference of length (t & 0x7F) + 4 followed
 *          by a little-endian 16-bit distance.
 * ZSTD / LZ4 - library codecs.
 */
class CompressionManager {
public:
    static constexpr unsigned char FAST_ESCAPE = 0xFF;
    static constexpr unsigned char RLE_MARKER = 0x00;
    static constexpr size_t RLE_MIN_RUN = 4;
    static constexpr size_t RLE_MAX_RUN = 255;
    static constexpr size_t LZ77_MIN_MATCH = 4;
    static constexpr size_t LZ77_MAX_MATCH = 131;
    static constexpr size_t LZ77_WINDOW = 65535;
    static constexpr size_t LZ77_MAX_LITERAL_RUN = 128;

    // level: 0 for library default, only used by ZSTD.
    static std::string compress(const std::string& input, CompressionAlgorithm algorithm, int level = 0);

    // uncompressed_size_hint is required by ZSTD and LZ4 to size the output buffer.
    static std::string decompress(const std::string& input, CompressionAlgorithm algorithm,
                                  size_t uncompressed_size_hint);

    static const std::vector<std::string>& fastDictionary();

private:
    static std::string compressFast(const std::string& input);
    static std::string decompressFast(const std::string& input);
    static std::string compressRunLength(const std::string& input);
    static std::string decompressRunLength(const std::string& input);
    static std::string compressLz77(const std::string& input);
    static std::string decompressLz77(const std::string& input, size_t size_limit);
    static std::string compressZstd(const std::string& input, int level);
    static std::string decompressZstd(const std::string& input, size_t uncompressed_size_hint);
    static std::string compressLz4(const std::string& input);
    static std::string decompressLz4(const std::string& input, size_t uncompressed_size_hint);
};

} // namespace flowstore
