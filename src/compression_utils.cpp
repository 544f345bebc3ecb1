// @filename: src/compression_utils.cpp
#include "flowstore/compression_utils.h"
#include "flowstore/debug_utils.h"
#include <zstd.h>
#include <lz4.h>
#include <magic_enum/magic_enum.hpp>
#include <stdexcept>
#include <algorithm>
#include <cstring>
#include <limits>

namespace flowstore {

namespace {

constexpr size_t LZ77_HASH_BITS = 15;
constexpr size_t LZ77_MAX_CHAIN = 64;
constexpr size_t MAX_DECOMPRESSED_SIZE = 256u * 1024u * 1024u;

inline uint32_t lz77Hash(const std::string& in, size_t pos) {
    uint32_t v;
    std::memcpy(&v, in.data() + pos, sizeof(v));
    return (v * 2654435761u) >> (32 - LZ77_HASH_BITS);
}

} // namespace

const std::vector<std::string>& CompressionManager::fastDictionary() {
    // Indices are part of the FAST format; append only.
    static const std::vector<std::string> dictionary = {
        "the ", "and ", "for ", "are ", "with ", "this ", "that ", "from ",
        "\":\"", "\",\"", "true", "false", "null", "\":{\"", "\"},{\"", "\":[",
    };
    return dictionary;
}

std::string CompressionManager::compress(const std::string& input, CompressionAlgorithm algorithm, int level) {
    if (algorithm == CompressionAlgorithm::NONE || input.empty()) {
        return input;
    }
    LOG_TRACE("[CompressionManager::compress] {} on {} bytes", magic_enum::enum_name(algorithm), input.size());
    switch (algorithm) {
        case CompressionAlgorithm::FAST: return compressFast(input);
        case CompressionAlgorithm::SIMPLE: return compressRunLength(input);
        case CompressionAlgorithm::LZ77: return compressLz77(input);
        case CompressionAlgorithm::ZSTD: return compressZstd(input, level);
        case CompressionAlgorithm::LZ4: return compressLz4(input);
        default:
            throw std::runtime_error("Unsupported compression algorithm: " +
                                     std::to_string(static_cast<int>(algorithm)));
    }
}

std::string CompressionManager::decompress(const std::string& input, CompressionAlgorithm algorithm,
                                           size_t uncompressed_size_hint) {
    if (algorithm == CompressionAlgorithm::NONE || input.empty()) {
        return input;
    }
    switch (algorithm) {
        case CompressionAlgorithm::FAST: return decompressFast(input);
        case CompressionAlgorithm::SIMPLE: return decompressRunLength(input);
        case CompressionAlgorithm::LZ77:
            return decompressLz77(input, uncompressed_size_hint > 0 ? uncompressed_size_hint : MAX_DECOMPRESSED_SIZE);
        case CompressionAlgorithm::ZSTD: return decompressZstd(input, uncompressed_size_hint);
        case CompressionAlgorithm::LZ4: return decompressLz4(input, uncompressed_size_hint);
        default:
            throw std::runtime_error("Unsupported compression algorithm: " +
                                     std::to_string(static_cast<int>(algorithm)));
    }
}

// --- FAST: dictionary substitution ---

std::string CompressionManager::compressFast(const std::string& input) {
    const auto& dict = fastDictionary();
    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        size_t best_index = dict.size();
        size_t best_len = 0;
        for (size_t d = 0; d < dict.size(); ++d) {
            const std::string& phrase = dict[d];
            if (phrase.size() > best_len && input.compare(i, phrase.size(), phrase) == 0) {
                best_index = d;
                best_len = phrase.size();
            }
        }
        if (best_len > 0) {
            out.push_back(static_cast<char>(FAST_ESCAPE));
            out.push_back(static_cast<char>(best_index));
            i += best_len;
            continue;
        }
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c == FAST_ESCAPE) {
            out.push_back(static_cast<char>(FAST_ESCAPE));
        }
        out.push_back(static_cast<char>(c));
        ++i;
    }
    return out;
}

std::string CompressionManager::decompressFast(const std::string& input) {
    const auto& dict = fastDictionary();
    std::string out;
    out.reserve(input.size() * 2);

    for (size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c != FAST_ESCAPE) {
            out.push_back(static_cast<char>(c));
            continue;
        }
        if (i + 1 >= input.size()) {
            throw std::runtime_error("FAST stream ends inside an escape sequence");
        }
        unsigned char code = static_cast<unsigned char>(input[++i]);
        if (code == FAST_ESCAPE) {
            out.push_back(static_cast<char>(FAST_ESCAPE));
        } else if (code < dict.size()) {
            out += dict[code];
        } else {
            throw std::runtime_error("FAST stream references unknown dictionary entry " + std::to_string(code));
        }
    }
    return out;
}

// --- SIMPLE: run-length encoding ---

std::string CompressionManager::compressRunLength(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        char c = input[i];
        size_t run = 1;
        while (i + run < input.size() && input[i + run] == c && run < RLE_MAX_RUN) {
            ++run;
        }
        if (run >= RLE_MIN_RUN || static_cast<unsigned char>(c) == RLE_MARKER) {
            out.push_back(static_cast<char>(RLE_MARKER));
            out.push_back(static_cast<char>(run));
            out.push_back(c);
        } else {
            out.append(run, c);
        }
        i += run;
    }
    return out;
}

std::string CompressionManager::decompressRunLength(const std::string& input) {
    std::string out;
    out.reserve(input.size() * 2);

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c != RLE_MARKER) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }
        if (i + 2 >= input.size()) {
            throw std::runtime_error("SIMPLE stream ends inside a run");
        }
        size_t count = static_cast<unsigned char>(input[i + 1]);
        if (count == 0) {
            throw std::runtime_error("SIMPLE stream contains an empty run");
        }
        out.append(count, input[i + 2]);
        i += 3;
    }
    return out;
}

// --- LZ77: hash-chained longest match ---

std::string CompressionManager::compressLz77(const std::string& input) {
    const size_t n = input.size();
    std::string out;
    out.reserve(n);

    std::vector<int64_t> head(size_t(1) << LZ77_HASH_BITS, -1);
    std::vector<int64_t> prev(n, -1);

    auto insert = [&](size_t pos) {
        if (pos + LZ77_MIN_MATCH > n) return;
        uint32_t h = lz77Hash(input, pos);
        prev[pos] = head[h];
        head[h] = static_cast<int64_t>(pos);
    };

    auto flush_literals = [&](size_t from, size_t to) {
        while (from < to) {
            size_t chunk = std::min(LZ77_MAX_LITERAL_RUN, to - from);
            out.push_back(static_cast<char>(chunk - 1));
            out.append(input, from, chunk);
            from += chunk;
        }
    };

    size_t i = 0;
    size_t literal_start = 0;
    while (i < n) {
        size_t best_len = 0;
        size_t best_dist = 0;
        if (i + LZ77_MIN_MATCH <= n) {
            const size_t max_len = std::min(LZ77_MAX_MATCH, n - i);
            int64_t candidate = head[lz77Hash(input, i)];
            size_t chain = 0;
            while (candidate >= 0 && i - static_cast<size_t>(candidate) <= LZ77_WINDOW && chain++ < LZ77_MAX_CHAIN) {
                size_t cand = static_cast<size_t>(candidate);
                size_t len = 0;
                while (len < max_len && input[cand + len] == input[i + len]) {
                    ++len;
                }
                if (len > best_len) {
                    best_len = len;
                    best_dist = i - cand;
                    if (len == max_len) break;
                }
                candidate = prev[cand];
            }
        }

        if (best_len >= LZ77_MIN_MATCH) {
            flush_literals(literal_start, i);
            out.push_back(static_cast<char>(0x80 | (best_len - LZ77_MIN_MATCH)));
            AppendUInt16LE(out, static_cast<uint16_t>(best_dist));
            for (size_t k = 0; k < best_len; ++k) {
                insert(i + k);
            }
            i += best_len;
            literal_start = i;
        } else {
            insert(i);
            ++i;
        }
    }
    flush_literals(literal_start, n);
    return out;
}

std::string CompressionManager::decompressLz77(const std::string& input, size_t size_limit) {
    std::string out;
    size_t i = 0;
    while (i < input.size()) {
        unsigned char token = static_cast<unsigned char>(input[i++]);
        if (token < 0x80) {
            size_t run = static_cast<size_t>(token) + 1;
            if (i + run > input.size()) {
                throw std::runtime_error("LZ77 literal run past end of stream");
            }
            out.append(input, i, run);
            i += run;
        } else {
            size_t len = static_cast<size_t>(token & 0x7F) + LZ77_MIN_MATCH;
            if (i + 2 > input.size()) {
                throw std::runtime_error("LZ77 back reference truncated");
            }
            size_t dist = ReadUInt16LE(input, i);
            i += 2;
            if (dist == 0 || dist > out.size()) {
                throw std::runtime_error("LZ77 back reference distance " + std::to_string(dist) +
                                         " outside window of " + std::to_string(out.size()));
            }
            size_t from = out.size() - dist;
            for (size_t k = 0; k < len; ++k) {
                out.push_back(out[from + k]); // overlapping copies repeat the pattern
            }
        }
        if (out.size() > size_limit) {
            throw std::runtime_error("LZ77 output exceeds expected size " + std::to_string(size_limit));
        }
    }
    return out;
}

// --- Library codecs ---

std::string CompressionManager::compressZstd(const std::string& input, int level) {
    size_t const bound = ZSTD_compressBound(input.size());
    std::string out(bound, '\0');
    int effective_level = (level == 0) ? ZSTD_CLEVEL_DEFAULT : level;
    size_t const c_size = ZSTD_compress(&out[0], bound, input.data(), input.size(), effective_level);
    if (ZSTD_isError(c_size)) {
        LOG_ERROR("[CompressionManager::compressZstd] ZSTD_compress failed: {}", ZSTD_getErrorName(c_size));
        throw std::runtime_error(std::string("ZSTD_compress error: ") + ZSTD_getErrorName(c_size));
    }
    out.resize(c_size);
    return out;
}

std::string CompressionManager::decompressZstd(const std::string& input, size_t uncompressed_size_hint) {
    if (uncompressed_size_hint == 0) {
        throw std::runtime_error("ZSTD decompress requires a non-zero uncompressed_size_hint.");
    }
    std::string out(uncompressed_size_hint, '\0');
    size_t const d_size = ZSTD_decompress(&out[0], uncompressed_size_hint, input.data(), input.size());
    if (ZSTD_isError(d_size)) {
        throw std::runtime_error(std::string("ZSTD_decompress error: ") + ZSTD_getErrorName(d_size));
    }
    out.resize(d_size);
    return out;
}

std::string CompressionManager::compressLz4(const std::string& input) {
    if (input.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw std::runtime_error("LZ4 input too large: " + std::to_string(input.size()));
    }
    int const max_dst_size = LZ4_compressBound(static_cast<int>(input.size()));
    if (max_dst_size <= 0) {
        throw std::runtime_error("LZ4_compressBound failed");
    }
    std::string out(static_cast<size_t>(max_dst_size), '\0');
    int const written = LZ4_compress_default(input.data(), &out[0], static_cast<int>(input.size()), max_dst_size);
    if (written <= 0) {
        LOG_ERROR("[CompressionManager::compressLz4] LZ4_compress_default failed for {} bytes", input.size());
        throw std::runtime_error("LZ4_compress_default failed");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string CompressionManager::decompressLz4(const std::string& input, size_t uncompressed_size_hint) {
    if (uncompressed_size_hint == 0 || uncompressed_size_hint > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("LZ4 decompress requires a valid uncompressed_size_hint.");
    }
    std::string out(uncompressed_size_hint, '\0');
    int const decompressed = LZ4_decompress_safe(input.data(), &out[0], static_cast<int>(input.size()),
                                                 static_cast<int>(uncompressed_size_hint));
    if (decompressed < 0) {
        throw std::runtime_error("LZ4_decompress_safe failed with code " + std::to_string(decompressed));
    }
    out.resize(static_cast<size_t>(decompressed));
    return out;
}

} // namespace flowstore
