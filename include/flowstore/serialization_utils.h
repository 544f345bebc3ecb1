// include/flowstore/serialization_utils.h
#pragma once

#include <string>
#include <ostream>
#include <istream>
#include <cstdint>
#include <optional>

namespace flowstore {

/**
 * @brief Serializes a string to an output stream with a 32-bit length prefix.
 * @throws std::overflow_error if the string is too long.
 * @throws std::runtime_error on stream write failure.
 */
void SerializeString(std::ostream& out, const std::string& str);

/**
 * @brief Deserializes a length-prefixed string from an input stream.
 * @throws std::runtime_error on stream read failure or data corruption.
 * @throws std::length_error if the serialized length is unreasonably large.
 */
std::string DeserializeString(std::istream& in);

// Fixed-width little-endian integers.
void SerializeUInt32(std::ostream& out, uint32_t value);
void SerializeUInt64(std::ostream& out, uint64_t value);

// Return nullopt on a clean end of stream before the first byte.
std::optional<uint32_t> DeserializeUInt32(std::istream& in);
uint64_t DeserializeUInt64(std::istream& in);

// In-memory variants used by the binary codecs.
void AppendUInt16LE(std::string& out, uint16_t value);
void AppendUInt32BE(std::string& out, uint32_t value);
uint16_t ReadUInt16LE(const std::string& in, size_t offset);
uint32_t ReadUInt32BE(const std::string& in, size_t offset);

} // namespace flowstore
