// src/serialization_utils.cpp
#include "flowstore/serialization_utils.h"
#include <limits>
#include <stdexcept>

namespace flowstore {

void SerializeString(std::ostream& out, const std::string& str) {
    if (str.length() > std::numeric_limits<uint32_t>::max()) {
        throw std::overflow_error("SerializeString: String length exceeds uint32_t max.");
    }
    SerializeUInt32(out, static_cast<uint32_t>(str.length()));
    if (!str.empty()) {
        out.write(str.data(), static_cast<std::streamsize>(str.size()));
        if (!out) {
            throw std::runtime_error("SerializeString: Failed to write string data.");
        }
    }
}

std::string DeserializeString(std::istream& in) {
    auto len_opt = DeserializeUInt32(in);
    if (!len_opt) {
        throw std::runtime_error("DeserializeString: Unexpected end of stream before length.");
    }
    uint32_t len = *len_opt;

    // Sanity check to prevent allocating massive amounts of memory from corrupt data
    constexpr uint32_t MAX_SANE_STRING_LEN = 100 * 1024 * 1024; // 100MB
    if (len > MAX_SANE_STRING_LEN) {
        throw std::length_error("DeserializeString: String length in stream (" + std::to_string(len) + ") exceeds sanity limit.");
    }
    if (len == 0) return "";

    std::string str(len, '\0');
    in.read(&str[0], len);
    if (static_cast<uint32_t>(in.gcount()) != len) {
        throw std::runtime_error("DeserializeString: Failed to read full string data. Expected " + std::to_string(len) + " bytes.");
    }
    return str;
}

void SerializeUInt32(std::ostream& out, uint32_t value) {
    char buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
    out.write(buf, sizeof(buf));
    if (!out) {
        throw std::runtime_error("SerializeUInt32: Failed to write value.");
    }
}

void SerializeUInt64(std::ostream& out, uint64_t value) {
    char buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
    out.write(buf, sizeof(buf));
    if (!out) {
        throw std::runtime_error("SerializeUInt64: Failed to write value.");
    }
}

std::optional<uint32_t> DeserializeUInt32(std::istream& in) {
    unsigned char buf[4];
    in.read(reinterpret_cast<char*>(buf), sizeof(buf));
    if (in.gcount() == 0 && in.eof()) {
        return std::nullopt;
    }
    if (in.gcount() != sizeof(buf)) {
        throw std::runtime_error("DeserializeUInt32: Truncated value.");
    }
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | buf[i];
    }
    return value;
}

uint64_t DeserializeUInt64(std::istream& in) {
    unsigned char buf[8];
    in.read(reinterpret_cast<char*>(buf), sizeof(buf));
    if (in.gcount() != sizeof(buf)) {
        throw std::runtime_error("DeserializeUInt64: Truncated value.");
    }
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | buf[i];
    }
    return value;
}

void AppendUInt16LE(std::string& out, uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void AppendUInt32BE(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

uint16_t ReadUInt16LE(const std::string& in, size_t offset) {
    if (offset + 2 > in.size()) {
        throw std::out_of_range("ReadUInt16LE: offset past end of buffer");
    }
    return static_cast<uint16_t>(static_cast<unsigned char>(in[offset]) |
                                 (static_cast<unsigned char>(in[offset + 1]) << 8));
}

uint32_t ReadUInt32BE(const std::string& in, size_t offset) {
    if (offset + 4 > in.size()) {
        throw std::out_of_range("ReadUInt32BE: offset past end of buffer");
    }
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<unsigned char>(in[offset + i]);
    }
    return value;
}

} // namespace flowstore
