// @include/flowstore/cipher.h
#pragma once

#include "types.h"
#include <string>
#include <vector>
#include <memory>
#include <atomic>

namespace flowstore {

/**
 * @brief Symmetric cipher used by the codec for payload encryption.
 *
 * encrypt() output must carry everything decrypt() needs besides the key
 * material. decrypt() throws DecryptionError on malformed, truncated or
 * tampered input and on a key mismatch.
 */
class Cipher {
public:
    virtual ~Cipher() = default;
    virtual std::string encrypt(const std::string& plaintext) = 0;
    virtual std::string decrypt(const std::string& sealed) const = 0;
    virtual EncryptionScheme scheme() const = 0;
    virtual uint64_t keyRotations() const { return 0; }
};

/**
 * AES-256-GCM with a daily rotating sub-key.
 *
 * The master key is PBKDF2-SHA256 of the passphrase. Each payload is sealed
 * with HKDF-SHA256(master, record salt, day number) and laid out as
 *
 *   'F' 'S' | version | day (u32 BE) | salt[16] | iv[12] | tag[16] | ciphertext
 *
 * The bytes up to and including the salt are authenticated as AAD.
 */
class AesGcmCipher : public Cipher {
public:
    static constexpr unsigned char FORMAT_VERSION = 1;
    static constexpr size_t HEADER_SIZE = 2 + 1 + 4 + 16;
    static constexpr size_t SEALED_OVERHEAD = HEADER_SIZE + 12 + 16;

    AesGcmCipher(const std::string& passphrase, int kdf_iterations, ClockFn clock);

    std::string encrypt(const std::string& plaintext) override;
    std::string decrypt(const std::string& sealed) const override;
    EncryptionScheme scheme() const override { return EncryptionScheme::AES256_GCM_HKDF_DAILY; }
    uint64_t keyRotations() const override { return key_rotations_.load(std::memory_order_relaxed); }

    static uint32_t dayNumber(TimePoint tp);

private:
    std::vector<unsigned char> dayKey(uint32_t day, const std::vector<unsigned char>& salt) const;

    std::vector<unsigned char> master_key_;
    ClockFn clock_;
    std::atomic<int64_t> last_day_{-1};
    std::atomic<uint64_t> key_rotations_{0};
};

std::unique_ptr<Cipher> makeAesGcmCipher(const std::string& passphrase, int kdf_iterations, ClockFn clock);

} // namespace flowstore
