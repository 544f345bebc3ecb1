// @include/flowstore/encryption_library.h
#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace flowstore {

// Raised by the OpenSSL primitives below. The codec translates it into
// DecryptionError or an ENCRYPTION_FAILED storage error.
class CryptoException : public std::runtime_error {
public:
    explicit CryptoException(const std::string& message);
};

// Thrown when an AES-GCM tag does not verify (wrong key or tampered bytes).
class AuthenticationFailure : public CryptoException {
public:
    explicit AuthenticationFailure(const std::string& message) : CryptoException(message) {}
};

class EncryptionLibrary {
public:
    static constexpr int AES_KEY_SIZE = 32;
    static constexpr int AES_GCM_IV_SIZE = 12;
    static constexpr int AES_GCM_TAG_SIZE = 16;
    static constexpr int SALT_SIZE = 16;
    static constexpr int DEFAULT_PBKDF2_ITERATIONS = 600000;

    struct EncryptedData {
        std::vector<unsigned char> data;
        std::vector<unsigned char> iv;
        std::vector<unsigned char> tag;
    };

    // --- Core Primitives ---
    static std::vector<unsigned char> generateRandomBytes(int size);
    static std::vector<unsigned char> deriveKeyFromPassword(
        const std::string& password,
        const std::vector<unsigned char>& salt,
        int iterations = DEFAULT_PBKDF2_ITERATIONS);

    // HKDF-SHA256 expansion of an existing key into a sub-key of AES_KEY_SIZE bytes.
    static std::vector<unsigned char> deriveSubKey(
        const std::vector<unsigned char>& master_key,
        const std::vector<unsigned char>& salt,
        const std::string& info);

    // --- AES-256-GCM ---
    static EncryptedData encryptWithAES_GCM(
        const std::string& plaintext,
        const std::vector<unsigned char>& key,
        const std::vector<unsigned char>& iv_nonce,
        const std::vector<unsigned char>& aad_data = {});

    // Throws AuthenticationFailure if the tag does not verify.
    static std::string decryptWithAES_GCM(
        const EncryptedData& encData,
        const std::vector<unsigned char>& key,
        const std::vector<unsigned char>& aad_data = {});

    static std::vector<unsigned char> generateIV() {
        return generateRandomBytes(AES_GCM_IV_SIZE);
    }

    static std::vector<unsigned char> generateSalt() {
        return generateRandomBytes(SALT_SIZE);
    }
};

} // namespace flowstore
