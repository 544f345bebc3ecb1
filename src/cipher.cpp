// @src/cipher.cpp
#include "flowstore/cipher.h"
#include "flowstore/encryption_library.h"
#include "flowstore/serialization_utils.h"
#include "flowstore/storage_error/exceptions.h"
#include "flowstore/storage_error/error_utils.h"
#include "flowstore/debug_utils.h"

namespace flowstore {

namespace {

// Fixed so the same passphrase yields the same master key in every process.
const std::vector<unsigned char> kMasterKeySalt = {
    'f', 'l', 'o', 'w', 's', 't', 'o', 'r', 'e', '.', 'k', 'd', 'f', '.', 'v', '1'};

constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

[[noreturn]] void throwDecryption(const std::string& details) {
    throw DecryptionError(STORAGE_ERROR_WITH_DETAILS(storage::ErrorCode::DECRYPTION_FAILED,
                                                     "Payload could not be decrypted", details));
}

} // namespace

AesGcmCipher::AesGcmCipher(const std::string& passphrase, int kdf_iterations, ClockFn clock)
    : master_key_(EncryptionLibrary::deriveKeyFromPassword(passphrase, kMasterKeySalt, kdf_iterations)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

uint32_t AesGcmCipher::dayNumber(TimePoint tp) {
    int64_t ms = to_epoch_millis(tp);
    return ms <= 0 ? 0u : static_cast<uint32_t>(ms / kMillisPerDay);
}

std::vector<unsigned char> AesGcmCipher::dayKey(uint32_t day, const std::vector<unsigned char>& salt) const {
    return EncryptionLibrary::deriveSubKey(master_key_, salt, "flowstore.record-key.day=" + std::to_string(day));
}

std::string AesGcmCipher::encrypt(const std::string& plaintext) {
    const uint32_t day = dayNumber(clock_());
    int64_t previous = last_day_.exchange(static_cast<int64_t>(day));
    if (previous >= 0 && previous != static_cast<int64_t>(day)) {
        key_rotations_.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("[AesGcmCipher] Rotated record key from day {} to day {}", previous, day);
    }

    std::vector<unsigned char> salt = EncryptionLibrary::generateSalt();
    std::vector<unsigned char> iv = EncryptionLibrary::generateIV();

    std::string sealed;
    sealed.reserve(SEALED_OVERHEAD + plaintext.size());
    sealed.push_back('F');
    sealed.push_back('S');
    sealed.push_back(static_cast<char>(FORMAT_VERSION));
    AppendUInt32BE(sealed, day);
    sealed.append(salt.begin(), salt.end());

    std::vector<unsigned char> aad(sealed.begin(), sealed.end());
    auto encrypted = EncryptionLibrary::encryptWithAES_GCM(plaintext, dayKey(day, salt), iv, aad);

    sealed.append(encrypted.iv.begin(), encrypted.iv.end());
    sealed.append(encrypted.tag.begin(), encrypted.tag.end());
    sealed.append(encrypted.data.begin(), encrypted.data.end());
    return sealed;
}

std::string AesGcmCipher::decrypt(const std::string& sealed) const {
    if (sealed.size() < SEALED_OVERHEAD) {
        throwDecryption("sealed payload of " + std::to_string(sealed.size()) + " bytes is shorter than its header");
    }
    if (sealed[0] != 'F' || sealed[1] != 'S') {
        throwDecryption("sealed payload has a bad magic");
    }
    if (static_cast<unsigned char>(sealed[2]) != FORMAT_VERSION) {
        throwDecryption("unsupported sealed payload version " + std::to_string(static_cast<unsigned char>(sealed[2])));
    }

    const uint32_t day = ReadUInt32BE(sealed, 3);
    const auto* bytes = reinterpret_cast<const unsigned char*>(sealed.data());
    std::vector<unsigned char> salt(bytes + 7, bytes + HEADER_SIZE);
    std::vector<unsigned char> aad(bytes, bytes + HEADER_SIZE);

    EncryptionLibrary::EncryptedData enc;
    size_t offset = HEADER_SIZE;
    enc.iv.assign(bytes + offset, bytes + offset + EncryptionLibrary::AES_GCM_IV_SIZE);
    offset += EncryptionLibrary::AES_GCM_IV_SIZE;
    enc.tag.assign(bytes + offset, bytes + offset + EncryptionLibrary::AES_GCM_TAG_SIZE);
    offset += EncryptionLibrary::AES_GCM_TAG_SIZE;
    enc.data.assign(bytes + offset, bytes + sealed.size());

    try {
        return EncryptionLibrary::decryptWithAES_GCM(enc, dayKey(day, salt), aad);
    } catch (const AuthenticationFailure& e) {
        throwDecryption(e.what());
    } catch (const CryptoException& e) {
        throwDecryption(e.what());
    }
}

std::unique_ptr<Cipher> makeAesGcmCipher(const std::string& passphrase, int kdf_iterations, ClockFn clock) {
    return std::make_unique<AesGcmCipher>(passphrase, kdf_iterations, std::move(clock));
}

} // namespace flowstore
