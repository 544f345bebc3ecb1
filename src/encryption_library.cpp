// @src/encryption_library.cpp

#include "flowstore/encryption_library.h"
#include "flowstore/debug_utils.h"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <openssl/kdf.h>

namespace flowstore {

namespace {

std::string getOpenSSLError() {
    unsigned long err_code = ERR_get_error();
    if (err_code == 0) return "No error";
    char buffer[256];
    ERR_error_string_n(err_code, buffer, sizeof(buffer));
    return std::string(buffer);
}

#define CHECK_OPENSSL_RESULT(result, operation) \
    if ((result) != 1) { \
        throw CryptoException(std::string(operation) + " failed: " + getOpenSSLError()); \
    }

// RAII wrapper for OpenSSL EVP_CIPHER_CTX
class EVPCipherCtx {
public:
    EVPCipherCtx() : ctx(EVP_CIPHER_CTX_new()) {
        if (!ctx) throw CryptoException("Failed to create EVP cipher context");
    }
    ~EVPCipherCtx() {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
    EVP_CIPHER_CTX* get() const { return ctx; }
private:
    EVP_CIPHER_CTX* ctx;
    EVPCipherCtx(const EVPCipherCtx&) = delete;
    EVPCipherCtx& operator=(const EVPCipherCtx&) = delete;
};

// RAII wrapper for the HKDF derivation context
class EVPPkeyCtx {
public:
    explicit EVPPkeyCtx(int id) : ctx(EVP_PKEY_CTX_new_id(id, nullptr)) {
        if (!ctx) throw CryptoException("Failed to create EVP_PKEY context");
    }
    ~EVPPkeyCtx() {
        if (ctx) EVP_PKEY_CTX_free(ctx);
    }
    EVP_PKEY_CTX* get() const { return ctx; }
private:
    EVP_PKEY_CTX* ctx;
    EVPPkeyCtx(const EVPPkeyCtx&) = delete;
    EVPPkeyCtx& operator=(const EVPPkeyCtx&) = delete;
};

} // namespace

CryptoException::CryptoException(const std::string& message)
    : std::runtime_error("Crypto Error: " + message) {}

std::vector<unsigned char> EncryptionLibrary::generateRandomBytes(int size) {
    if (size <= 0) { throw CryptoException("Invalid size for random bytes generation"); }
    std::vector<unsigned char> bytes(static_cast<size_t>(size));
    CHECK_OPENSSL_RESULT(RAND_bytes(bytes.data(), size), "RAND_bytes");
    return bytes;
}

std::vector<unsigned char> EncryptionLibrary::deriveKeyFromPassword(
    const std::string& password, const std::vector<unsigned char>& salt, int iterations) {
    if (password.empty()) { throw CryptoException("Password cannot be empty"); }
    if (salt.size() != SALT_SIZE) { throw CryptoException("Invalid salt size"); }
    int effective_iterations = (iterations > 0) ? iterations : DEFAULT_PBKDF2_ITERATIONS;
    std::vector<unsigned char> key(AES_KEY_SIZE);
    CHECK_OPENSSL_RESULT(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.length()),
                                           salt.data(), static_cast<int>(salt.size()),
                                           effective_iterations, EVP_sha256(),
                                           static_cast<int>(key.size()), key.data()),
                         "PKCS5_PBKDF2_HMAC");
    return key;
}

std::vector<unsigned char> EncryptionLibrary::deriveSubKey(
    const std::vector<unsigned char>& master_key,
    const std::vector<unsigned char>& salt,
    const std::string& info) {
    if (master_key.size() != AES_KEY_SIZE) throw CryptoException("Invalid master key size for HKDF");

    EVPPkeyCtx pctx(EVP_PKEY_HKDF);
    CHECK_OPENSSL_RESULT(EVP_PKEY_derive_init(pctx.get()), "EVP_PKEY_derive_init (HKDF)");
    if (EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0) {
        throw CryptoException("EVP_PKEY_CTX_set_hkdf_md failed: " + getOpenSSLError());
    }
    if (EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0) {
        throw CryptoException("EVP_PKEY_CTX_set1_hkdf_salt failed: " + getOpenSSLError());
    }
    if (EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), master_key.data(), static_cast<int>(master_key.size())) <= 0) {
        throw CryptoException("EVP_PKEY_CTX_set1_hkdf_key failed: " + getOpenSSLError());
    }
    if (EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) <= 0) {
        throw CryptoException("EVP_PKEY_CTX_add1_hkdf_info failed: " + getOpenSSLError());
    }
    std::vector<unsigned char> sub_key(AES_KEY_SIZE);
    size_t out_len = sub_key.size();
    if (EVP_PKEY_derive(pctx.get(), sub_key.data(), &out_len) <= 0 || out_len != sub_key.size()) {
        throw CryptoException("EVP_PKEY_derive (HKDF) failed: " + getOpenSSLError());
    }
    return sub_key;
}

EncryptionLibrary::EncryptedData EncryptionLibrary::encryptWithAES_GCM(
    const std::string& plaintext,
    const std::vector<unsigned char>& key,
    const std::vector<unsigned char>& iv_nonce,
    const std::vector<unsigned char>& aad_data) {

    if (key.size() != AES_KEY_SIZE) throw CryptoException("Invalid key size for AES-256");
    if (iv_nonce.size() != AES_GCM_IV_SIZE) throw CryptoException("Invalid IV size for AES-GCM");

    EncryptedData result;
    result.iv = iv_nonce;
    result.data.resize(plaintext.size()); // GCM ciphertext is the same size as the plaintext
    result.tag.resize(AES_GCM_TAG_SIZE);

    EVPCipherCtx ctx;
    int len = 0;
    CHECK_OPENSSL_RESULT(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv_nonce.data()), "EVP_EncryptInit_ex (GCM)");
    if (!aad_data.empty()) {
        CHECK_OPENSSL_RESULT(EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad_data.data(), static_cast<int>(aad_data.size())), "EVP_EncryptUpdate (AAD)");
    }
    int ciphertext_len = 0;
    if (!plaintext.empty()) {
        CHECK_OPENSSL_RESULT(EVP_EncryptUpdate(ctx.get(), result.data.data(), &len,
                                               reinterpret_cast<const unsigned char*>(plaintext.data()),
                                               static_cast<int>(plaintext.size())),
                             "EVP_EncryptUpdate");
        ciphertext_len = len;
    }
    CHECK_OPENSSL_RESULT(EVP_EncryptFinal_ex(ctx.get(), result.data.data() + ciphertext_len, &len), "EVP_EncryptFinal_ex");
    ciphertext_len += len;
    if (static_cast<size_t>(ciphertext_len) != plaintext.size()) {
        throw CryptoException("OpenSSL GCM encryption wrote unexpected number of bytes.");
    }
    CHECK_OPENSSL_RESULT(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(result.tag.size()), result.tag.data()), "EVP_CTRL_GCM_GET_TAG");

    return result;
}

std::string EncryptionLibrary::decryptWithAES_GCM(
    const EncryptedData& encData,
    const std::vector<unsigned char>& key,
    const std::vector<unsigned char>& aad_data) {

    if (key.size() != AES_KEY_SIZE) throw CryptoException("Invalid key size for AES-256");
    if (encData.iv.size() != AES_GCM_IV_SIZE) throw CryptoException("Invalid IV size for AES-GCM");
    if (encData.tag.size() != AES_GCM_TAG_SIZE) throw CryptoException("Invalid tag size for AES-GCM");

    std::string plaintext(encData.data.size(), '\0');
    EVPCipherCtx ctx;
    int len = 0;
    CHECK_OPENSSL_RESULT(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), encData.iv.data()), "EVP_DecryptInit_ex (GCM)");
    if (!aad_data.empty()) {
        CHECK_OPENSSL_RESULT(EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad_data.data(), static_cast<int>(aad_data.size())), "EVP_DecryptUpdate (AAD)");
    }
    int plaintext_len = 0;
    if (!encData.data.empty()) {
        CHECK_OPENSSL_RESULT(EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plaintext[0]), &len,
                                               encData.data.data(), static_cast<int>(encData.data.size())),
                             "EVP_DecryptUpdate");
        plaintext_len = len;
    }
    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer.
    std::vector<unsigned char> tag_copy = encData.tag;
    CHECK_OPENSSL_RESULT(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_copy.size()), tag_copy.data()), "EVP_CTRL_GCM_SET_TAG");

    unsigned char* tail = plaintext.empty() ? nullptr : reinterpret_cast<unsigned char*>(&plaintext[0]) + plaintext_len;
    unsigned char scratch[AES_GCM_TAG_SIZE];
    if (EVP_DecryptFinal_ex(ctx.get(), tail ? tail : scratch, &len) <= 0) {
        ERR_clear_error();
        LOG_TRACE("[EncryptionLibrary] GCM tag verification failed for {} byte ciphertext", encData.data.size());
        throw AuthenticationFailure("AES-GCM authentication tag mismatch");
    }
    plaintext_len += len;
    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

} // namespace flowstore
