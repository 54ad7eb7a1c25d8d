#include "crypto_session.h"
#include "constants.h"
#include "errors.h"
#include "logger.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cstring>
#include <cctype>
#include <stdexcept>

namespace neurax {

struct CryptoSession::KeyPair {
    EVP_PKEY* pkey = nullptr;

    ~KeyPair() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

namespace {

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// Failure to obtain randomness is not recoverable per session
void random_bytes(unsigned char* out, size_t len) {
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        throw std::runtime_error("System randomness unavailable");
    }
}

bool configure_oaep(EVP_PKEY_CTX* ctx) {
    return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 &&
           EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 &&
           EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0;
}

PkeyPtr load_public_key(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
}

} // namespace

CryptoSession::CryptoSession() : keypair_(std::make_unique<KeyPair>()) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), RSA_KEY_BITS) <= 0) {
        throw std::runtime_error("Failed to initialize RSA key generation");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0 || !pkey) {
        throw std::runtime_error("RSA key generation failed");
    }
    keypair_->pkey = pkey;

    LOG_DEBUG("Crypto") << "Generated fresh RSA-" << RSA_KEY_BITS << " keypair";
}

CryptoSession::~CryptoSession() {
    discard();
}

std::string CryptoSession::export_public_key() const {
    if (!keypair_ || !keypair_->pkey) {
        throw NotReadyError("keypair has been discarded");
    }

    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), keypair_->pkey) != 1) {
        throw std::runtime_error("Failed to serialize public key");
    }

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(bio.get(), &buffer);
    return std::string(buffer->data, buffer->length);
}

std::string CryptoSession::seal_session_key(const std::string& peer_public_key_pem) {
    if (!session_key_.empty()) {
        throw KeyExchangeError("session key already established");
    }

    PkeyPtr peer = load_public_key(peer_public_key_pem);
    if (!peer) {
        throw KeyExchangeError("peer public key is not a valid PEM public key");
    }
    if (EVP_PKEY_base_id(peer.get()) != EVP_PKEY_RSA || EVP_PKEY_bits(peer.get()) < RSA_KEY_BITS) {
        throw KeyExchangeError("peer public key must be RSA with at least 2048 bits");
    }

    std::vector<unsigned char> key(SESSION_KEY_BYTES);
    random_bytes(key.data(), key.size());

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(peer.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 || !configure_oaep(ctx.get())) {
        OPENSSL_cleanse(key.data(), key.size());
        throw KeyExchangeError("failed to set up RSA-OAEP encryption");
    }

    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, key.data(), key.size()) <= 0) {
        OPENSSL_cleanse(key.data(), key.size());
        throw KeyExchangeError("RSA-OAEP encryption failed");
    }
    std::vector<unsigned char> wrapped(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), wrapped.data(), &out_len, key.data(), key.size()) <= 0) {
        OPENSSL_cleanse(key.data(), key.size());
        throw KeyExchangeError("RSA-OAEP encryption failed");
    }
    wrapped.resize(out_len);

    session_key_ = std::move(key);
    peer_public_key_ = peer_public_key_pem;
    return base64url_encode(wrapped);
}

void CryptoSession::unseal_session_key(const std::string& encoded) {
    if (!session_key_.empty()) {
        throw KeyExchangeError("session key already established");
    }
    if (!keypair_ || !keypair_->pkey) {
        throw KeyExchangeError("keypair has been discarded");
    }

    std::vector<unsigned char> wrapped;
    try {
        wrapped = base64url_decode(encoded);
    } catch (const DecodeError& e) {
        throw KeyExchangeError(std::string("encrypted key is not base64url: ") + e.what());
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(keypair_->pkey, nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0 || !configure_oaep(ctx.get())) {
        throw KeyExchangeError("failed to set up RSA-OAEP decryption");
    }

    size_t out_len = 0;
    if (wrapped.empty() ||
        EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, wrapped.data(), wrapped.size()) <= 0) {
        throw KeyExchangeError("RSA-OAEP decryption failed");
    }
    std::vector<unsigned char> key(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), key.data(), &out_len, wrapped.data(), wrapped.size()) <= 0) {
        throw KeyExchangeError("RSA-OAEP decryption failed");
    }
    key.resize(out_len);

    if (key.size() != SESSION_KEY_BYTES) {
        OPENSSL_cleanse(key.data(), key.size());
        throw KeyExchangeError("decrypted session key has wrong length");
    }
    session_key_ = std::move(key);
}

std::string CryptoSession::seal(const std::string& plaintext) const {
    if (session_key_.empty()) {
        throw NotReadyError("session key not established");
    }

    std::vector<unsigned char> out(GCM_NONCE_BYTES + plaintext.size() + GCM_TAG_BYTES);
    random_bytes(out.data(), GCM_NONCE_BYTES);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_NONCE_BYTES, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, session_key_.data(), out.data()) != 1) {
        throw std::runtime_error("Failed to initialize AES-GCM encryption");
    }

    unsigned char* cipher_out = out.data() + GCM_NONCE_BYTES;
    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), cipher_out, &len,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("AES-GCM encryption failed");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), cipher_out + total, &len) != 1) {
        throw std::runtime_error("AES-GCM encryption failed");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, GCM_TAG_BYTES,
                            cipher_out + total) != 1) {
        throw std::runtime_error("Failed to read AES-GCM tag");
    }

    out.resize(GCM_NONCE_BYTES + total + GCM_TAG_BYTES);
    return base64url_encode(out);
}

std::string CryptoSession::unseal(const std::string& encoded) const {
    if (session_key_.empty()) {
        throw NotReadyError("session key not established");
    }

    std::vector<unsigned char> data = base64url_decode(encoded);
    if (data.size() < GCM_NONCE_BYTES + GCM_TAG_BYTES) {
        throw DecodeError("sealed payload shorter than nonce and tag");
    }

    const unsigned char* nonce = data.data();
    const unsigned char* cipher_in = data.data() + GCM_NONCE_BYTES;
    size_t cipher_len = data.size() - GCM_NONCE_BYTES - GCM_TAG_BYTES;
    unsigned char* tag = data.data() + data.size() - GCM_TAG_BYTES;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_NONCE_BYTES, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, session_key_.data(), nonce) != 1) {
        throw std::runtime_error("Failed to initialize AES-GCM decryption");
    }

    std::string plaintext(cipher_len, '\0');
    int len = 0;
    int total = 0;
    if (cipher_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plaintext[0]), &len,
                              cipher_in, static_cast<int>(cipher_len)) != 1) {
            throw IntegrityError("ciphertext rejected");
        }
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, GCM_TAG_BYTES, tag) != 1) {
        throw std::runtime_error("Failed to set AES-GCM tag");
    }

    unsigned char final_block[16];
    if (EVP_DecryptFinal_ex(ctx.get(), final_block, &len) <= 0) {
        OPENSSL_cleanse(&plaintext[0], plaintext.size());
        throw IntegrityError("authentication tag mismatch");
    }

    plaintext.resize(total);
    return plaintext;
}

bool CryptoSession::has_session_key() const {
    return !session_key_.empty();
}

void CryptoSession::set_peer_public_key(const std::string& pem) {
    if (!peer_public_key_.empty()) {
        if (peer_public_key_ == pem) {
            return;
        }
        throw KeyExchangeError("peer public key already set");
    }
    if (!load_public_key(pem)) {
        throw KeyExchangeError("peer public key is not a valid PEM public key");
    }
    peer_public_key_ = pem;
}

bool CryptoSession::has_peer_public_key() const {
    return !peer_public_key_.empty();
}

const std::string& CryptoSession::peer_public_key() const {
    return peer_public_key_;
}

void CryptoSession::discard() {
    if (!session_key_.empty()) {
        OPENSSL_cleanse(session_key_.data(), session_key_.size());
        session_key_.clear();
    }
    keypair_.reset();
}

bool CryptoSession::discarded() const {
    return !keypair_;
}

std::string CryptoSession::base64url_encode(const unsigned char* data, size_t len) {
    if (len == 0) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data, static_cast<int>(len));
    BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    // Standard alphabet to URL-safe alphabet
    for (auto& c : result) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return result;
}

std::string CryptoSession::base64url_encode(const std::vector<unsigned char>& data) {
    return base64url_encode(data.data(), data.size());
}

std::vector<unsigned char> CryptoSession::base64url_decode(const std::string& encoded) {
    std::string standard;
    standard.reserve(encoded.size() + 3);

    size_t padding = 0;
    for (char c : encoded) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            throw DecodeError("padding inside base64url data");
        }
        if (std::isalnum(static_cast<unsigned char>(c))) {
            standard += c;
        } else if (c == '-') {
            standard += '+';
        } else if (c == '_') {
            standard += '/';
        } else {
            throw DecodeError("invalid base64url character");
        }
    }

    if (standard.empty()) {
        if (padding > 0) {
            throw DecodeError("padding without data");
        }
        return {};
    }
    if (standard.size() % 4 == 1 || padding > 2) {
        throw DecodeError("invalid base64url length");
    }

    size_t data_chars = standard.size();
    while (standard.size() % 4 != 0) {
        standard += '=';
    }
    size_t expected = (data_chars * 3) / 4;

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new_mem_buf(standard.c_str(), static_cast<int>(standard.length()));
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    std::vector<unsigned char> result(standard.length());
    int decoded_len = BIO_read(bio, result.data(), static_cast<int>(standard.length()));

    BIO_free_all(bio);

    if (decoded_len < 0 || static_cast<size_t>(decoded_len) != expected) {
        throw DecodeError("base64url payload could not be decoded");
    }
    result.resize(decoded_len);
    return result;
}

} // namespace neurax
