#pragma once

#include <string>
#include <vector>
#include <memory>

namespace neurax {

// Hybrid RSA / AES-GCM key material for exactly one task exchange.
//
// Construction generates a fresh RSA-2048 keypair. The client seals a fresh
// AES-256 session key under the compute node's public key; the compute node
// unseals it. From then on both sides seal payloads as
//   base64url( 12-byte nonce || ciphertext || 16-byte tag )
// The session key is set at most once and never rotated.
class CryptoSession {
public:
    CryptoSession();
    ~CryptoSession();

    CryptoSession(const CryptoSession&) = delete;
    CryptoSession& operator=(const CryptoSession&) = delete;

    // Own public key, PEM SubjectPublicKeyInfo
    std::string export_public_key() const;

    // Client side: generate the session key, keep it, and return it
    // RSA-OAEP(SHA-256) encrypted under the peer key, base64url-encoded.
    // Throws KeyExchangeError on an unusable peer key or if a key is already set.
    std::string seal_session_key(const std::string& peer_public_key_pem);

    // Compute node side: decrypt the session key with the own private key.
    // Throws KeyExchangeError on any failure.
    void unseal_session_key(const std::string& encoded);

    // AEAD with a fresh nonce per call. Throws NotReadyError without a key.
    std::string seal(const std::string& plaintext) const;

    // Throws NotReadyError without a key, DecodeError on malformed input,
    // IntegrityError when authentication fails.
    std::string unseal(const std::string& encoded) const;

    bool has_session_key() const;

    // Peer key bookkeeping. Setting a different key twice throws KeyExchangeError;
    // setting the same key again is a no-op.
    void set_peer_public_key(const std::string& pem);
    bool has_peer_public_key() const;
    const std::string& peer_public_key() const;

    // Wipe the session key and drop the keypair. Idempotent.
    void discard();
    bool discarded() const;

    // base64url with '=' padding on output; padding optional on input.
    // decode throws DecodeError on characters outside the alphabet.
    static std::string base64url_encode(const unsigned char* data, size_t len);
    static std::string base64url_encode(const std::vector<unsigned char>& data);
    static std::vector<unsigned char> base64url_decode(const std::string& encoded);

private:
    struct KeyPair;

    std::unique_ptr<KeyPair> keypair_;
    std::vector<unsigned char> session_key_;  // 32 bytes once established
    std::string peer_public_key_;
};

} // namespace neurax
