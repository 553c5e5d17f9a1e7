#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace guarddog {

struct PublicKey {
    std::array<std::uint8_t, 8> keyId{};
    std::array<std::uint8_t, 32> key{};

    // Parses the base64 line of a minisign public key file.
    static std::optional<PublicKey> fromMinisign(const std::string &encoded);
};

// Checks a minisign detached signature (Ed25519, legacy "Ed" or pre-hashed
// "ED") over a message. The key is fixed when the verifier is built; every
// failure, including internal OpenSSL errors, reports false.
class SignatureVerifier {
  public:
    explicit SignatureVerifier(const PublicKey &key);

    // Verifier bound to the key compiled into this build. When the compiled
    // key cannot be parsed the verifier rejects every signature.
    static SignatureVerifier withEmbeddedKey();

    bool verify(const std::string &message, const std::string &signatureFile, std::string *reason = nullptr) const;

    const std::optional<PublicKey> &publicKey() const { return key_; }

  private:
    SignatureVerifier() = default;

    std::optional<PublicKey> key_;
};

} // namespace guarddog
