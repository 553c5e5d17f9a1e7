#include "GuardDog/SignatureVerifier.hpp"

#include "GuardDog/Crypto.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

#ifndef GUARDDOG_TRUSTED_PUBLIC_KEY
#error "GUARDDOG_TRUSTED_PUBLIC_KEY must be defined by the build"
#endif

namespace guarddog {

namespace {

constexpr std::size_t kPublicKeyBlobSize = 2 + 8 + 32;
constexpr std::size_t kSignatureBlobSize = 2 + 8 + 64;
constexpr std::size_t kEd25519SignatureSize = 64;
constexpr const char *kUntrustedPrefix = "untrusted comment:";
constexpr const char *kTrustedPrefix = "trusted comment: ";

struct PkeyDeleter {
    void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
};

struct MdContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

void setReason(std::string *reason, const std::string &message) {
    if (reason) {
        *reason = message;
    }
}

std::string stripLineEnding(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    return line;
}

bool ed25519Verify(const PublicKey &key, const std::string &message, const std::string &signature) {
    if (signature.size() != kEd25519SignatureSize) {
        return false;
    }
    std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey(
        EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.key.data(), key.key.size()));
    if (!pkey) {
        return false;
    }
    std::unique_ptr<EVP_MD_CTX, MdContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    const int result =
        EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char *>(signature.data()), signature.size(),
                         reinterpret_cast<const unsigned char *>(message.data()), message.size());
    return result == 1;
}

std::optional<std::string> blake2b512(const std::string &message) {
    std::unique_ptr<EVP_MD_CTX, MdContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_blake2b512(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), message.data(), message.size()) != 1) {
        return std::nullopt;
    }
    std::string digest(EVP_MAX_MD_SIZE, '\0');
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), reinterpret_cast<unsigned char *>(digest.data()), &length) != 1) {
        return std::nullopt;
    }
    digest.resize(length);
    return digest;
}

} // namespace

std::optional<PublicKey> PublicKey::fromMinisign(const std::string &encoded) {
    const auto blob = crypto::base64Decode(encoded);
    if (!blob || blob->size() != kPublicKeyBlobSize || blob->compare(0, 2, "Ed") != 0) {
        return std::nullopt;
    }
    PublicKey key;
    std::copy(blob->begin() + 2, blob->begin() + 10, key.keyId.begin());
    std::copy(blob->begin() + 10, blob->end(), key.key.begin());
    return key;
}

SignatureVerifier::SignatureVerifier(const PublicKey &key) : key_(key) {}

SignatureVerifier SignatureVerifier::withEmbeddedKey() {
    SignatureVerifier verifier;
    verifier.key_ = PublicKey::fromMinisign(GUARDDOG_TRUSTED_PUBLIC_KEY);
    return verifier;
}

bool SignatureVerifier::verify(const std::string &message, const std::string &signatureFile,
                               std::string *reason) const {
    if (!key_) {
        setReason(reason, "no usable trusted public key is compiled into this build");
        return false;
    }

    std::vector<std::string> lines;
    std::istringstream stream(signatureFile);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(stripLineEnding(line));
    }
    if (lines.size() < 4 || lines[0].rfind(kUntrustedPrefix, 0) != 0 || lines[2].rfind(kTrustedPrefix, 0) != 0) {
        setReason(reason, "signature file is not in minisign format");
        return false;
    }
    for (std::size_t i = 4; i < lines.size(); ++i) {
        if (!lines[i].empty()) {
            setReason(reason, "unexpected trailing data in signature file");
            return false;
        }
    }

    const auto blob = crypto::base64Decode(lines[1]);
    if (!blob || blob->size() != kSignatureBlobSize) {
        setReason(reason, "signature line is malformed");
        return false;
    }
    const std::string algorithm = blob->substr(0, 2);
    if (algorithm != "Ed" && algorithm != "ED") {
        setReason(reason, "unsupported signature algorithm");
        return false;
    }
    if (!std::equal(key_->keyId.begin(), key_->keyId.end(), blob->begin() + 2)) {
        setReason(reason, "signature was made with a different key");
        return false;
    }
    const std::string signature = blob->substr(10);

    std::string signedMessage = message;
    if (algorithm == "ED") {
        const auto prehash = blake2b512(message);
        if (!prehash) {
            setReason(reason, "BLAKE2b-512 is unavailable");
            return false;
        }
        signedMessage = *prehash;
    }
    if (!ed25519Verify(*key_, signedMessage, signature)) {
        setReason(reason, "signature does not match the manifest");
        return false;
    }

    const auto globalSignature = crypto::base64Decode(lines[3]);
    if (!globalSignature || globalSignature->size() != kEd25519SignatureSize) {
        setReason(reason, "trusted comment signature is malformed");
        return false;
    }
    const std::string trustedComment = lines[2].substr(std::char_traits<char>::length(kTrustedPrefix));
    if (!ed25519Verify(*key_, signature + trustedComment, *globalSignature)) {
        setReason(reason, "trusted comment signature does not verify");
        return false;
    }
    return true;
}

} // namespace guarddog
