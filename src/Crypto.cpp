#include "GuardDog/Crypto.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace guarddog::crypto {

namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

MdContext createSha256Context() {
    MdContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Unable to initialise SHA-256 context");
    }
    return ctx;
}

Sha256Digest finish(EVP_MD_CTX *ctx) {
    Sha256Digest digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1 || length != digest.size()) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    return digest;
}

int hexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

bool isBase64Char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '/';
}

} // namespace

Sha256Digest sha256(const std::string &data) {
    auto ctx = createSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    return finish(ctx.get());
}

Sha256Digest sha256File(const std::string &path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw IoError("Unable to open " + path);
    }

    auto ctx = createSha256Context();
    std::vector<char> buffer(kHashChunkSize);
    while (input.good()) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytesRead = input.gcount();
        if (bytesRead > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(bytesRead)) != 1) {
            throw std::runtime_error("SHA-256 update failed for " + path);
        }
    }

    if (input.bad()) {
        throw IoError("Read error while hashing " + path);
    }
    return finish(ctx.get());
}

std::string toHex(const Sha256Digest &digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : digest) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::optional<Sha256Digest> digestFromHex(const std::string &hex) {
    if (hex.size() != kSha256Size * 2) {
        return std::nullopt;
    }
    Sha256Digest digest{};
    for (std::size_t i = 0; i < digest.size(); ++i) {
        const int high = hexValue(hex[i * 2]);
        const int low = hexValue(hex[i * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        digest[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return digest;
}

bool digestsEqual(const Sha256Digest &lhs, const Sha256Digest &rhs) {
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

std::optional<std::string> base64Decode(const std::string &encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    std::size_t padding = 0;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        const char ch = encoded[i];
        if (ch == '=') {
            // Padding is only legal in the last two positions.
            if (i + 2 < encoded.size()) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !isBase64Char(ch)) {
            return std::nullopt;
        }
    }

    std::string decoded(encoded.size() / 4 * 3, '\0');
    const int length = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(decoded.data()),
                                       reinterpret_cast<const unsigned char *>(encoded.data()),
                                       static_cast<int>(encoded.size()));
    if (length < 0 || static_cast<std::size_t>(length) < padding) {
        return std::nullopt;
    }
    decoded.resize(static_cast<std::size_t>(length) - padding);
    return decoded;
}

std::string base64Encode(const std::string &data) {
    std::string encoded((data.size() + 2) / 3 * 4 + 1, '\0');
    const int length = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()),
                                       reinterpret_cast<const unsigned char *>(data.data()),
                                       static_cast<int>(data.size()));
    encoded.resize(length > 0 ? static_cast<std::size_t>(length) : 0);
    return encoded;
}

} // namespace guarddog::crypto
