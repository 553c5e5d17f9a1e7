#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace guarddog {

class IoError : public std::runtime_error {
  public:
    explicit IoError(const std::string &message) : std::runtime_error(message) {}
};

namespace crypto {

constexpr std::size_t kSha256Size = 32;
constexpr std::size_t kHashChunkSize = 64 * 1024;

using Sha256Digest = std::array<std::uint8_t, kSha256Size>;

Sha256Digest sha256(const std::string &data);

// Streams the file in kHashChunkSize blocks. Throws IoError when the file
// cannot be opened or a read fails part way through.
Sha256Digest sha256File(const std::string &path);

std::string toHex(const Sha256Digest &digest);
std::optional<Sha256Digest> digestFromHex(const std::string &hex);

// Equality check that always inspects every byte.
bool digestsEqual(const Sha256Digest &lhs, const Sha256Digest &rhs);

// Strict base64 decode (RFC 4648 alphabet, '=' padding). Returns nullopt on
// any malformed input.
std::optional<std::string> base64Decode(const std::string &encoded);
std::string base64Encode(const std::string &data);

} // namespace crypto
} // namespace guarddog
