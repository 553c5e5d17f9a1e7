#pragma once

#include "GuardDog/SignatureVerifier.hpp"

#include <filesystem>
#include <string>

namespace guarddog {

enum class VerificationOutcome { Pass, Fail };

enum class VerificationFailure {
    None,
    SignatureInvalid,
    ManifestUnreadable,
    FileMissing,
    HashMismatch
};

struct VerificationVerdict {
    VerificationOutcome outcome{VerificationOutcome::Fail};
    VerificationFailure reason{VerificationFailure::None};
    std::string path;   // set for FileMissing and HashMismatch
    std::string detail; // human readable explanation

    bool passed() const { return outcome == VerificationOutcome::Pass; }

    static VerificationVerdict pass();
    static VerificationVerdict fail(VerificationFailure reason, std::string detail, std::string path = {});
};

std::string toString(VerificationFailure reason);

// Gatekeeper for the distribution root. The manifest signature is checked
// before the manifest is parsed; files are then re-hashed in manifest order
// and the first missing or altered file ends verification.
class ManifestVerifier {
  public:
    explicit ManifestVerifier(SignatureVerifier signatureVerifier);

    VerificationVerdict verify(const std::filesystem::path &root, const std::filesystem::path &manifestPath,
                               const std::filesystem::path &signaturePath) const;

  private:
    SignatureVerifier signatureVerifier_;

    static bool readFile(const std::filesystem::path &path, std::string &contents);
    static bool resolveWithinRoot(const std::filesystem::path &root, const std::string &relative,
                                  std::filesystem::path &resolved);
};

} // namespace guarddog
