#include "GuardDog/ManifestVerifier.hpp"

#include "GuardDog/Manifest.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace guarddog {

VerificationVerdict VerificationVerdict::pass() {
    VerificationVerdict verdict;
    verdict.outcome = VerificationOutcome::Pass;
    verdict.detail = "All manifest entries match.";
    return verdict;
}

VerificationVerdict VerificationVerdict::fail(VerificationFailure reason, std::string detail, std::string path) {
    VerificationVerdict verdict;
    verdict.outcome = VerificationOutcome::Fail;
    verdict.reason = reason;
    verdict.detail = std::move(detail);
    verdict.path = std::move(path);
    return verdict;
}

std::string toString(VerificationFailure reason) {
    switch (reason) {
    case VerificationFailure::None:
        return "None";
    case VerificationFailure::SignatureInvalid:
        return "SignatureInvalid";
    case VerificationFailure::ManifestUnreadable:
        return "ManifestUnreadable";
    case VerificationFailure::FileMissing:
        return "FileMissing";
    case VerificationFailure::HashMismatch:
        return "HashMismatch";
    }
    return "Unknown";
}

ManifestVerifier::ManifestVerifier(SignatureVerifier signatureVerifier)
    : signatureVerifier_(std::move(signatureVerifier)) {}

bool ManifestVerifier::readFile(const fs::path &path, std::string &contents) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return false;
    }
    contents = buffer.str();
    return true;
}

bool ManifestVerifier::resolveWithinRoot(const fs::path &root, const std::string &relative, fs::path &resolved) {
    std::error_code ec;
    const auto canonicalRoot = fs::weakly_canonical(root, ec);
    if (ec) {
        return false;
    }
    // weakly_canonical follows symlinks, so a link pointing outside the root
    // is caught here as well as a literal "..".
    const auto candidate = fs::weakly_canonical(canonicalRoot / fs::path(relative), ec);
    if (ec) {
        return false;
    }
    const auto inside = candidate.lexically_relative(canonicalRoot);
    if (inside.empty() || inside.begin()->string() == ".." || inside.string() == ".") {
        return false;
    }
    resolved = candidate;
    return true;
}

VerificationVerdict ManifestVerifier::verify(const fs::path &root, const fs::path &manifestPath,
                                             const fs::path &signaturePath) const {
    std::string manifestBytes;
    if (!readFile(manifestPath, manifestBytes)) {
        return VerificationVerdict::fail(VerificationFailure::ManifestUnreadable,
                                         "Unable to read manifest " + manifestPath.string());
    }
    std::string signatureBytes;
    if (!readFile(signaturePath, signatureBytes)) {
        return VerificationVerdict::fail(VerificationFailure::ManifestUnreadable,
                                         "Unable to read signature " + signaturePath.string());
    }

    std::string reason;
    if (!signatureVerifier_.verify(manifestBytes, signatureBytes, &reason)) {
        return VerificationVerdict::fail(VerificationFailure::SignatureInvalid,
                                         "Manifest signature rejected: " + reason);
    }

    Manifest manifest;
    try {
        manifest = parseManifest(manifestBytes, root);
    } catch (const ManifestFormatError &ex) {
        return VerificationVerdict::fail(VerificationFailure::SignatureInvalid,
                                         std::string("Signed manifest is malformed (") + ex.what() + ")");
    }

    for (const auto &entry : manifest.entries) {
        fs::path resolved;
        if (!resolveWithinRoot(manifest.root, entry.path, resolved)) {
            return VerificationVerdict::fail(VerificationFailure::FileMissing,
                                             entry.path + " does not resolve inside the verified root", entry.path);
        }
        std::error_code ec;
        if (!fs::is_regular_file(resolved, ec)) {
            return VerificationVerdict::fail(VerificationFailure::FileMissing, entry.path + " is missing",
                                             entry.path);
        }

        crypto::Sha256Digest actual{};
        try {
            actual = crypto::sha256File(resolved.string());
        } catch (const std::runtime_error &ex) {
            return VerificationVerdict::fail(VerificationFailure::FileMissing,
                                             entry.path + " could not be hashed: " + ex.what(), entry.path);
        }
        if (!crypto::digestsEqual(actual, entry.expectedDigest)) {
            return VerificationVerdict::fail(VerificationFailure::HashMismatch,
                                             entry.path + " expected " + crypto::toHex(entry.expectedDigest) +
                                                 " but found " + crypto::toHex(actual),
                                             entry.path);
        }
    }
    return VerificationVerdict::pass();
}

} // namespace guarddog
