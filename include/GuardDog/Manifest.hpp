#pragma once

#include "GuardDog/Crypto.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace guarddog {

struct ManifestEntry {
    std::string path; // generic form, '/' separated, relative to the manifest root
    crypto::Sha256Digest expectedDigest{};
};

struct Manifest {
    std::filesystem::path root;
    std::vector<ManifestEntry> entries;
};

class ManifestFormatError : public std::runtime_error {
  public:
    ManifestFormatError(std::size_t line, const std::string &message)
        : std::runtime_error("line " + std::to_string(line) + ": " + message), line_(line) {}

    std::size_t line() const { return line_; }

  private:
    std::size_t line_;
};

// Parses "<sha256 hex>  <relative path>" lines. Throws ManifestFormatError on
// any structural problem; nothing is returned for a partially valid manifest.
Manifest parseManifest(const std::string &contents, const std::filesystem::path &root);

// Normalises a manifest path and rejects anything that could leave the root.
// Returns an empty string when the path is not acceptable.
std::string normaliseManifestPath(const std::string &path);

std::string serializeManifest(const Manifest &manifest);

// Hashes every regular file below root (sorted by path), skipping the
// relative paths listed in excluded.
Manifest createManifest(const std::filesystem::path &root, const std::vector<std::string> &excluded = {});

} // namespace guarddog
