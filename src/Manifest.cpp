#include "GuardDog/Manifest.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace guarddog {

namespace {

std::string trimRight(const std::string &value) {
    const auto end = value.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return {};
    }
    return value.substr(0, end + 1);
}

std::vector<std::string> split(const std::string &value, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream stream(value);
    while (std::getline(stream, token, delimiter)) {
        tokens.push_back(token);
    }
    if (!value.empty() && value.back() == delimiter) {
        tokens.emplace_back();
    }
    return tokens;
}

std::string normaliseRelativePath(const fs::path &root, const fs::path &absolute) {
    std::error_code ec;
    const auto relative = fs::relative(absolute, root, ec);
    if (ec) {
        return absolute.lexically_relative(root).generic_string();
    }
    return relative.generic_string();
}

} // namespace

std::string normaliseManifestPath(const std::string &path) {
    std::string value = path;
    std::replace(value.begin(), value.end(), '\\', '/');
    if (value.empty() || value.front() == '/') {
        return {};
    }
    // Drive letters ("C:") and alternate data streams never belong in a manifest.
    if (value.find(':') != std::string::npos) {
        return {};
    }
    for (const auto &component : split(value, '/')) {
        if (component.empty() || component == "." || component == "..") {
            return {};
        }
    }
    return value;
}

Manifest parseManifest(const std::string &contents, const fs::path &root) {
    Manifest manifest;
    manifest.root = root;

    std::unordered_set<std::string> seen;
    std::istringstream stream(contents);
    std::string rawLine;
    std::size_t lineNumber = 0;
    while (std::getline(stream, rawLine)) {
        ++lineNumber;
        const std::string line = trimRight(rawLine);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.size() < 67 || line[64] != ' ' || (line[65] != ' ' && line[65] != '*')) {
            throw ManifestFormatError(lineNumber, "expected '<sha256>  <path>'");
        }
        const auto digest = crypto::digestFromHex(line.substr(0, 64));
        if (!digest) {
            throw ManifestFormatError(lineNumber, "invalid SHA-256 digest");
        }
        const std::string path = normaliseManifestPath(line.substr(66));
        if (path.empty()) {
            throw ManifestFormatError(lineNumber, "path is empty, absolute or leaves the root");
        }
        if (!seen.insert(path).second) {
            throw ManifestFormatError(lineNumber, "duplicate entry for " + path);
        }
        manifest.entries.push_back({path, *digest});
    }

    if (manifest.entries.empty()) {
        throw ManifestFormatError(lineNumber, "manifest lists no files");
    }
    return manifest;
}

std::string serializeManifest(const Manifest &manifest) {
    std::ostringstream oss;
    for (const auto &entry : manifest.entries) {
        oss << crypto::toHex(entry.expectedDigest) << "  " << entry.path << '\n';
    }
    return oss.str();
}

Manifest createManifest(const fs::path &root, const std::vector<std::string> &excluded) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw IoError("Manifest root is not a directory: " + root.string());
    }

    const std::unordered_set<std::string> skip(excluded.begin(), excluded.end());
    std::vector<std::string> paths;
    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw IoError("Unable to enumerate " + root.string() + ": " + ec.message());
        }
        std::error_code statusEc;
        if (!it->is_regular_file(statusEc)) {
            continue;
        }
        const std::string relative = normaliseRelativePath(root, it->path());
        if (relative.empty() || skip.count(relative) != 0) {
            continue;
        }
        paths.push_back(relative);
    }
    std::sort(paths.begin(), paths.end());

    Manifest manifest;
    manifest.root = root;
    for (const auto &relative : paths) {
        manifest.entries.push_back({relative, crypto::sha256File((root / relative).string())});
    }
    return manifest;
}

} // namespace guarddog
