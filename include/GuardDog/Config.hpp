#pragma once

#include "GuardDog/ManifestVerifier.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace guarddog {

enum class RunMode { Audit, VerifyOnly, CreateManifest, ListChecks, Help };

constexpr const char *kManifestFileName = "guarddog.manifest";
constexpr const char *kSignatureSuffix = ".minisig";
constexpr const char *kReportDirEnv = "GUARDDOG_REPORT_DIR";

namespace exit_codes {
constexpr int kSuccess = 0;
constexpr int kUsage = 1;
constexpr int kManifestUnreadable = 2;
constexpr int kSignatureInvalid = 3;
constexpr int kFileMissing = 4;
constexpr int kHashMismatch = 5;
constexpr int kReportWriteFailed = 6;
constexpr int kCancelled = 130;
} // namespace exit_codes

struct RunConfig {
    RunMode mode{RunMode::Audit};
    std::filesystem::path root;
    std::filesystem::path manifest;
    std::filesystem::path signature;
    std::filesystem::path reportDir;
    std::chrono::milliseconds probeTimeout{std::chrono::seconds(8)};
    bool json{false};

    // --create-manifest ROOT OUTPUT
    std::filesystem::path manifestSourceRoot;
    std::filesystem::path manifestOutput;
};

// Parses argv (without the program name). Unset paths are derived from
// executableDir and reportDirOverride (the GUARDDOG_REPORT_DIR value).
// Throws std::invalid_argument on misuse.
RunConfig parseArguments(const std::vector<std::string> &args, const std::filesystem::path &executableDir,
                         const std::optional<std::string> &reportDirOverride = std::nullopt);

// Directory holding the running executable; falls back to argv[0] and then
// the working directory.
std::filesystem::path executableDirectory(const char *argv0);

int exitCodeFor(const VerificationVerdict &verdict);

std::string usageText(const std::string &program);

} // namespace guarddog
