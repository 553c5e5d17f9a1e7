#include "GuardDog/Config.hpp"

#include <sstream>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace guarddog {

namespace {

constexpr long kMaxProbeTimeoutSeconds = 600;

const std::string &requireValue(const std::vector<std::string> &args, std::size_t &index) {
    if (index + 1 >= args.size() || args[index + 1].empty()) {
        throw std::invalid_argument(args[index] + " requires a value");
    }
    return args[++index];
}

void setMode(RunConfig &config, RunMode mode, bool &modeSet, const std::string &flag) {
    if (modeSet && config.mode != mode) {
        throw std::invalid_argument(flag + " cannot be combined with another mode");
    }
    config.mode = mode;
    modeSet = true;
}

long parseSeconds(const std::string &value) {
    std::size_t consumed = 0;
    long seconds = 0;
    try {
        seconds = std::stol(value, &consumed);
    } catch (const std::exception &) {
        throw std::invalid_argument("--probe-timeout expects a number of seconds, got '" + value + "'");
    }
    if (consumed != value.size() || seconds <= 0 || seconds > kMaxProbeTimeoutSeconds) {
        throw std::invalid_argument("--probe-timeout must be between 1 and " +
                                    std::to_string(kMaxProbeTimeoutSeconds) + " seconds");
    }
    return seconds;
}

} // namespace

RunConfig parseArguments(const std::vector<std::string> &args, const fs::path &executableDir,
                         const std::optional<std::string> &reportDirOverride) {
    RunConfig config;
    bool modeSet = false;
    bool reportOptions = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        if (arg == "--help" || arg == "-h") {
            setMode(config, RunMode::Help, modeSet, arg);
        } else if (arg == "--verify-only") {
            setMode(config, RunMode::VerifyOnly, modeSet, arg);
        } else if (arg == "--list-checks") {
            setMode(config, RunMode::ListChecks, modeSet, arg);
        } else if (arg == "--create-manifest") {
            setMode(config, RunMode::CreateManifest, modeSet, arg);
            config.manifestSourceRoot = requireValue(args, i);
            config.manifestOutput = requireValue(args, i);
        } else if (arg == "--root") {
            config.root = requireValue(args, i);
        } else if (arg == "--manifest") {
            config.manifest = requireValue(args, i);
        } else if (arg == "--signature") {
            config.signature = requireValue(args, i);
        } else if (arg == "--report-dir") {
            config.reportDir = requireValue(args, i);
            reportOptions = true;
        } else if (arg == "--probe-timeout") {
            config.probeTimeout = std::chrono::seconds(parseSeconds(requireValue(args, i)));
            reportOptions = true;
        } else if (arg == "--json") {
            config.json = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (config.mode == RunMode::VerifyOnly && reportOptions) {
        throw std::invalid_argument("--verify-only does not run checks or write a report");
    }

    if (config.root.empty()) {
        config.root = executableDir;
    }
    if (config.manifest.empty()) {
        config.manifest = config.root / kManifestFileName;
    }
    if (config.signature.empty()) {
        config.signature = config.manifest;
        config.signature += kSignatureSuffix;
    }
    if (config.reportDir.empty()) {
        if (reportDirOverride && !reportDirOverride->empty()) {
            config.reportDir = *reportDirOverride;
        } else {
            config.reportDir = config.root / "reports";
        }
    }
    return config;
}

fs::path executableDirectory(const char *argv0) {
    std::error_code ec;
#ifdef _WIN32
    char buffer[MAX_PATH] = {};
    const DWORD length = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
    if (length > 0 && length < MAX_PATH) {
        return fs::path(std::string(buffer, length)).parent_path();
    }
#else
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.parent_path();
    }
#endif
    if (argv0 != nullptr && *argv0 != '\0') {
        const fs::path candidate = fs::absolute(argv0, ec);
        if (!ec) {
            return candidate.parent_path();
        }
    }
    const fs::path cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

int exitCodeFor(const VerificationVerdict &verdict) {
    if (verdict.passed()) {
        return exit_codes::kSuccess;
    }
    switch (verdict.reason) {
    case VerificationFailure::ManifestUnreadable:
        return exit_codes::kManifestUnreadable;
    case VerificationFailure::SignatureInvalid:
        return exit_codes::kSignatureInvalid;
    case VerificationFailure::FileMissing:
        return exit_codes::kFileMissing;
    case VerificationFailure::HashMismatch:
        return exit_codes::kHashMismatch;
    case VerificationFailure::None:
        break;
    }
    return exit_codes::kSignatureInvalid;
}

std::string usageText(const std::string &program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  --root <dir>              Distribution root to verify (default: executable directory)\n"
        << "  --manifest <file>         Signed manifest (default: <root>/" << kManifestFileName << ")\n"
        << "  --signature <file>        minisign signature (default: <manifest>" << kSignatureSuffix << ")\n"
        << "  --report-dir <dir>        Report directory (default: $" << kReportDirEnv << " or <root>/reports)\n"
        << "  --probe-timeout <seconds> Timeout for each external command (default 8)\n"
        << "  --json                    Print the verdict and results as JSON\n"
        << "  --verify-only             Verify the manifest and signature, run no checks\n"
        << "  --create-manifest <root> <output>  Write an unsigned manifest for root\n"
        << "  --list-checks             List the checks in execution order\n"
        << "  --help                    Show this help\n";
    return oss.str();
}

} // namespace guarddog
