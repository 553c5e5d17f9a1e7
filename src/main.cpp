#include "GuardDog/Classifier.hpp"
#include "GuardDog/CommandRunner.hpp"
#include "GuardDog/Config.hpp"
#include "GuardDog/HtmlReport.hpp"
#include "GuardDog/Manifest.hpp"
#include "GuardDog/ManifestVerifier.hpp"
#include "GuardDog/PipelineController.hpp"
#include "GuardDog/ProbeRegistry.hpp"
#include "GuardDog/RegistryReader.hpp"
#include "GuardDog/SignatureVerifier.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_cancelRequested = 0;

void onTerminationSignal(int) {
    g_cancelRequested = 1;
}

void installSignalHandlers() {
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
}

std::string jsonEscape(const std::string &value) {
    std::ostringstream oss;
    for (char ch : value) {
        switch (ch) {
        case '\\':
            oss << "\\\\";
            break;
        case '\"':
            oss << "\\\"";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                static const char *hex = "0123456789abcdef";
                oss << "\\u00" << hex[(ch >> 4) & 0x0F] << hex[ch & 0x0F];
            } else {
                oss << ch;
            }
        }
    }
    return oss.str();
}

std::string verdictJson(const guarddog::VerificationVerdict &verdict) {
    std::ostringstream oss;
    oss << "{\"outcome\": \"" << (verdict.passed() ? "pass" : "fail") << "\"";
    if (!verdict.passed()) {
        oss << ", \"reason\": \"" << jsonEscape(guarddog::toString(verdict.reason)) << "\"";
        if (!verdict.path.empty()) {
            oss << ", \"path\": \"" << jsonEscape(verdict.path) << "\"";
        }
        oss << ", \"detail\": \"" << jsonEscape(verdict.detail) << "\"";
    }
    oss << "}";
    return oss.str();
}

void printSummaryJson(const guarddog::RunSummary &summary, const std::optional<fs::path> &reportPath) {
    std::cout << "{\n  \"verification\": " << verdictJson(summary.verdict) << ",\n"
              << "  \"overallStatus\": \"" << guarddog::toString(summary.overallStatus) << "\",\n"
              << "  \"outcome\": \"" << guarddog::toString(summary.outcome()) << "\",\n"
              << "  \"timestamp\": \"" << jsonEscape(summary.timestamp) << "\",\n"
              << "  \"host\": \"" << jsonEscape(summary.hostId) << "\",\n";
    if (reportPath) {
        std::cout << "  \"report\": \"" << jsonEscape(reportPath->string()) << "\",\n";
    }
    std::cout << "  \"checks\": [\n";
    for (std::size_t i = 0; i < summary.checks.size(); ++i) {
        const auto &check = summary.checks[i];
        std::cout << "    {\"id\": \"" << jsonEscape(check.id) << "\", \"title\": \"" << jsonEscape(check.title)
                  << "\", \"status\": \"" << guarddog::toString(check.status) << "\", \"summary\": \""
                  << jsonEscape(check.summary) << "\", \"details\": [";
        for (std::size_t d = 0; d < check.details.size(); ++d) {
            if (d > 0) {
                std::cout << ',';
            }
            std::cout << "{\"label\": \"" << jsonEscape(check.details[d].label) << "\", \"value\": \""
                      << jsonEscape(check.details[d].value) << "\"}";
        }
        std::cout << "], \"remediation\": [";
        for (std::size_t r = 0; r < check.remediation.size(); ++r) {
            if (r > 0) {
                std::cout << ',';
            }
            std::cout << "\"" << jsonEscape(check.remediation[r]) << "\"";
        }
        std::cout << "]}";
        if (i + 1 < summary.checks.size()) {
            std::cout << ',';
        }
        std::cout << "\n";
    }
    std::cout << "  ],\n  \"diagnostics\": [";
    for (std::size_t i = 0; i < summary.diagnostics.size(); ++i) {
        if (i > 0) {
            std::cout << ", ";
        }
        std::cout << "\"" << jsonEscape(summary.diagnostics[i]) << "\"";
    }
    std::cout << "]\n}" << std::endl;
}

void printVerdict(const guarddog::VerificationVerdict &verdict) {
    if (verdict.passed()) {
        std::cout << "[+] Integrity verification succeeded." << std::endl;
        return;
    }
    std::cerr << "[!] Integrity verification failed: " << guarddog::toString(verdict.reason);
    if (!verdict.path.empty()) {
        std::cerr << " (" << verdict.path << ")";
    }
    std::cerr << "\n    " << verdict.detail << std::endl;
}

void printSummary(const guarddog::RunSummary &summary) {
    printVerdict(summary.verdict);
    for (const auto &check : summary.checks) {
        std::cout << "[*] " << check.title << ": " << guarddog::toString(check.status) << "\n"
                  << "    " << check.summary << "\n";
    }
    for (const auto &note : summary.diagnostics) {
        std::cout << "[i] " << note << "\n";
    }
    std::cout << "[*] Overall: " << guarddog::toString(summary.overallStatus) << " ("
              << guarddog::toString(summary.outcome()) << ")" << std::endl;
}

guarddog::ManifestVerifier makeVerifier() {
    return guarddog::ManifestVerifier(guarddog::SignatureVerifier::withEmbeddedKey());
}

int runVerifyOnly(const guarddog::RunConfig &config) {
    const auto verdict = makeVerifier().verify(config.root, config.manifest, config.signature);
    if (g_cancelRequested) {
        std::cerr << "[!] Cancelled." << std::endl;
        return guarddog::exit_codes::kCancelled;
    }
    if (config.json) {
        std::cout << verdictJson(verdict) << std::endl;
    } else {
        printVerdict(verdict);
    }
    return guarddog::exitCodeFor(verdict);
}

int runCreateManifest(const guarddog::RunConfig &config) {
    std::vector<std::string> excluded;
    std::error_code rootError;
    std::error_code outputError;
    const fs::path root = fs::weakly_canonical(config.manifestSourceRoot, rootError);
    const fs::path output = fs::weakly_canonical(config.manifestOutput, outputError);
    if (!rootError && !outputError) {
        const fs::path relative = output.lexically_relative(root);
        if (!relative.empty() && *relative.begin() != "..") {
            excluded.push_back(relative.generic_string());
            excluded.push_back(relative.generic_string() + guarddog::kSignatureSuffix);
        }
    }

    const auto manifest = guarddog::createManifest(config.manifestSourceRoot, excluded);
    std::ofstream out(config.manifestOutput, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw guarddog::IoError("Unable to open " + config.manifestOutput.string() + " for writing");
    }
    out << guarddog::serializeManifest(manifest);
    out.flush();
    if (!out) {
        throw guarddog::IoError("Unable to write " + config.manifestOutput.string());
    }
    std::cout << "[+] Manifest with " << manifest.entries.size() << " entries written to "
              << config.manifestOutput.string() << "\n"
              << "[i] Sign it with minisign before distributing." << std::endl;
    return guarddog::exit_codes::kSuccess;
}

int runListChecks() {
    guarddog::ProbeEnvironment environment;
    const auto registry = guarddog::ProbeRegistry::createDefault(environment, "");
    for (const auto &id : registry.ids()) {
        std::cout << id << "\t" << guarddog::Classifier::titleFor(id) << "\n";
    }
    return guarddog::exit_codes::kSuccess;
}

int runAudit(const guarddog::RunConfig &config) {
    guarddog::ProbeEnvironment environment;
    environment.runner = std::make_shared<guarddog::ProcessCommandRunner>();
    environment.registry = std::make_shared<guarddog::WindowsRegistryReader>();
    environment.timeout = config.probeTimeout;

    const std::string host = guarddog::hostIdentifier();
    const auto registry = guarddog::ProbeRegistry::createDefault(environment, host);
    const auto verifier = makeVerifier();
    guarddog::PipelineController pipeline(
        [&]() { return verifier.verify(config.root, config.manifest, config.signature); }, registry,
        guarddog::Classifier{}, host);
    pipeline.setCancellationCheck([]() { return g_cancelRequested != 0; });

    if (!config.json) {
        std::cout << "[*] Verifying " << config.manifest.string() << std::endl;
    }
    const auto state = pipeline.run();
    if (state == guarddog::PipelineState::Cancelled) {
        std::cerr << "[!] Cancelled. No report was written." << std::endl;
        return guarddog::exit_codes::kCancelled;
    }

    const auto &summary = pipeline.summary();
    std::optional<fs::path> reportPath;
    int exitCode = guarddog::exitCodeFor(summary.verdict);
    try {
        reportPath = guarddog::HtmlReport(summary).write(config.reportDir);
    } catch (const guarddog::IoError &ex) {
        std::cerr << "[!] " << ex.what() << std::endl;
        if (exitCode == guarddog::exit_codes::kSuccess) {
            exitCode = guarddog::exit_codes::kReportWriteFailed;
        }
    }

    if (config.json) {
        printSummaryJson(summary, reportPath);
    } else {
        printSummary(summary);
        if (reportPath) {
            std::cout << "[+] Report written to: " << reportPath->string() << std::endl;
        }
    }
    return exitCode;
}

} // namespace

int main(int argc, char *argv[]) {
    installSignalHandlers();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    guarddog::RunConfig config;
    try {
        const char *reportDir = std::getenv(guarddog::kReportDirEnv);
        std::optional<std::string> reportDirOverride;
        if (reportDir != nullptr) {
            reportDirOverride = reportDir;
        }
        config = guarddog::parseArguments(args, guarddog::executableDirectory(argc > 0 ? argv[0] : nullptr),
                                          reportDirOverride);
    } catch (const std::invalid_argument &ex) {
        std::cerr << ex.what() << "\n" << guarddog::usageText(argc > 0 ? argv[0] : "guarddog");
        return guarddog::exit_codes::kUsage;
    }

    try {
        switch (config.mode) {
        case guarddog::RunMode::Help:
            std::cout << guarddog::usageText(argc > 0 ? argv[0] : "guarddog");
            return guarddog::exit_codes::kSuccess;
        case guarddog::RunMode::ListChecks:
            return runListChecks();
        case guarddog::RunMode::CreateManifest:
            return runCreateManifest(config);
        case guarddog::RunMode::VerifyOnly:
            return runVerifyOnly(config);
        case guarddog::RunMode::Audit:
            return runAudit(config);
        }
    } catch (const std::exception &ex) {
        std::cerr << "[!] " << ex.what() << std::endl;
        return guarddog::exit_codes::kUsage;
    }
    return guarddog::exit_codes::kUsage;
}
