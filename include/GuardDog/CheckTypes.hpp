#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace guarddog {

namespace checks {
constexpr const char *kFirewall = "firewall";
constexpr const char *kRdp = "rdp";
constexpr const char *kDefender = "defender";
constexpr const char *kLocalAdmins = "local_admins";
constexpr const char *kScreenLock = "screen_lock";
} // namespace checks

enum class CheckStatus { Ok, Warn, High, Unknown };

std::string toString(CheckStatus status);

// HIGH > WARN > UNKNOWN > OK
int severityRank(CheckStatus status);

struct CheckDetail {
    std::string label;
    std::string value;
};

struct CheckResult {
    std::string id;
    std::string title;
    CheckStatus status{CheckStatus::Unknown};
    std::string summary;
    std::vector<CheckDetail> details;
    std::vector<std::string> remediation;
};

enum class ProfileState { On, Off, Unknown };

std::string toString(ProfileState state);

struct FirewallProfileFinding {
    std::string profile; // "domain", "private" or "public"
    ProfileState state{ProfileState::Unknown};
    std::string rawValue;
};

struct FirewallFindings {
    std::vector<FirewallProfileFinding> profiles;
    std::string source;
    std::vector<std::string> diagnostics;
};

struct RdpFindings {
    std::optional<bool> rdpEnabled;
    std::optional<bool> nlaRequired;
    std::string source;
    std::vector<std::string> diagnostics;
};

struct DefenderFindings {
    std::optional<bool> disabledLocal;
    std::optional<bool> disabledPolicy;
    std::optional<bool> amServiceEnabled;
    std::optional<bool> antivirusEnabled;
    std::optional<bool> realTimeProtectionEnabled;
    std::string source;
    std::vector<std::string> diagnostics;
};

struct LocalAdminsFindings {
    std::vector<std::string> members; // "DOMAIN\name" as reported by Windows
    std::string computerName;
    std::string source;
    std::vector<std::string> diagnostics;
};

struct ScreenLockFindings {
    std::optional<bool> active;
    std::optional<bool> secure;
    std::optional<long> timeoutSeconds;
    std::string source;
    std::vector<std::string> diagnostics;
};

using RawFindings =
    std::variant<FirewallFindings, RdpFindings, DefenderFindings, LocalAdminsFindings, ScreenLockFindings>;

enum class ProbeErrorKind { Unavailable, Ambiguous };

std::string toString(ProbeErrorKind kind);

struct ProbeError {
    ProbeErrorKind kind{ProbeErrorKind::Unavailable};
    std::string message;
};

struct ProbeOutcome {
    std::optional<RawFindings> findings;
    ProbeError error;

    bool ok() const { return findings.has_value(); }

    static ProbeOutcome success(RawFindings findings);
    static ProbeOutcome failure(ProbeErrorKind kind, std::string message);
};

} // namespace guarddog
