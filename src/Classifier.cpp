#include "GuardDog/Classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace guarddog {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

std::string capitalise(std::string value) {
    if (!value.empty()) {
        value[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
    }
    return value;
}

std::string describe(const std::optional<bool> &value, const std::string &whenTrue, const std::string &whenFalse) {
    if (!value) {
        return "UNKNOWN";
    }
    return *value ? whenTrue : whenFalse;
}

CheckResult makeResult(const std::string &id, CheckStatus status, std::string summary) {
    CheckResult result;
    result.id = id;
    result.title = Classifier::titleFor(id);
    result.status = status;
    result.summary = std::move(summary);
    return result;
}

void appendSourceAndNotes(CheckResult &result, const std::string &source, const std::vector<std::string> &notes) {
    result.details.push_back({"Data source", source.empty() ? "none" : source});
    for (const auto &note : notes) {
        result.details.push_back({"Note", note});
    }
}

std::vector<std::string> manualSteps(const std::string &checkId) {
    if (checkId == checks::kFirewall) {
        return {"Open Windows Security > 'Firewall & network protection'.",
                "Confirm the firewall is ON for Domain, Private and Public networks."};
    }
    if (checkId == checks::kRdp) {
        return {"Open Settings > System > Remote Desktop.",
                "Check whether Remote Desktop is enabled and whether Network Level Authentication is required."};
    }
    if (checkId == checks::kDefender) {
        return {"Open Windows Security > 'Virus & threat protection'.",
                "Confirm real-time protection (or another antivirus product) is active."};
    }
    if (checkId == checks::kLocalAdmins) {
        return {"Open Computer Management > Local Users and Groups > Groups > Administrators.",
                "Review which accounts have administrator rights."};
    }
    if (checkId == checks::kScreenLock) {
        return {"Open Settings > Accounts > Sign-in options (or 'Lock screen' settings).",
                "Review how and when the screen locks after inactivity."};
    }
    return {"Re-run GuardDog or check this setting manually."};
}

CheckResult mismatchedFindings(const std::string &checkId) {
    auto result = makeResult(checkId, CheckStatus::Unknown,
                             "GuardDog could not complete this check: the probe returned data for a different check.");
    result.remediation = manualSteps(checkId);
    return result;
}

template <typename>
constexpr bool kAlwaysFalse = false;

} // namespace

Classifier::Classifier(ClassifierPolicy policy) : policy_(policy) {}

std::string Classifier::titleFor(const std::string &checkId) {
    if (checkId == checks::kFirewall) {
        return "Windows Firewall";
    }
    if (checkId == checks::kRdp) {
        return "Remote Desktop (RDP)";
    }
    if (checkId == checks::kDefender) {
        return "Microsoft Defender";
    }
    if (checkId == checks::kLocalAdmins) {
        return "Local Administrators";
    }
    if (checkId == checks::kScreenLock) {
        return "Screen Lock";
    }
    return checkId;
}

CheckResult Classifier::classify(const std::string &checkId, const RawFindings &findings) const {
    return std::visit(
        [&](const auto &raw) -> CheckResult {
            using Findings = std::decay_t<decltype(raw)>;
            if constexpr (std::is_same_v<Findings, FirewallFindings>) {
                return checkId == checks::kFirewall ? classifyFirewall(raw) : mismatchedFindings(checkId);
            } else if constexpr (std::is_same_v<Findings, RdpFindings>) {
                return checkId == checks::kRdp ? classifyRdp(raw) : mismatchedFindings(checkId);
            } else if constexpr (std::is_same_v<Findings, DefenderFindings>) {
                return checkId == checks::kDefender ? classifyDefender(raw) : mismatchedFindings(checkId);
            } else if constexpr (std::is_same_v<Findings, LocalAdminsFindings>) {
                return checkId == checks::kLocalAdmins ? classifyLocalAdmins(raw) : mismatchedFindings(checkId);
            } else if constexpr (std::is_same_v<Findings, ScreenLockFindings>) {
                return checkId == checks::kScreenLock ? classifyScreenLock(raw) : mismatchedFindings(checkId);
            } else {
                static_assert(kAlwaysFalse<Findings>, "unhandled findings type");
            }
        },
        findings);
}

CheckResult Classifier::classifyFailure(const std::string &checkId, const ProbeError &error) const {
    auto result = makeResult(checkId, CheckStatus::Unknown,
                             "GuardDog could not complete this check, so this setting was not verified.");
    result.details.push_back({"Reason", toString(error.kind)});
    if (!error.message.empty()) {
        result.details.push_back({"Error", error.message});
    }
    result.remediation = manualSteps(checkId);
    return result;
}

CheckResult Classifier::classifyFirewall(const FirewallFindings &findings) const {
    static const std::array<const char *, 3> kProfiles = {"domain", "private", "public"};

    bool anyOff = false;
    bool allOn = true;
    std::vector<CheckDetail> profileDetails;
    for (const char *name : kProfiles) {
        const auto it = std::find_if(findings.profiles.begin(), findings.profiles.end(),
                                     [&](const FirewallProfileFinding &profile) { return profile.profile == name; });
        const ProfileState state = it == findings.profiles.end() ? ProfileState::Unknown : it->state;
        anyOff = anyOff || state == ProfileState::Off;
        allOn = allOn && state == ProfileState::On;

        std::string value = toString(state);
        if (it == findings.profiles.end()) {
            value += " (not reported)";
        } else if (state == ProfileState::Unknown && !it->rawValue.empty()) {
            value += " (" + it->rawValue + ")";
        }
        profileDetails.push_back({capitalise(name) + " profile", value});
    }

    CheckResult result;
    if (findings.profiles.empty()) {
        result = makeResult(checks::kFirewall, CheckStatus::Unknown, "GuardDog could not read the firewall status.");
    } else if (anyOff) {
        result = makeResult(checks::kFirewall, CheckStatus::High,
                            "Windows Firewall is turned OFF for at least one network profile.");
    } else if (allOn) {
        result = makeResult(checks::kFirewall, CheckStatus::Ok,
                            "Windows Firewall is turned ON for all network profiles.");
    } else {
        result = makeResult(checks::kFirewall, CheckStatus::Unknown,
                            "GuardDog could not verify the firewall state for every profile.");
    }
    result.details = std::move(profileDetails);
    appendSourceAndNotes(result, findings.source, findings.diagnostics);

    if (result.status == CheckStatus::Ok) {
        result.remediation = {"No action needed. Windows Firewall appears to be ON for all profiles."};
    } else {
        result.remediation = manualSteps(checks::kFirewall);
    }
    return result;
}

CheckResult Classifier::classifyRdp(const RdpFindings &findings) const {
    CheckResult result;
    if (findings.rdpEnabled == false) {
        result = makeResult(checks::kRdp, CheckStatus::Ok,
                            "Remote Desktop is turned OFF. This reduces the risk of remote logins to this computer.");
    } else if (findings.rdpEnabled == true && findings.nlaRequired == true) {
        result = makeResult(checks::kRdp, CheckStatus::Ok,
                            "Remote Desktop is turned ON, and Network Level Authentication (NLA) is required.");
    } else if (findings.rdpEnabled == true && findings.nlaRequired == false) {
        result = makeResult(checks::kRdp, CheckStatus::High,
                            "Remote Desktop is ON and Network Level Authentication (NLA) is NOT required. "
                            "This makes it easier for attackers to try to sign in remotely.");
    } else if (findings.rdpEnabled == true) {
        result = makeResult(checks::kRdp, CheckStatus::Unknown,
                            "Remote Desktop is ON, but GuardDog could not confirm whether NLA is required.");
    } else {
        result = makeResult(checks::kRdp, CheckStatus::Unknown,
                            "GuardDog could not determine the Remote Desktop settings.");
    }

    result.details.push_back({"Remote Desktop connections", describe(findings.rdpEnabled, "ENABLED", "DISABLED")});
    result.details.push_back(
        {"Network Level Authentication (NLA)", describe(findings.nlaRequired, "REQUIRED", "NOT required")});
    appendSourceAndNotes(result, findings.source, findings.diagnostics);

    switch (result.status) {
    case CheckStatus::Ok:
        result.remediation = {"No urgent action needed.",
                              "If you do not need Remote Desktop at all, turn it off in Settings > System > "
                              "Remote Desktop."};
        break;
    case CheckStatus::High:
        result.remediation = {"Open Settings > System > Remote Desktop.",
                              "If you do not need Remote Desktop, turn it off.",
                              "If you do need it, turn ON 'Require devices to use Network Level Authentication'."};
        break;
    default:
        result.remediation = manualSteps(checks::kRdp);
        break;
    }
    return result;
}

CheckResult Classifier::classifyDefender(const DefenderFindings &findings) const {
    const bool anyDisabled = findings.disabledLocal == true || findings.disabledPolicy == true;
    const bool anyEnabledHint = findings.disabledLocal == false || findings.disabledPolicy == false;

    CheckResult result;
    if (anyDisabled) {
        result = makeResult(checks::kDefender, CheckStatus::High,
                            "Microsoft Defender real-time protection appears to be turned OFF. "
                            "This makes it easier for malware to run without being noticed.");
        result.remediation = {"Open Windows Security > 'Virus & threat protection' > 'Manage settings'.",
                              "Turn real-time protection ON.",
                              "If you use another antivirus product, confirm it is active and up to date."};
    } else if (anyEnabledHint) {
        result = makeResult(checks::kDefender, CheckStatus::Ok,
                            "Microsoft Defender real-time protection appears to be turned ON "
                            "(it is not marked as disabled in local or policy settings).");
        result.remediation = {
            "No action needed. You can confirm this in Windows Security > 'Virus & threat protection'."};
    } else {
        result = makeResult(checks::kDefender, CheckStatus::Unknown,
                            "GuardDog could not find clear settings for Microsoft Defender real-time protection. "
                            "This can happen if another antivirus product is managing protection.");
        result.remediation = manualSteps(checks::kDefender);
    }

    result.details.push_back(
        {"Local setting", describe(findings.disabledLocal, "real-time protection is DISABLED",
                                   "real-time protection is NOT disabled")});
    result.details.push_back({"Policy", describe(findings.disabledPolicy, "real-time protection is DISABLED by policy",
                                                 "real-time protection is NOT disabled by policy")});
    if (findings.amServiceEnabled) {
        result.details.push_back({"Antimalware service", *findings.amServiceEnabled ? "running" : "not running"});
    }
    if (findings.antivirusEnabled) {
        result.details.push_back({"Antivirus engine", *findings.antivirusEnabled ? "enabled" : "disabled"});
    }
    appendSourceAndNotes(result, findings.source, findings.diagnostics);
    return result;
}

CheckResult Classifier::classifyLocalAdmins(const LocalAdminsFindings &findings) const {
    if (findings.members.empty() || findings.computerName.empty()) {
        auto result = makeResult(checks::kLocalAdmins, CheckStatus::Unknown,
                                 "GuardDog could not read the list of administrator accounts.");
        if (findings.members.empty()) {
            result.details.push_back({"Members", "No members were returned for the local Administrators group."});
        } else {
            result.details.push_back({"Computer name", "unknown, so local accounts cannot be told apart"});
            for (const auto &member : findings.members) {
                result.details.push_back({"Administrator", member});
            }
        }
        appendSourceAndNotes(result, findings.source, findings.diagnostics);
        result.remediation = manualSteps(checks::kLocalAdmins);
        return result;
    }

    const std::string localPrefix = toUpper(findings.computerName) + "\\";
    const std::string builtinAdmin = localPrefix + "ADMINISTRATOR";

    std::vector<CheckDetail> memberDetails;
    std::unordered_set<std::string> extras;
    for (const auto &member : findings.members) {
        const std::string upper = toUpper(member);
        std::string value = member;
        if (upper == builtinAdmin) {
            value += " (built-in local account)";
        } else if (upper.rfind(localPrefix, 0) == 0) {
            value += " (local user account)";
            extras.insert(upper);
        }
        memberDetails.push_back({"Administrator", value});
    }

    CheckResult result;
    if (!extras.empty()) {
        result = makeResult(checks::kLocalAdmins, CheckStatus::Warn,
                            "One or more local user accounts have administrator rights on this computer.");
        result.remediation = {"Review the local user accounts listed here that have administrator rights.",
                              "Remove admin rights from accounts you do not recognise or use day to day.",
                              "Use a standard account for everyday work and a separate admin account only when "
                              "needed."};
    } else {
        result = makeResult(checks::kLocalAdmins, CheckStatus::Ok,
                            "Only built-in or domain accounts were found in the local Administrators group.");
        result.remediation = {"No urgent action needed.",
                              "If you are not sure who should have administrator rights, review the list."};
    }
    result.details = std::move(memberDetails);
    appendSourceAndNotes(result, findings.source, findings.diagnostics);
    return result;
}

CheckResult Classifier::classifyScreenLock(const ScreenLockFindings &findings) const {
    CheckResult result;
    if (findings.active == false) {
        result = makeResult(checks::kScreenLock, CheckStatus::High,
                            "Automatic screen lock appears to be turned OFF. If you walk away from this computer, "
                            "someone could use it without signing in.");
    } else if (findings.active == true) {
        const bool shortTimeout = findings.timeoutSeconds && *findings.timeoutSeconds <= policy_.okTimeoutSeconds;
        if (shortTimeout && findings.secure == true) {
            result = makeResult(checks::kScreenLock, CheckStatus::Ok,
                                "Automatic screen lock is enabled with a reasonable timeout, and a password is "
                                "required on resume.");
        } else if (findings.timeoutSeconds && *findings.timeoutSeconds > policy_.longTimeoutSeconds) {
            result = makeResult(checks::kScreenLock, CheckStatus::Warn,
                                "Automatic screen lock is enabled, but the timeout is quite long.");
        } else if (findings.secure == false) {
            result = makeResult(checks::kScreenLock, CheckStatus::Warn,
                                "Automatic screen lock is enabled, but a password does NOT appear to be required "
                                "when it resumes.");
        } else {
            result = makeResult(checks::kScreenLock, CheckStatus::Warn,
                                "Automatic screen lock appears to be enabled, but some details (timeout or password "
                                "requirement) could not be confirmed.");
        }
    } else {
        result = makeResult(checks::kScreenLock, CheckStatus::Unknown,
                            "GuardDog could not determine the automatic screen lock settings from the current user "
                            "profile.");
    }

    result.details.push_back({"Automatic screen lock", describe(findings.active, "ENABLED", "DISABLED")});
    result.details.push_back({"Require password on resume", describe(findings.secure, "ENABLED", "DISABLED")});
    result.details.push_back({"Idle timeout before lock", findings.timeoutSeconds
                                                              ? std::to_string(*findings.timeoutSeconds) + " seconds"
                                                              : "UNKNOWN"});
    appendSourceAndNotes(result, findings.source, findings.diagnostics);

    switch (result.status) {
    case CheckStatus::Ok:
        result.remediation = {"No urgent action needed."};
        break;
    case CheckStatus::High:
        result.remediation = {"Open Settings > Accounts > Sign-in options (or 'Lock screen' settings).",
                              "Turn on automatic locking with a short timeout.",
                              "Require a password to sign back in."};
        break;
    case CheckStatus::Warn:
        result.remediation = {"Shorten the idle time before the screen locks to " +
                                  std::to_string(policy_.okTimeoutSeconds / 60) + " minutes or less.",
                              "Make sure a password is required when the computer wakes."};
        break;
    default:
        result.remediation = manualSteps(checks::kScreenLock);
        break;
    }
    return result;
}

} // namespace guarddog
