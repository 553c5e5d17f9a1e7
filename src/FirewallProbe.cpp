#include "GuardDog/FirewallProbe.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <utility>

namespace guarddog {

namespace {

const char *kPolicyBase = "SOFTWARE\\Policies\\Microsoft\\WindowsFirewall";
const char *kOperationalBase = "SYSTEM\\CurrentControlSet\\Services\\SharedAccess\\Parameters\\FirewallPolicy";

struct ProfileKeys {
    const char *profile;
    const char *policyKey;
    const char *operationalKey;
};

// StandardProfile is the historical name of the private profile.
const std::array<ProfileKeys, 3> kProfileKeys = {{
    {"domain", "DomainProfile", "DomainProfile"},
    {"private", "PrivateProfile", "StandardProfile"},
    {"public", "PublicProfile", "PublicProfile"},
}};

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

} // namespace

FirewallProbe::FirewallProbe(ProbeEnvironment environment) : environment_(std::move(environment)) {}

std::vector<FirewallProfileFinding> FirewallProbe::parseNetshOutput(const std::string &output) {
    std::vector<FirewallProfileFinding> profiles;
    std::string current;
    std::istringstream stream(output);
    std::string rawLine;
    while (std::getline(stream, rawLine)) {
        const std::string line = probe_support::trim(rawLine);
        if (line.empty()) {
            continue;
        }
        const std::string lower = toLowerCopy(line);
        if (lower.find("profile settings") != std::string::npos) {
            current.clear();
            for (const auto &keys : kProfileKeys) {
                if (lower.rfind(keys.profile, 0) == 0) {
                    current = keys.profile;
                }
            }
            continue;
        }
        if (current.empty() || lower.rfind("state", 0) != 0) {
            continue;
        }

        std::istringstream tokens(line);
        std::string token;
        std::string value;
        while (tokens >> token) {
            value = token;
        }
        FirewallProfileFinding finding;
        finding.profile = current;
        finding.rawValue = toUpperCopy(value);
        if (finding.rawValue == "ON") {
            finding.state = ProfileState::On;
        } else if (finding.rawValue == "OFF") {
            finding.state = ProfileState::Off;
        }
        const auto existing = std::find_if(profiles.begin(), profiles.end(),
                                           [&](const FirewallProfileFinding &item) { return item.profile == current; });
        if (existing != profiles.end()) {
            *existing = finding;
        } else {
            profiles.push_back(finding);
        }
        current.clear();
    }
    return profiles;
}

std::vector<FirewallProfileFinding> FirewallProbe::readRegistry() const {
    std::vector<FirewallProfileFinding> profiles;
    bool anyValue = false;
    for (const auto &keys : kProfileKeys) {
        auto enabled = environment_.registry->readDword(
            RegistryHive::LocalMachine, std::string(kPolicyBase) + "\\" + keys.policyKey, "EnableFirewall");
        if (!enabled) {
            enabled = environment_.registry->readDword(
                RegistryHive::LocalMachine, std::string(kOperationalBase) + "\\" + keys.operationalKey,
                "EnableFirewall");
        }

        FirewallProfileFinding finding;
        finding.profile = keys.profile;
        if (enabled) {
            anyValue = true;
            finding.rawValue = "EnableFirewall=" + std::to_string(*enabled);
            if (*enabled == 1) {
                finding.state = ProfileState::On;
            } else if (*enabled == 0) {
                finding.state = ProfileState::Off;
            }
        }
        profiles.push_back(finding);
    }
    if (!anyValue) {
        profiles.clear();
    }
    return profiles;
}

ProbeOutcome FirewallProbe::run() const {
    FirewallFindings findings;
    const auto netsh = environment_.runner->run(
        {systemDirectory() + "\\netsh.exe", "advfirewall", "show", "allprofiles"}, environment_.timeout);
    if (netsh.succeeded()) {
        findings.profiles = parseNetshOutput(netsh.output);
        findings.source = "netsh";
        if (findings.profiles.empty()) {
            findings.diagnostics.push_back("netsh output did not contain recognisable profile states.");
        }
    } else {
        findings.diagnostics.push_back("netsh advfirewall failed: " + probe_support::describeFailure(netsh));
    }

    if (findings.profiles.empty()) {
        findings.profiles = readRegistry();
        findings.source = "registry";
        if (findings.profiles.empty()) {
            std::string message = "Neither netsh nor the registry reported firewall state.";
            for (const auto &note : findings.diagnostics) {
                message += " " + note;
            }
            return ProbeOutcome::failure(ProbeErrorKind::Unavailable, message);
        }
        findings.diagnostics.push_back("Used registry fallback for firewall state.");
    }
    return ProbeOutcome::success(std::move(findings));
}

} // namespace guarddog
