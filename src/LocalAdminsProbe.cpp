#include "GuardDog/LocalAdminsProbe.hpp"

#include <utility>

namespace guarddog {

namespace {

const char *kLocalGroupMemberScript =
    "Get-LocalGroupMember -Group 'Administrators' | ForEach-Object { 'Member=' + $_.Name }";

const char *kAdsiScript = "$group = [ADSI]'WinNT://./Administrators,group'; "
                          "foreach ($m in @($group.psbase.Invoke('Members'))) { "
                          "$path = $m.GetType().InvokeMember('ADsPath', 'GetProperty', $null, $m, $null); "
                          "'AdsPath=' + $path }";

} // namespace

LocalAdminsProbe::LocalAdminsProbe(ProbeEnvironment environment, std::string computerName)
    : environment_(std::move(environment)), computerName_(std::move(computerName)) {}

// WinNT://CORP/Domain Admins -> CORP\Domain Admins
// WinNT://WORKGROUP/PC/bob -> PC\bob
std::string LocalAdminsProbe::accountFromAdsPath(const std::string &adsPath) {
    std::string path = adsPath;
    const std::string scheme = "WinNT://";
    if (path.compare(0, scheme.size(), scheme) == 0) {
        path.erase(0, scheme.size());
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto last = path.rfind('/');
    if (last == std::string::npos) {
        return path;
    }
    const auto previous = path.rfind('/', last == 0 ? 0 : last - 1);
    const std::size_t start = (previous == std::string::npos || previous >= last) ? 0 : previous + 1;
    return path.substr(start, last - start) + "\\" + path.substr(last + 1);
}

std::vector<std::string> LocalAdminsProbe::parseAdsPaths(const std::string &output) {
    std::vector<std::string> members;
    const auto values = probe_support::parseKeyValueLines(output);
    const auto range = values.equal_range("AdsPath");
    for (auto it = range.first; it != range.second; ++it) {
        const std::string account = accountFromAdsPath(it->second);
        if (!account.empty()) {
            members.push_back(account);
        }
    }
    return members;
}

std::vector<std::string> LocalAdminsProbe::parseMembers(const std::string &output) {
    std::vector<std::string> members;
    const auto values = probe_support::parseKeyValueLines(output);
    const auto range = values.equal_range("Member");
    for (auto it = range.first; it != range.second; ++it) {
        if (!it->second.empty()) {
            members.push_back(it->second);
        }
    }
    return members;
}

ProbeOutcome LocalAdminsProbe::run() const {
    LocalAdminsFindings findings;
    findings.computerName = computerName_;

    const auto primary = probe_support::runPowerShell(*environment_.runner, kLocalGroupMemberScript,
                                                      environment_.timeout);
    if (primary.succeeded()) {
        findings.members = parseMembers(primary.output);
        findings.source = "powershell";
    } else {
        findings.diagnostics.push_back("Get-LocalGroupMember failed: " + probe_support::describeFailure(primary));
    }

    if (findings.members.empty()) {
        const auto fallback = probe_support::runPowerShell(*environment_.runner, kAdsiScript, environment_.timeout);
        if (fallback.succeeded()) {
            findings.members = parseAdsPaths(fallback.output);
            findings.source = "adsi";
        } else {
            findings.diagnostics.push_back("ADSI query failed: " + probe_support::describeFailure(fallback));
        }
    }

    if (findings.members.empty()) {
        std::string message = "The local Administrators group could not be read.";
        for (const auto &note : findings.diagnostics) {
            message += " " + note;
        }
        return ProbeOutcome::failure(ProbeErrorKind::Unavailable, message);
    }
    return ProbeOutcome::success(std::move(findings));
}

} // namespace guarddog
