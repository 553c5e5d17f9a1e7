#include "GuardDog/DefenderProbe.hpp"

#include <cstdint>
#include <utility>

namespace guarddog {

namespace {

const char *kRealTimeKey = "SOFTWARE\\Microsoft\\Windows Defender\\Real-Time Protection";
const char *kPolicyRealTimeKey = "SOFTWARE\\Policies\\Microsoft\\Windows Defender\\Real-Time Protection";
const char *kDisableValue = "DisableRealtimeMonitoring";

const char *kComputerStatusScript =
    "$s = Get-MpComputerStatus; "
    "'AMServiceEnabled=' + $s.AMServiceEnabled; "
    "'AntivirusEnabled=' + $s.AntivirusEnabled; "
    "'RealTimeProtectionEnabled=' + $s.RealTimeProtectionEnabled";

std::optional<bool> lookupBool(const std::multimap<std::string, std::string> &values, const std::string &key) {
    const auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return probe_support::parseBool(it->second);
}

std::optional<bool> disabledFlag(const std::optional<std::uint32_t> &value) {
    if (!value) {
        return std::nullopt;
    }
    return *value == 1;
}

} // namespace

DefenderProbe::DefenderProbe(ProbeEnvironment environment) : environment_(std::move(environment)) {}

std::optional<DefenderFindings> DefenderProbe::parseComputerStatus(const std::string &output) {
    const auto values = probe_support::parseKeyValueLines(output);
    DefenderFindings findings;
    findings.amServiceEnabled = lookupBool(values, "AMServiceEnabled");
    findings.antivirusEnabled = lookupBool(values, "AntivirusEnabled");
    findings.realTimeProtectionEnabled = lookupBool(values, "RealTimeProtectionEnabled");
    if (!findings.realTimeProtectionEnabled && !findings.amServiceEnabled && !findings.antivirusEnabled) {
        return std::nullopt;
    }
    if (findings.realTimeProtectionEnabled) {
        findings.disabledLocal = !*findings.realTimeProtectionEnabled;
    }
    findings.source = "powershell";
    return findings;
}

DefenderFindings DefenderProbe::readRegistry() const {
    DefenderFindings findings;
    findings.source = "registry";
    findings.disabledLocal =
        disabledFlag(environment_.registry->readDword(RegistryHive::LocalMachine, kRealTimeKey, kDisableValue));
    findings.disabledPolicy = disabledFlag(
        environment_.registry->readDword(RegistryHive::LocalMachine, kPolicyRealTimeKey, kDisableValue));
    return findings;
}

ProbeOutcome DefenderProbe::run() const {
    const auto result = probe_support::runPowerShell(*environment_.runner, kComputerStatusScript, environment_.timeout);
    std::string note;
    if (result.succeeded()) {
        if (auto findings = parseComputerStatus(result.output)) {
            return ProbeOutcome::success(std::move(*findings));
        }
        note = "Get-MpComputerStatus returned no usable values.";
    } else {
        note = "Get-MpComputerStatus failed: " + probe_support::describeFailure(result);
    }

    // Registry flags are a heuristic only; they do not always reflect the
    // effective state on current Windows releases.
    auto findings = readRegistry();
    findings.diagnostics.push_back(note);
    return ProbeOutcome::success(std::move(findings));
}

} // namespace guarddog
