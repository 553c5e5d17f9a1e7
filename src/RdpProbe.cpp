#include "GuardDog/RdpProbe.hpp"

#include <utility>

namespace guarddog {

namespace {
const char *kTerminalServerKey = "SYSTEM\\CurrentControlSet\\Control\\Terminal Server";
const char *kRdpTcpKey = "SYSTEM\\CurrentControlSet\\Control\\Terminal Server\\WinStations\\RDP-Tcp";
} // namespace

RdpProbe::RdpProbe(ProbeEnvironment environment) : environment_(std::move(environment)) {}

ProbeOutcome RdpProbe::run() const {
    RdpFindings findings;
    findings.source = "registry";

    const auto deny = environment_.registry->readDword(RegistryHive::LocalMachine, kTerminalServerKey,
                                                       "fDenyTSConnections");
    if (deny) {
        findings.rdpEnabled = *deny == 0;
    } else {
        findings.diagnostics.push_back("fDenyTSConnections could not be read.");
    }

    const auto userAuthentication =
        environment_.registry->readDword(RegistryHive::LocalMachine, kRdpTcpKey, "UserAuthentication");
    if (userAuthentication) {
        findings.nlaRequired = *userAuthentication == 1;
    } else {
        findings.diagnostics.push_back("UserAuthentication could not be read.");
    }
    return ProbeOutcome::success(std::move(findings));
}

} // namespace guarddog
