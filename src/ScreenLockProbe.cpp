#include "GuardDog/ScreenLockProbe.hpp"

#include <exception>
#include <string>
#include <utility>

namespace guarddog {

namespace {

const char *kPolicyDesktopKey = "Software\\Policies\\Microsoft\\Windows\\Control Panel\\Desktop";
const char *kDesktopKey = "Control Panel\\Desktop";

std::optional<bool> toFlag(const std::optional<std::string> &value) {
    if (!value) {
        return std::nullopt;
    }
    return probe_support::trim(*value) == "1";
}

std::optional<long> toSeconds(const std::optional<std::string> &value) {
    if (!value) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const std::string trimmed = probe_support::trim(*value);
        const long seconds = std::stol(trimmed, &consumed);
        if (consumed != trimmed.size() || seconds <= 0) {
            return std::nullopt;
        }
        return seconds;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

} // namespace

ScreenLockProbe::ScreenLockProbe(ProbeEnvironment environment) : environment_(std::move(environment)) {}

ProbeOutcome ScreenLockProbe::run() const {
    ScreenLockFindings findings;
    bool fromPolicy = false;
    const auto read = [&](const std::string &name) {
        auto value = environment_.registry->readString(RegistryHive::CurrentUser, kPolicyDesktopKey, name);
        if (value) {
            fromPolicy = true;
            return value;
        }
        return environment_.registry->readString(RegistryHive::CurrentUser, kDesktopKey, name);
    };

    const auto active = read("ScreenSaveActive");
    const auto secure = read("ScreenSaverIsSecure");
    const auto timeout = read("ScreenSaveTimeOut");

    findings.active = toFlag(active);
    findings.secure = toFlag(secure);
    findings.timeoutSeconds = toSeconds(timeout);
    findings.source = fromPolicy ? "registry (group policy)" : "registry";
    if (timeout && !findings.timeoutSeconds) {
        findings.diagnostics.push_back("ScreenSaveTimeOut has an unusable value: " + *timeout);
    }
    return ProbeOutcome::success(std::move(findings));
}

} // namespace guarddog
