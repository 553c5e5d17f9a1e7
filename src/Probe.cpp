#include "GuardDog/Probe.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace guarddog {

ProbeOutcome UnsupportedHostProbe::run() const {
    return ProbeOutcome::failure(ProbeErrorKind::Unavailable,
                                 "This check is available only when GuardDog runs on a Windows host.");
}

namespace probe_support {

std::string powershellPath() {
    return systemDirectory() + "\\WindowsPowerShell\\v1.0\\powershell.exe";
}

CommandResult runPowerShell(const CommandRunner &runner, const std::string &script,
                            std::chrono::milliseconds timeout) {
    const std::string wrapped =
        "$ErrorActionPreference = 'Stop'; [Console]::OutputEncoding = [System.Text.Encoding]::UTF8; " + script;
    return runner.run({powershellPath(), "-NoLogo", "-NoProfile", "-NonInteractive", "-Command", wrapped}, timeout);
}

std::multimap<std::string, std::string> parseKeyValueLines(const std::string &output) {
    std::multimap<std::string, std::string> values;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const auto delimiter = line.find('=');
        if (delimiter == std::string::npos || delimiter == 0) {
            continue;
        }
        values.emplace(trim(line.substr(0, delimiter)), trim(line.substr(delimiter + 1)));
    }
    return values;
}

std::optional<bool> parseBool(const std::string &value) {
    std::string lower = trim(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    return std::nullopt;
}

std::string describeFailure(const CommandResult &result) {
    if (!result.launched) {
        return result.error.empty() ? "command could not be started" : result.error;
    }
    if (result.timedOut) {
        return "command timed out";
    }
    std::ostringstream oss;
    oss << "command exited with code " << result.exitCode;
    const auto output = trim(result.output);
    if (!output.empty()) {
        oss << ": " << output.substr(0, 200);
    }
    return oss.str();
}

std::string trim(const std::string &value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace probe_support

} // namespace guarddog
