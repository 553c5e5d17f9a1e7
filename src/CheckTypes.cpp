#include "GuardDog/CheckTypes.hpp"

#include <utility>

namespace guarddog {

std::string toString(CheckStatus status) {
    switch (status) {
    case CheckStatus::Ok:
        return "OK";
    case CheckStatus::Warn:
        return "WARN";
    case CheckStatus::High:
        return "HIGH";
    case CheckStatus::Unknown:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

int severityRank(CheckStatus status) {
    switch (status) {
    case CheckStatus::Ok:
        return 0;
    case CheckStatus::Unknown:
        return 1;
    case CheckStatus::Warn:
        return 2;
    case CheckStatus::High:
        return 3;
    }
    return 1;
}

std::string toString(ProfileState state) {
    switch (state) {
    case ProfileState::On:
        return "ON";
    case ProfileState::Off:
        return "OFF";
    case ProfileState::Unknown:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string toString(ProbeErrorKind kind) {
    return kind == ProbeErrorKind::Unavailable ? "ProbeUnavailable" : "ProbeAmbiguous";
}

ProbeOutcome ProbeOutcome::success(RawFindings findings) {
    ProbeOutcome outcome;
    outcome.findings = std::move(findings);
    return outcome;
}

ProbeOutcome ProbeOutcome::failure(ProbeErrorKind kind, std::string message) {
    ProbeOutcome outcome;
    outcome.error = {kind, std::move(message)};
    return outcome;
}

} // namespace guarddog
