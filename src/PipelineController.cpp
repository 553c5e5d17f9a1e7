#include "GuardDog/PipelineController.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace guarddog {

std::string toString(PipelineState state) {
    switch (state) {
    case PipelineState::Idle:
        return "Idle";
    case PipelineState::Verifying:
        return "Verifying";
    case PipelineState::VerificationFailed:
        return "VerificationFailed";
    case PipelineState::Checking:
        return "Checking";
    case PipelineState::Complete:
        return "Complete";
    case PipelineState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

std::string toString(OverallStatus status) {
    switch (status) {
    case OverallStatus::Ok:
        return "OK";
    case OverallStatus::Unknown:
        return "UNKNOWN";
    case OverallStatus::Warn:
        return "WARN";
    case OverallStatus::High:
        return "HIGH";
    case OverallStatus::VerificationFailed:
        return "VERIFICATION_FAILED";
    }
    return "UNKNOWN";
}

std::string toString(PipelineOutcome outcome) {
    switch (outcome) {
    case PipelineOutcome::Passed:
        return "passed";
    case PipelineOutcome::Degraded:
        return "degraded";
    case PipelineOutcome::Failed:
        return "failed";
    }
    return "failed";
}

PipelineOutcome RunSummary::outcome() const {
    if (!verdict.passed()) {
        return PipelineOutcome::Failed;
    }
    for (const auto &check : checks) {
        if (check.status == CheckStatus::Unknown) {
            return PipelineOutcome::Degraded;
        }
    }
    return PipelineOutcome::Passed;
}

OverallStatus overallStatusFor(const std::vector<CheckResult> &checks) {
    if (checks.empty()) {
        return OverallStatus::Unknown;
    }
    CheckStatus worst = CheckStatus::Ok;
    for (const auto &check : checks) {
        if (severityRank(check.status) > severityRank(worst)) {
            worst = check.status;
        }
    }
    switch (worst) {
    case CheckStatus::High:
        return OverallStatus::High;
    case CheckStatus::Warn:
        return OverallStatus::Warn;
    case CheckStatus::Unknown:
        return OverallStatus::Unknown;
    case CheckStatus::Ok:
        return OverallStatus::Ok;
    }
    return OverallStatus::Unknown;
}

std::string toIso8601(std::time_t value) {
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &value);
#else
    gmtime_r(&value, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string hostIdentifier() {
#ifdef _WIN32
    char buffer[MAX_COMPUTERNAME_LENGTH + 1] = {};
    DWORD size = sizeof(buffer);
    if (GetComputerNameA(buffer, &size)) {
        return std::string(buffer, size);
    }
    const char *fromEnv = std::getenv("COMPUTERNAME");
    return fromEnv != nullptr ? fromEnv : "";
#else
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0) {
        return buffer;
    }
    return "";
#endif
}

PipelineController::PipelineController(VerificationStep verify, const ProbeRegistry &registry, Classifier classifier,
                                       std::string hostId)
    : verify_(std::move(verify)), registry_(registry), classifier_(std::move(classifier)), hostId_(std::move(hostId)) {
    if (!verify_) {
        throw std::invalid_argument("pipeline requires a verification step");
    }
}

bool PipelineController::isAllowed(PipelineState from, PipelineState to) {
    switch (from) {
    case PipelineState::Idle:
        return to == PipelineState::Verifying || to == PipelineState::Cancelled;
    case PipelineState::Verifying:
        return to == PipelineState::VerificationFailed || to == PipelineState::Checking ||
               to == PipelineState::Cancelled;
    case PipelineState::Checking:
        return to == PipelineState::Complete || to == PipelineState::Cancelled;
    case PipelineState::VerificationFailed:
    case PipelineState::Complete:
    case PipelineState::Cancelled:
        return false;
    }
    return false;
}

void PipelineController::transition(PipelineState next) {
    if (!isAllowed(state_, next)) {
        throw std::logic_error("invalid pipeline transition " + toString(state_) + " -> " + toString(next));
    }
    state_ = next;
}

bool PipelineController::cancellationRequested() const {
    return cancelled_ && cancelled_();
}

void PipelineController::recordDiagnostic(const std::string &message) {
    diagnostics_.push_back(message);
}

std::vector<std::string> PipelineController::consumeDiagnostics() {
    std::vector<std::string> drained;
    drained.swap(diagnostics_);
    return drained;
}

CheckResult PipelineController::runProbe(const Probe &probe) {
    const std::string id = probe.id();
    ProbeOutcome outcome;
    try {
        outcome = probe.run();
    } catch (const std::exception &ex) {
        recordDiagnostic("Probe " + id + " raised an error: " + ex.what());
        return classifier_.classifyFailure(id, ProbeError{ProbeErrorKind::Unavailable, ex.what()});
    } catch (...) {
        recordDiagnostic("Probe " + id + " raised an unknown error.");
        return classifier_.classifyFailure(id, ProbeError{ProbeErrorKind::Unavailable, "unknown error"});
    }

    if (!outcome.ok()) {
        recordDiagnostic("Probe " + id + " unavailable: " + outcome.error.message);
        return classifier_.classifyFailure(id, outcome.error);
    }
    std::visit(
        [&](const auto &findings) {
            for (const auto &note : findings.diagnostics) {
                recordDiagnostic(id + ": " + note);
            }
        },
        *outcome.findings);
    return classifier_.classify(id, *outcome.findings);
}

PipelineState PipelineController::run() {
    if (state_ != PipelineState::Idle) {
        throw std::logic_error("pipeline has already run (state " + toString(state_) + ")");
    }
    if (cancellationRequested()) {
        transition(PipelineState::Cancelled);
        return state_;
    }

    transition(PipelineState::Verifying);
    RunSummary summary;
    summary.startedAt = std::time(nullptr);
    summary.timestamp = toIso8601(summary.startedAt);
    summary.hostId = hostId_;
    summary.verdict = verify_();

    if (cancellationRequested()) {
        transition(PipelineState::Cancelled);
        return state_;
    }
    if (!summary.verdict.passed()) {
        summary.overallStatus = OverallStatus::VerificationFailed;
        recordDiagnostic("Integrity verification failed (" + toString(summary.verdict.reason) +
                         "): " + summary.verdict.detail);
        summary.diagnostics = diagnostics_;
        summary_ = std::move(summary);
        transition(PipelineState::VerificationFailed);
        return state_;
    }

    transition(PipelineState::Checking);
    for (const auto &probe : registry_.probes()) {
        if (cancellationRequested()) {
            transition(PipelineState::Cancelled);
            return state_;
        }
        summary.checks.push_back(runProbe(*probe));
    }
    if (cancellationRequested()) {
        transition(PipelineState::Cancelled);
        return state_;
    }

    summary.overallStatus = overallStatusFor(summary.checks);
    summary.diagnostics = diagnostics_;
    summary_ = std::move(summary);
    transition(PipelineState::Complete);
    return state_;
}

bool PipelineController::hasSummary() const {
    return state_ == PipelineState::Complete || state_ == PipelineState::VerificationFailed;
}

const RunSummary &PipelineController::summary() const {
    if (!hasSummary()) {
        throw std::logic_error("no run summary in state " + toString(state_));
    }
    return summary_;
}

} // namespace guarddog
