#pragma once

#include "GuardDog/CheckTypes.hpp"
#include "GuardDog/Classifier.hpp"
#include "GuardDog/ManifestVerifier.hpp"
#include "GuardDog/ProbeRegistry.hpp"

#include <ctime>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace guarddog {

enum class PipelineState { Idle, Verifying, VerificationFailed, Checking, Complete, Cancelled };

std::string toString(PipelineState state);

enum class OverallStatus { Ok, Unknown, Warn, High, VerificationFailed };

std::string toString(OverallStatus status);

// How the reporting layer should present a finished run.
enum class PipelineOutcome { Passed, Degraded, Failed };

std::string toString(PipelineOutcome outcome);

struct RunSummary {
    VerificationVerdict verdict;
    std::vector<CheckResult> checks; // registry order; empty when the gate failed
    OverallStatus overallStatus{OverallStatus::Unknown};
    std::time_t startedAt{0};
    std::string timestamp; // ISO 8601, UTC
    std::string hostId;
    std::vector<std::string> diagnostics;

    PipelineOutcome outcome() const;
};

// Worst status wins: HIGH > WARN > UNKNOWN > OK. No checks is UNKNOWN.
OverallStatus overallStatusFor(const std::vector<CheckResult> &checks);

std::string toIso8601(std::time_t value);

// Computer name of this host, "" when it cannot be determined.
std::string hostIdentifier();

using VerificationStep = std::function<VerificationVerdict()>;
using CancellationCheck = std::function<bool()>;

// Runs the verification gate once and, only when it passes, every probe of
// the registry in order. Idle -> Verifying -> VerificationFailed, or
// Verifying -> Checking -> Complete. A cancellation request observed before
// a terminal state moves the controller to Cancelled and no summary exists.
// A controller runs once.
class PipelineController {
  public:
    PipelineController(VerificationStep verify, const ProbeRegistry &registry, Classifier classifier = Classifier{},
                        std::string hostId = hostIdentifier());

    void setCancellationCheck(CancellationCheck check) { cancelled_ = std::move(check); }

    // Throws std::logic_error when called outside Idle.
    PipelineState run();

    PipelineState state() const { return state_; }
    bool hasSummary() const;

    // Throws std::logic_error unless the state is Complete or VerificationFailed.
    const RunSummary &summary() const;

    std::vector<std::string> consumeDiagnostics();

  private:
    VerificationStep verify_;
    const ProbeRegistry &registry_;
    Classifier classifier_;
    std::string hostId_;
    CancellationCheck cancelled_;
    PipelineState state_{PipelineState::Idle};
    RunSummary summary_;
    std::vector<std::string> diagnostics_;

    void transition(PipelineState next);
    bool cancellationRequested() const;
    CheckResult runProbe(const Probe &probe);
    void recordDiagnostic(const std::string &message);
    static bool isAllowed(PipelineState from, PipelineState to);
};

} // namespace guarddog
