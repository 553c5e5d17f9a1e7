#include "GuardDog/FirewallProbe.hpp"
#include "GuardDog/Manifest.hpp"
#include "GuardDog/PipelineController.hpp"

#include "FakeHost.hpp"
#include "TestSupport.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace guarddog;
using testsupport::FakeHost;

namespace {

// Probe returning canned findings and counting its invocations.
class CannedProbe : public Probe {
  public:
    CannedProbe(std::string id, ProbeOutcome outcome, int *runs = nullptr)
        : id_(std::move(id)), outcome_(std::move(outcome)), runs_(runs) {}

    std::string id() const override { return id_; }
    ProbeOutcome run() const override {
        if (runs_) {
            ++*runs_;
        }
        return outcome_;
    }

  private:
    std::string id_;
    ProbeOutcome outcome_;
    int *runs_;
};

class ThrowingProbe : public Probe {
  public:
    std::string id() const override { return checks::kDefender; }
    ProbeOutcome run() const override { throw std::runtime_error("WMI provider crashed"); }
};

class NonStandardThrowProbe : public Probe {
  public:
    std::string id() const override { return checks::kScreenLock; }
    ProbeOutcome run() const override { throw 42; }
};

ProbeOutcome rdpFindings(bool enabled, bool nla) {
    RdpFindings findings;
    findings.rdpEnabled = enabled;
    findings.nlaRequired = nla;
    findings.source = "registry";
    return ProbeOutcome::success(findings);
}

ProbeOutcome firewallFindings(ProfileState publicState) {
    FirewallFindings findings;
    findings.source = "netsh";
    findings.profiles = {{"domain", ProfileState::On, "ON"},
                         {"private", ProfileState::On, "ON"},
                         {"public", publicState, publicState == ProfileState::On ? "ON" : "OFF"}};
    return ProbeOutcome::success(findings);
}

VerificationStep passingGate() {
    return []() { return VerificationVerdict::pass(); };
}

} // namespace

void test_gate_failure_runs_no_probes() {
    std::cout << "\n[GateFailure]\n";
    int runs = 0;
    ProbeRegistry registry;
    registry.add(std::make_unique<CannedProbe>(checks::kFirewall, firewallFindings(ProfileState::On), &runs));
    registry.add(std::make_unique<CannedProbe>(checks::kRdp, rdpFindings(false, false), &runs));

    PipelineController pipeline(
        []() {
            return VerificationVerdict::fail(VerificationFailure::HashMismatch, "a.txt altered", "a.txt");
        },
        registry, Classifier{}, "TEST-HOST");
    const auto state = pipeline.run();
    ASSERT_EQ("state", std::string("VerificationFailed"), toString(state));
    ASSERT_EQ("no probe executed", 0, runs);
    ASSERT_TRUE("summary available", pipeline.hasSummary());
    const auto &summary = pipeline.summary();
    ASSERT_EQ("no check results", static_cast<std::size_t>(0), summary.checks.size());
    ASSERT_EQ("overall reflects the gate", std::string("VERIFICATION_FAILED"), toString(summary.overallStatus));
    ASSERT_EQ("outcome", std::string("failed"), toString(summary.outcome()));
    ASSERT_EQ("verdict path kept", std::string("a.txt"), summary.verdict.path);
    ASSERT_EQ("host recorded", std::string("TEST-HOST"), summary.hostId);
}

void test_checks_run_in_order() {
    std::cout << "\n[ChecksInOrder]\n";
    ProbeRegistry registry;
    registry.add(std::make_unique<CannedProbe>(checks::kFirewall, firewallFindings(ProfileState::Off)));
    registry.add(std::make_unique<CannedProbe>(checks::kRdp, rdpFindings(true, true)));

    PipelineController pipeline(passingGate(), registry);
    ASSERT_EQ("starts idle", std::string("Idle"), toString(pipeline.state()));
    ASSERT_EQ("completes", std::string("Complete"), toString(pipeline.run()));
    const auto &summary = pipeline.summary();
    ASSERT_EQ("one result per probe", static_cast<std::size_t>(2), summary.checks.size());
    ASSERT_EQ("registry order kept", std::string("firewall"), summary.checks[0].id);
    ASSERT_EQ("firewall with public off", std::string("HIGH"), toString(summary.checks[0].status));
    ASSERT_EQ("rdp with NLA", std::string("OK"), toString(summary.checks[1].status));
    ASSERT_EQ("worst status wins", std::string("HIGH"), toString(summary.overallStatus));
    ASSERT_EQ("no unknowns means passed", std::string("passed"), toString(summary.outcome()));
    ASSERT_TRUE("timestamp set", summary.timestamp.size() == 20 && summary.timestamp.back() == 'Z');
}

void test_probe_errors_degrade() {
    std::cout << "\n[ProbeErrorsDegrade]\n";
    int laterRuns = 0;
    ProbeRegistry registry;
    registry.add(std::make_unique<CannedProbe>(checks::kRdp, rdpFindings(false, true)));
    registry.add(std::make_unique<ThrowingProbe>());
    registry.add(std::make_unique<CannedProbe>(
        checks::kLocalAdmins, ProbeOutcome::failure(ProbeErrorKind::Ambiguous, "group name not unique")));
    registry.add(std::make_unique<CannedProbe>(checks::kFirewall, firewallFindings(ProfileState::On), &laterRuns));

    PipelineController pipeline(passingGate(), registry);
    pipeline.run();
    const auto &summary = pipeline.summary();
    ASSERT_EQ("every probe has a result", static_cast<std::size_t>(4), summary.checks.size());
    ASSERT_EQ("throwing probe is UNKNOWN", std::string("UNKNOWN"), toString(summary.checks[1].status));
    ASSERT_EQ("throwing probe keeps its id", std::string("defender"), summary.checks[1].id);
    ASSERT_EQ("probe error is UNKNOWN", std::string("UNKNOWN"), toString(summary.checks[2].status));
    ASSERT_EQ("later probe still ran", 1, laterRuns);
    ASSERT_EQ("overall UNKNOWN", std::string("UNKNOWN"), toString(summary.overallStatus));
    ASSERT_EQ("outcome degraded", std::string("degraded"), toString(summary.outcome()));

    bool diagnosed = false;
    for (const auto &note : summary.diagnostics) {
        diagnosed = diagnosed || note.find("WMI provider crashed") != std::string::npos;
    }
    ASSERT_TRUE("exception recorded as diagnostic", diagnosed);
}

void test_non_standard_exception_is_unknown() {
    std::cout << "\n[NonStandardException]\n";
    int laterRuns = 0;
    ProbeRegistry registry;
    registry.add(std::make_unique<NonStandardThrowProbe>());
    registry.add(std::make_unique<CannedProbe>(checks::kRdp, rdpFindings(false, true), &laterRuns));

    PipelineController pipeline(passingGate(), registry);
    ASSERT_EQ("run completes", std::string("Complete"), toString(pipeline.run()));
    const auto &summary = pipeline.summary();
    ASSERT_EQ("both checks reported", static_cast<std::size_t>(2), summary.checks.size());
    ASSERT_EQ("non-standard throw is UNKNOWN", std::string("UNKNOWN"), toString(summary.checks[0].status));
    ASSERT_EQ("result keeps its id", std::string("screen_lock"), summary.checks[0].id);
    ASSERT_EQ("next check still ran", 1, laterRuns);
    ASSERT_EQ("outcome degraded", std::string("degraded"), toString(summary.outcome()));
}

void test_probe_timeout_is_unknown() {
    std::cout << "\n[ProbeTimeout]\n";
    FakeHost host;
    host.runner->timeOut("netsh.exe");
    ProbeRegistry registry;
    registry.add(std::make_unique<FirewallProbe>(host.environment()));
    registry.add(std::make_unique<CannedProbe>(checks::kRdp, rdpFindings(false, false)));

    PipelineController pipeline(passingGate(), registry);
    pipeline.run();
    const auto &summary = pipeline.summary();
    ASSERT_EQ("timed out probe is UNKNOWN", std::string("UNKNOWN"), toString(summary.checks[0].status));
    ASSERT_EQ("next probe unaffected", std::string("OK"), toString(summary.checks[1].status));
}

void test_state_machine_guards() {
    std::cout << "\n[StateMachineGuards]\n";
    ProbeRegistry registry;
    PipelineController pipeline(passingGate(), registry);

    bool summaryRejected = false;
    try {
        pipeline.summary();
    } catch (const std::logic_error &) {
        summaryRejected = true;
    }
    ASSERT_TRUE("no summary before running", summaryRejected);

    pipeline.run();
    ASSERT_EQ("empty registry completes", std::string("Complete"), toString(pipeline.state()));
    ASSERT_EQ("no checks is UNKNOWN overall", std::string("UNKNOWN"), toString(pipeline.summary().overallStatus));

    bool rerunRejected = false;
    try {
        pipeline.run();
    } catch (const std::logic_error &) {
        rerunRejected = true;
    }
    ASSERT_TRUE("second run rejected", rerunRejected);
}

void test_cancellation() {
    std::cout << "\n[Cancellation]\n";
    int runs = 0;
    ProbeRegistry registry;
    registry.add(std::make_unique<CannedProbe>(checks::kFirewall, firewallFindings(ProfileState::On), &runs));
    registry.add(std::make_unique<CannedProbe>(checks::kRdp, rdpFindings(false, false), &runs));

    PipelineController pipeline(passingGate(), registry);
    pipeline.setCancellationCheck([&runs]() { return runs >= 1; });
    ASSERT_EQ("cancelled mid-run", std::string("Cancelled"), toString(pipeline.run()));
    ASSERT_EQ("remaining probes skipped", 1, runs);
    ASSERT_TRUE("no summary when cancelled", !pipeline.hasSummary());

    bool rejected = false;
    try {
        pipeline.summary();
    } catch (const std::logic_error &) {
        rejected = true;
    }
    ASSERT_TRUE("summary access rejected", rejected);

    int gateRuns = 0;
    PipelineController early(
        [&gateRuns]() {
            ++gateRuns;
            return VerificationVerdict::pass();
        },
        registry);
    early.setCancellationCheck([]() { return true; });
    ASSERT_EQ("cancelled before start", std::string("Cancelled"), toString(early.run()));
    ASSERT_EQ("gate not evaluated", 0, gateRuns);
}

void test_end_to_end_idempotence() {
    std::cout << "\n[EndToEndIdempotence]\n";
    testsupport::TempDir dir;
    testsupport::SigningKey key;
    const auto root = dir.path() / "root";
    testsupport::writeFile(root / "GuardDog.exe", "launcher");
    testsupport::writeFile(root / "lib/core.dll", "core");
    const std::string manifestText = serializeManifest(createManifest(root));
    testsupport::writeFile(dir.path() / "m", manifestText);
    testsupport::writeFile(dir.path() / "m.minisig", key.signFile(manifestText));

    const ManifestVerifier verifier{SignatureVerifier(key.publicKey())};
    const VerificationStep gate = [&]() { return verifier.verify(root, dir.path() / "m", dir.path() / "m.minisig"); };

    ProbeRegistry registry;
    registry.add(std::make_unique<CannedProbe>(checks::kFirewall, firewallFindings(ProfileState::Off)));
    registry.add(std::make_unique<CannedProbe>(checks::kRdp, rdpFindings(true, false)));

    PipelineController first(gate, registry);
    PipelineController second(gate, registry);
    first.run();
    second.run();
    ASSERT_EQ("first run completes", std::string("Complete"), toString(first.state()));
    ASSERT_TRUE("same verdict", first.summary().verdict.passed() == second.summary().verdict.passed());
    bool sameStatuses = first.summary().checks.size() == second.summary().checks.size();
    for (std::size_t i = 0; sameStatuses && i < first.summary().checks.size(); ++i) {
        sameStatuses = first.summary().checks[i].status == second.summary().checks[i].status;
    }
    ASSERT_TRUE("same per-check statuses", sameStatuses);

    testsupport::writeFile(root / "lib/core.dll", "patched");
    PipelineController tampered(gate, registry);
    tampered.run();
    ASSERT_EQ("tampered root fails the gate", std::string("VerificationFailed"), toString(tampered.state()));
    ASSERT_EQ("altered file named", std::string("lib/core.dll"), tampered.summary().verdict.path);
    ASSERT_EQ("no checks after tampering", static_cast<std::size_t>(0), tampered.summary().checks.size());
}

int main() {
    std::cout << "=== Pipeline Tests ===\n";

    test_gate_failure_runs_no_probes();
    test_checks_run_in_order();
    test_probe_errors_degrade();
    test_non_standard_exception_is_unknown();
    test_probe_timeout_is_unknown();
    test_state_machine_guards();
    test_cancellation();
    test_end_to_end_idempotence();

    return finishTests();
}
