#include "GuardDog/Classifier.hpp"

#include "TestSupport.hpp"

#include <string>

using namespace guarddog;

namespace {

FirewallFindings firewall(ProfileState domain, ProfileState privateProfile, ProfileState publicProfile) {
    FirewallFindings findings;
    findings.source = "netsh";
    findings.profiles = {{"domain", domain, ""}, {"private", privateProfile, ""}, {"public", publicProfile, ""}};
    return findings;
}

RdpFindings rdp(std::optional<bool> enabled, std::optional<bool> nla) {
    RdpFindings findings;
    findings.rdpEnabled = enabled;
    findings.nlaRequired = nla;
    findings.source = "registry";
    return findings;
}

ScreenLockFindings screenLock(std::optional<bool> active, std::optional<bool> secure, std::optional<long> timeout) {
    ScreenLockFindings findings;
    findings.active = active;
    findings.secure = secure;
    findings.timeoutSeconds = timeout;
    findings.source = "registry";
    return findings;
}

std::string status(const CheckResult &result) {
    return toString(result.status);
}

bool hasDetail(const CheckResult &result, const std::string &label, const std::string &fragment) {
    for (const auto &detail : result.details) {
        if (detail.label == label && detail.value.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

void test_firewall() {
    std::cout << "\n[Firewall]\n";
    Classifier classifier;
    const auto on = ProfileState::On;
    const auto off = ProfileState::Off;
    const auto unknown = ProfileState::Unknown;

    ASSERT_EQ("all profiles on", std::string("OK"), status(classifier.classify(checks::kFirewall, firewall(on, on, on))));
    const auto publicOff = classifier.classify(checks::kFirewall, firewall(on, on, off));
    ASSERT_EQ("public profile off", std::string("HIGH"), status(publicOff));
    ASSERT_TRUE("off profile shown in details", hasDetail(publicOff, "Public profile", "OFF"));
    ASSERT_TRUE("remediation offered", !publicOff.remediation.empty());
    ASSERT_EQ("off wins over unknown", std::string("HIGH"),
              status(classifier.classify(checks::kFirewall, firewall(off, unknown, on))));
    ASSERT_EQ("one profile unparseable", std::string("UNKNOWN"),
              status(classifier.classify(checks::kFirewall, firewall(on, unknown, on))));

    auto partial = firewall(on, on, on);
    partial.profiles.pop_back();
    const auto missing = classifier.classify(checks::kFirewall, partial);
    ASSERT_EQ("profile not reported", std::string("UNKNOWN"), status(missing));
    ASSERT_TRUE("missing profile flagged", hasDetail(missing, "Public profile", "not reported"));
    ASSERT_EQ("no profiles at all", std::string("UNKNOWN"),
              status(classifier.classify(checks::kFirewall, FirewallFindings{})));
}

void test_rdp() {
    std::cout << "\n[Rdp]\n";
    Classifier classifier;
    ASSERT_EQ("enabled without NLA", std::string("HIGH"), status(classifier.classify(checks::kRdp, rdp(true, false))));
    ASSERT_EQ("enabled with NLA", std::string("OK"), status(classifier.classify(checks::kRdp, rdp(true, true))));
    ASSERT_EQ("disabled, NLA off", std::string("OK"), status(classifier.classify(checks::kRdp, rdp(false, false))));
    ASSERT_EQ("disabled, NLA unknown", std::string("OK"),
              status(classifier.classify(checks::kRdp, rdp(false, std::nullopt))));
    ASSERT_EQ("enabled, NLA unknown", std::string("UNKNOWN"),
              status(classifier.classify(checks::kRdp, rdp(true, std::nullopt))));
    ASSERT_EQ("state unknown", std::string("UNKNOWN"),
              status(classifier.classify(checks::kRdp, rdp(std::nullopt, true))));
}

void test_defender() {
    std::cout << "\n[Defender]\n";
    Classifier classifier;
    DefenderFindings findings;
    findings.source = "registry";
    ASSERT_EQ("nothing known", std::string("UNKNOWN"), status(classifier.classify(checks::kDefender, findings)));

    findings.disabledLocal = false;
    ASSERT_EQ("not disabled locally", std::string("OK"), status(classifier.classify(checks::kDefender, findings)));

    findings.disabledPolicy = true;
    ASSERT_EQ("disabled by policy", std::string("HIGH"), status(classifier.classify(checks::kDefender, findings)));

    DefenderFindings local;
    local.disabledLocal = true;
    local.disabledPolicy = false;
    ASSERT_EQ("disabled locally", std::string("HIGH"), status(classifier.classify(checks::kDefender, local)));

    DefenderFindings policyOnly;
    policyOnly.disabledPolicy = false;
    ASSERT_EQ("policy hint only", std::string("OK"), status(classifier.classify(checks::kDefender, policyOnly)));
}

void test_local_admins() {
    std::cout << "\n[LocalAdmins]\n";
    Classifier classifier;
    LocalAdminsFindings findings;
    findings.computerName = "DESKTOP-01";
    findings.source = "powershell";
    findings.members = {"DESKTOP-01\\Administrator", "CORP\\Domain Admins"};
    ASSERT_EQ("built-in and domain only", std::string("OK"),
              status(classifier.classify(checks::kLocalAdmins, findings)));

    findings.members.push_back("desktop-01\\alice");
    const auto extra = classifier.classify(checks::kLocalAdmins, findings);
    ASSERT_EQ("extra local account", std::string("WARN"), status(extra));
    ASSERT_TRUE("local account labelled", hasDetail(extra, "Administrator", "alice (local user account)"));

    LocalAdminsFindings empty;
    empty.computerName = "DESKTOP-01";
    ASSERT_EQ("membership unreadable", std::string("UNKNOWN"),
              status(classifier.classify(checks::kLocalAdmins, empty)));

    LocalAdminsFindings anonymous;
    anonymous.members = {"X\\alice"};
    ASSERT_EQ("computer name unknown", std::string("UNKNOWN"),
              status(classifier.classify(checks::kLocalAdmins, anonymous)));
}

void test_screen_lock() {
    std::cout << "\n[ScreenLock]\n";
    Classifier classifier;
    ASSERT_EQ("secure lock within threshold", std::string("OK"),
              status(classifier.classify(checks::kScreenLock, screenLock(true, true, 600L))));
    ASSERT_EQ("exactly fifteen minutes", std::string("OK"),
              status(classifier.classify(checks::kScreenLock, screenLock(true, true, 900L))));
    ASSERT_EQ("between thresholds", std::string("WARN"),
              status(classifier.classify(checks::kScreenLock, screenLock(true, true, 1200L))));
    ASSERT_EQ("long timeout", std::string("WARN"),
              status(classifier.classify(checks::kScreenLock, screenLock(true, true, 3600L))));
    ASSERT_EQ("no password on resume", std::string("WARN"),
              status(classifier.classify(checks::kScreenLock, screenLock(true, false, 300L))));
    ASSERT_EQ("timeout unknown", std::string("WARN"),
              status(classifier.classify(checks::kScreenLock, screenLock(true, true, std::nullopt))));
    ASSERT_EQ("lock disabled", std::string("HIGH"),
              status(classifier.classify(checks::kScreenLock, screenLock(false, true, 300L))));
    ASSERT_EQ("lock state unreadable", std::string("UNKNOWN"),
              status(classifier.classify(checks::kScreenLock, screenLock(std::nullopt, true, 300L))));

    ClassifierPolicy strict;
    strict.okTimeoutSeconds = 300;
    ASSERT_EQ("policy threshold honoured", std::string("WARN"),
              status(Classifier(strict).classify(checks::kScreenLock, screenLock(true, true, 600L))));
}

void test_failures_and_mismatches() {
    std::cout << "\n[FailuresAndMismatches]\n";
    Classifier classifier;
    const auto failure =
        classifier.classifyFailure(checks::kDefender, ProbeError{ProbeErrorKind::Unavailable, "command timed out"});
    ASSERT_EQ("probe failure is UNKNOWN", std::string("UNKNOWN"), status(failure));
    ASSERT_EQ("failure keeps the id", std::string("defender"), failure.id);
    ASSERT_EQ("failure keeps the title", std::string("Microsoft Defender"), failure.title);
    ASSERT_TRUE("failure reason shown", hasDetail(failure, "Reason", "ProbeUnavailable"));
    ASSERT_TRUE("error message shown", hasDetail(failure, "Error", "timed out"));
    ASSERT_TRUE("manual check suggested", !failure.remediation.empty());

    const auto mismatched = classifier.classify(checks::kFirewall, rdp(false, false));
    ASSERT_EQ("findings of another check are UNKNOWN", std::string("UNKNOWN"), status(mismatched));
    ASSERT_EQ("mismatch keeps the requested id", std::string("firewall"), mismatched.id);
    ASSERT_EQ("unregistered id is UNKNOWN", std::string("UNKNOWN"),
              status(classifier.classify("bitlocker", firewall(ProfileState::On, ProfileState::On,
                                                                ProfileState::On))));
}

void test_classification_is_pure() {
    std::cout << "\n[Purity]\n";
    Classifier classifier;
    const auto findings = firewall(ProfileState::On, ProfileState::Off, ProfileState::On);
    const auto first = classifier.classify(checks::kFirewall, findings);
    const auto second = classifier.classify(checks::kFirewall, findings);
    ASSERT_EQ("same status", status(first), status(second));
    ASSERT_EQ("same summary", first.summary, second.summary);
    ASSERT_EQ("same detail count", first.details.size(), second.details.size());
}

int main() {
    std::cout << "=== Classifier Tests ===\n";

    test_firewall();
    test_rdp();
    test_defender();
    test_local_admins();
    test_screen_lock();
    test_failures_and_mismatches();
    test_classification_is_pure();

    return finishTests();
}
