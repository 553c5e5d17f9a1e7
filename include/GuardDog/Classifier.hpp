#pragma once

#include "GuardDog/CheckTypes.hpp"

#include <string>

namespace guarddog {

// Product thresholds for the screen lock check, in seconds.
struct ClassifierPolicy {
    long okTimeoutSeconds{15 * 60};
    long longTimeoutSeconds{30 * 60};
};

// Pure mapping from raw probe findings to a CheckResult. Every input yields
// exactly one status; anything the rules cannot decide is UNKNOWN.
class Classifier {
  public:
    explicit Classifier(ClassifierPolicy policy = {});

    CheckResult classify(const std::string &checkId, const RawFindings &findings) const;

    // Result for a probe that could not produce findings at all.
    CheckResult classifyFailure(const std::string &checkId, const ProbeError &error) const;

    const ClassifierPolicy &policy() const { return policy_; }

    static std::string titleFor(const std::string &checkId);

  private:
    ClassifierPolicy policy_;

    CheckResult classifyFirewall(const FirewallFindings &findings) const;
    CheckResult classifyRdp(const RdpFindings &findings) const;
    CheckResult classifyDefender(const DefenderFindings &findings) const;
    CheckResult classifyLocalAdmins(const LocalAdminsFindings &findings) const;
    CheckResult classifyScreenLock(const ScreenLockFindings &findings) const;
};

} // namespace guarddog
