#pragma once

#include "GuardDog/Probe.hpp"

#include <vector>

namespace guarddog {

// Windows Defender Firewall state per network profile. Uses
// "netsh advfirewall show allprofiles" first and falls back to the
// EnableFirewall registry values when netsh fails or prints nothing usable.
class FirewallProbe : public Probe {
  public:
    explicit FirewallProbe(ProbeEnvironment environment);

    std::string id() const override { return checks::kFirewall; }
    ProbeOutcome run() const override;

    // English netsh output only; other locales yield no profiles.
    static std::vector<FirewallProfileFinding> parseNetshOutput(const std::string &output);

  private:
    ProbeEnvironment environment_;

    std::vector<FirewallProfileFinding> readRegistry() const;
};

} // namespace guarddog
