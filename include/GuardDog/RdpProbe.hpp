#pragma once

#include "GuardDog/Probe.hpp"

namespace guarddog {

// Remote Desktop: fDenyTSConnections (0 = connections allowed) and
// RDP-Tcp UserAuthentication (1 = NLA required).
class RdpProbe : public Probe {
  public:
    explicit RdpProbe(ProbeEnvironment environment);

    std::string id() const override { return checks::kRdp; }
    ProbeOutcome run() const override;

  private:
    ProbeEnvironment environment_;
};

} // namespace guarddog
