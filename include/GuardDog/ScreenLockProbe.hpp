#pragma once

#include "GuardDog/Probe.hpp"

namespace guarddog {

// Screen saver lock settings of the current user. Group policy values under
// HKCU\Software\Policies take precedence over Control Panel\Desktop.
class ScreenLockProbe : public Probe {
  public:
    explicit ScreenLockProbe(ProbeEnvironment environment);

    std::string id() const override { return checks::kScreenLock; }
    ProbeOutcome run() const override;

  private:
    ProbeEnvironment environment_;
};

} // namespace guarddog
