#pragma once

#include "GuardDog/Probe.hpp"

namespace guarddog {

class DefenderProbe : public Probe {
  public:
    explicit DefenderProbe(ProbeEnvironment environment);

    std::string id() const override { return checks::kDefender; }
    ProbeOutcome run() const override;

    static std::optional<DefenderFindings> parseComputerStatus(const std::string &output);

  private:
    ProbeEnvironment environment_;

    DefenderFindings readRegistry() const;
};

} // namespace guarddog
