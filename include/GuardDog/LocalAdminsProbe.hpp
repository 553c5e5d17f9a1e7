#pragma once

#include "GuardDog/Probe.hpp"

#include <string>
#include <vector>

namespace guarddog {

// Members of the local Administrators group, via Get-LocalGroupMember and,
// when the LocalAccounts module is missing, the ADSI WinNT provider.
class LocalAdminsProbe : public Probe {
  public:
    LocalAdminsProbe(ProbeEnvironment environment, std::string computerName);

    std::string id() const override { return checks::kLocalAdmins; }
    ProbeOutcome run() const override;

    static std::vector<std::string> parseMembers(const std::string &output);
    static std::vector<std::string> parseAdsPaths(const std::string &output);
    static std::string accountFromAdsPath(const std::string &adsPath);

  private:
    ProbeEnvironment environment_;
    std::string computerName_;
};

} // namespace guarddog
