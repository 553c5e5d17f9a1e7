#include "GuardDog/ProbeRegistry.hpp"

#include "GuardDog/DefenderProbe.hpp"
#include "GuardDog/FirewallProbe.hpp"
#include "GuardDog/LocalAdminsProbe.hpp"
#include "GuardDog/RdpProbe.hpp"
#include "GuardDog/ScreenLockProbe.hpp"

#include <algorithm>
#include <stdexcept>

namespace guarddog {

void ProbeRegistry::add(std::unique_ptr<Probe> probe) {
    if (!probe) {
        throw std::invalid_argument("cannot register a null probe");
    }
    const std::string id = probe->id();
    if (id.empty()) {
        throw std::invalid_argument("probe id must not be empty");
    }
    if (contains(id)) {
        throw std::invalid_argument("probe already registered: " + id);
    }
    probes_.push_back(std::move(probe));
}

std::vector<std::string> ProbeRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(probes_.size());
    for (const auto &probe : probes_) {
        result.push_back(probe->id());
    }
    return result;
}

bool ProbeRegistry::contains(const std::string &id) const {
    return std::any_of(probes_.begin(), probes_.end(),
                       [&](const std::unique_ptr<Probe> &probe) { return probe->id() == id; });
}

ProbeRegistry ProbeRegistry::createDefault(const ProbeEnvironment &environment, const std::string &computerName) {
    ProbeRegistry registry;
#ifdef _WIN32
    registry.add(std::make_unique<FirewallProbe>(environment));
    registry.add(std::make_unique<RdpProbe>(environment));
    registry.add(std::make_unique<DefenderProbe>(environment));
    registry.add(std::make_unique<LocalAdminsProbe>(environment, computerName));
    registry.add(std::make_unique<ScreenLockProbe>(environment));
#else
    (void)environment;
    (void)computerName;
    for (const char *id : {checks::kFirewall, checks::kRdp, checks::kDefender, checks::kLocalAdmins,
                           checks::kScreenLock}) {
        registry.add(std::make_unique<UnsupportedHostProbe>(id));
    }
#endif
    return registry;
}

} // namespace guarddog
