#pragma once

#include "GuardDog/Probe.hpp"

#include <memory>
#include <string>
#include <vector>

namespace guarddog {

// Ordered set of probes. Registration order is execution order and report
// order; ids are unique.
class ProbeRegistry {
  public:
    ProbeRegistry() = default;
    ProbeRegistry(const ProbeRegistry &) = delete;
    ProbeRegistry &operator=(const ProbeRegistry &) = delete;
    ProbeRegistry(ProbeRegistry &&) = default;
    ProbeRegistry &operator=(ProbeRegistry &&) = default;

    // Throws std::invalid_argument for a null probe or a duplicate id.
    void add(std::unique_ptr<Probe> probe);

    const std::vector<std::unique_ptr<Probe>> &probes() const { return probes_; }
    std::vector<std::string> ids() const;
    bool contains(const std::string &id) const;
    std::size_t size() const { return probes_.size(); }

    // firewall, rdp, defender, local_admins, screen_lock.
    static ProbeRegistry createDefault(const ProbeEnvironment &environment, const std::string &computerName);

  private:
    std::vector<std::unique_ptr<Probe>> probes_;
};

} // namespace guarddog
