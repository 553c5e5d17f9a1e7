#pragma once

#include "GuardDog/CheckTypes.hpp"
#include "GuardDog/CommandRunner.hpp"
#include "GuardDog/RegistryReader.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace guarddog {

// One read-only security probe. run() reports problems through the returned
// ProbeOutcome; the pipeline still guards against a probe that throws.
class Probe {
  public:
    virtual ~Probe() = default;

    virtual std::string id() const = 0;
    virtual ProbeOutcome run() const = 0;
};

struct ProbeEnvironment {
    std::shared_ptr<const CommandRunner> runner;
    std::shared_ptr<const RegistryReader> registry;
    std::chrono::milliseconds timeout{std::chrono::seconds(8)};
};

// Stand-in registered on hosts where the Windows facilities do not exist.
class UnsupportedHostProbe : public Probe {
  public:
    explicit UnsupportedHostProbe(std::string checkId) : checkId_(std::move(checkId)) {}

    std::string id() const override { return checkId_; }
    ProbeOutcome run() const override;

  private:
    std::string checkId_;
};

namespace probe_support {

std::string powershellPath();

// Runs a script with -NoProfile -NonInteractive and UTF-8 console output.
CommandResult runPowerShell(const CommandRunner &runner, const std::string &script,
                            std::chrono::milliseconds timeout);

// "Key=Value" lines, trimmed. Repeated keys are all kept, in output order.
std::multimap<std::string, std::string> parseKeyValueLines(const std::string &output);

// "True"/"False" in any case; anything else is nullopt.
std::optional<bool> parseBool(const std::string &value);

std::string describeFailure(const CommandResult &result);

std::string trim(const std::string &value);

} // namespace probe_support

} // namespace guarddog
