#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace guarddog {

enum class RegistryHive { LocalMachine, CurrentUser };

// Read-only registry access. A value that is absent, of the wrong type or
// unreadable for any reason is reported as std::nullopt.
class RegistryReader {
  public:
    virtual ~RegistryReader() = default;

    virtual std::optional<std::uint32_t> readDword(RegistryHive hive, const std::string &subkey,
                                                   const std::string &value) const = 0;
    virtual std::optional<std::string> readString(RegistryHive hive, const std::string &subkey,
                                                  const std::string &value) const = 0;
};

class WindowsRegistryReader : public RegistryReader {
  public:
    std::optional<std::uint32_t> readDword(RegistryHive hive, const std::string &subkey,
                                           const std::string &value) const override;
    std::optional<std::string> readString(RegistryHive hive, const std::string &subkey,
                                          const std::string &value) const override;
};

} // namespace guarddog
